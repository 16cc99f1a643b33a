/**
 * @file server/AcceptActor.h
 * @brief Listening actor handing accepted connections to the ServerActor pool.
 *
 * @details
 * Listens on the configured `qb::io::uri` and distributes each accepted
 * socket round-robin over the ServerActors through a `NewSessionEvent`.
 * If the listening socket goes away, the whole engine is asked to stop.
 */

#pragma once

#include <qb/actor.h>
#include <qb/io/async.h>
#include <qb/io/uri.h>

class AcceptActor : public qb::Actor,
                    public qb::io::use<AcceptActor>::tcp::acceptor {
private:
    const qb::io::uri _listen_at;
    const qb::ActorIdList _server_pool;
    std::size_t _accepted{0};

public:
    /**
     * @brief Constructs the listener
     * @param listen_at Address to bind, e.g. `tcp://0.0.0.0:8080`
     * @param pool ServerActors receiving the accepted sockets
     */
    AcceptActor(qb::io::uri listen_at, qb::ActorIdList pool);

    /// @return false if the pool is empty or the address cannot be bound
    bool onInit() override;

    /// Hands @p new_io to the next ServerActor of the pool
    void on(accepted_socket_type&& new_io);
    /// Listening socket lost: stops every actor
    void on(qb::io::async::event::disconnected const&);
};

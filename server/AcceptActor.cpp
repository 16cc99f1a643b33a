/**
 * @file server/AcceptActor.cpp
 */

#include "AcceptActor.h"
#include "../shared/Events.h"
#include <iostream>

AcceptActor::AcceptActor(qb::io::uri listen_at, qb::ActorIdList pool)
    : _listen_at(std::move(listen_at))
    , _server_pool(std::move(pool)) {}

/**
 * @brief Binds the listening socket and starts accepting
 *
 * A false return stops the engine with an error, `main` then exits with a
 * non-zero status.
 */
bool AcceptActor::onInit() {
    if (_server_pool.empty()) {
        qb::io::cerr() << "Cannot init AcceptActor with empty server pool" << std::endl;
        return false;
    }

    if (transport().listen(_listen_at)) {
        qb::io::cerr() << "Cannot listen on " << _listen_at.source() << std::endl;
        return false;
    }

    qb::io::cout() << "Starting duplex chat server on " << _listen_at.source() << std::endl;
    start();
    return true;
}

void AcceptActor::on(accepted_socket_type&& new_io) {
    auto server_id = _server_pool[_accepted++ % _server_pool.size()];
    auto& evt = push<NewSessionEvent>(server_id);
    evt.socket = std::move(new_io);
}

void AcceptActor::on(qb::io::async::event::disconnected const&) {
    qb::io::cerr() << "Listener on " << _listen_at.source() << " closed, stopping server" << std::endl;
    broadcast<qb::KillEvent>();
}

/**
 * @file server/ServerActor.h
 * @brief Actor running a set of duplex sessions on one core.
 *
 * @details
 * `ServerActor` combines `qb::Actor` with QB-IO's `io_handler<ChatSession>`:
 * - `on(NewSessionEvent&)` turns an accepted socket into a `ChatSession`,
 *   which registers itself in the shared `ConnectionRegistry`,
 * - `on(MailboxReadyEvent&)` runs the OutboundPump of every session it owns,
 *   after another actor queued messages into their mailboxes,
 * - `startSession()` is the hook sessions use to join the registry with this
 *   actor as the owner of their pumps.
 *
 * Several ServerActors share the same registry, each owning its sessions.
 */

#pragma once

#include <qb/actor.h>
#include <qb/io/async.h>
#include <memory>
#include "../shared/ConnectionRegistry.h"
#include "../shared/Events.h"
#include "ChatSession.h"

class ServerActor : public qb::Actor,
                    public qb::io::use<ServerActor>::tcp::io_handler<ChatSession> {
private:
    const std::shared_ptr<duplex::ConnectionRegistry> _registry;

public:
    /**
     * @brief Constructs a ServerActor sharing the connection registry
     * @param registry Membership shared with the other ServerActors and the AdminActor
     */
    explicit ServerActor(std::shared_ptr<duplex::ConnectionRegistry> registry);

    /**
     * @brief Registers the session, wake-up and shutdown events
     * @return always true
     */
    bool onInit() override;

    /// Registry the sessions of this actor join and leave
    duplex::ConnectionRegistry& registry() { return *_registry; }

    /**
     * @brief Turns an accepted socket into a ChatSession
     * @param evt Event carrying the socket from the AcceptActor
     */
    void on(NewSessionEvent& evt);

    /**
     * @brief Drains the mailboxes of every session of this actor
     *
     * Pushed by the AdminActor after a broadcast or a /kick. Sessions that
     * have ended on both halves are closed.
     */
    void on(MailboxReadyEvent& evt);

    /// Engine shutdown: sessions are released with the actor
    void on(const qb::KillEvent& evt);
};

/**
 * @file server/ServerActor.cpp
 * @brief Session creation and mailbox wake-ups for one core's duplex sessions.
 */

#include "ServerActor.h"
#include <iostream>
#include <vector>

ServerActor::ServerActor(std::shared_ptr<duplex::ConnectionRegistry> registry)
    : _registry(std::move(registry)) {}

bool ServerActor::onInit() {
    registerEvent<NewSessionEvent>(*this);
    registerEvent<MailboxReadyEvent>(*this);
    registerEvent<qb::KillEvent>(*this);
    qb::io::cout() << "ServerActor initialized with ID: " << id() << std::endl;
    return true;
}

/**
 * @brief Adopts a socket accepted by the AcceptActor
 *
 * The new ChatSession registers itself in the shared registry with this
 * actor as owner, so broadcasts know whom to wake.
 */
void ServerActor::on(NewSessionEvent& evt) {
    auto& session = registerSession(std::move(evt.socket));
    qb::io::cout() << "ServerActor " << id() << " now runs connection "
                   << session.handle()->id() << " (" << _registry->size()
                   << " live)" << std::endl;
}

/**
 * @brief Another actor queued messages for one or more of our sessions
 *
 * Every session drains its own mailbox. Sessions whose both halves ended are
 * closed after the walk, as closing one removes it from `sessions()`.
 */
void ServerActor::on(MailboxReadyEvent&) {
    std::vector<qb::uuid> done;
    for (auto& [session_id, session] : sessions()) {
        if (session->flush()) {
            done.push_back(session_id);
        }
    }
    for (const auto& session_id : done) {
        auto it = sessions().find(session_id);
        if (it != sessions().end()) {
            it->second->close();
        }
    }
}

void ServerActor::on(const qb::KillEvent&) {
    qb::io::cout() << "ServerActor " << id() << " shutting down with "
                   << sessions().size() << " session(s)" << std::endl;
    kill();
}

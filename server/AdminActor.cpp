/**
 * @file server/AdminActor.cpp
 */

#include "AdminActor.h"
#include "../shared/Events.h"
#include <iostream>

AdminActor::AdminActor(std::shared_ptr<duplex::ConnectionRegistry> registry,
                       std::shared_ptr<duplex::LineSource> input)
    : _broadcaster(std::move(registry))
    , _input(std::move(input)) {}

bool AdminActor::onInit() {
    registerEvent<qb::KillEvent>(*this);
    registerCallback(*this);
    qb::io::cout() << "AdminActor initialized with ID: " << id() << std::endl;
    qb::io::cout() << "Type a message to broadcast, /list, /kick <id>, /info or '"
                   << duplex::SENTINEL << "' to close the admin console" << std::endl;
    return true;
}

/**
 * @brief Reads at most one operator line
 *
 * End of the operator input is handled like the sentinel.
 */
void AdminActor::onCallback() {
    std::string line;
    switch (_input->poll(line)) {
        case duplex::LineStatus::Pending:
            return;
        case duplex::LineStatus::Exhausted:
            apply(_broadcaster.finish());
            return;
        case duplex::LineStatus::Line:
            apply(_broadcaster.handle(line));
            return;
    }
}

/**
 * @brief Carries out an AdminOutcome
 *
 * Owners are woken before anything is printed, their pumps run on other
 * cores and need not wait for the console.
 */
void AdminActor::apply(const duplex::AdminOutcome& outcome) {
    for (const auto& owner : outcome.wake) {
        push<MailboxReadyEvent>(owner);
    }
    for (const auto& text : outcome.lines) {
        qb::io::cout() << "[admin] " << text << std::endl;
    }

    if (outcome.action == duplex::AdminOutcome::Action::Stop) {
        unregisterCallback(*this);
        kill();
    }
}

void AdminActor::on(const qb::KillEvent&) {
    unregisterCallback(*this);
    kill();
}

/**
 * @file server/AdminBroadcaster.cpp
 */

#include "AdminBroadcaster.h"
#include "../shared/Fault.h"
#include <sstream>

namespace duplex {

AdminBroadcaster::AdminBroadcaster(std::shared_ptr<ConnectionRegistry> registry,
                                   std::string sentinel, std::string identity)
    : _registry(std::move(registry))
    , _sentinel(std::move(sentinel))
    , _identity(std::move(identity))
    , _providers(defaultInfoProviders(_registry)) {}

AdminOutcome AdminBroadcaster::handle(const std::string& line) {
    if (_stopped) {
        AdminOutcome outcome;
        outcome.action = AdminOutcome::Action::Stop;
        return outcome;
    }
    if (isSentinel(line, _sentinel)) {
        return finish();
    }

    auto text = trim(line);
    if (text.empty()) {
        return AdminOutcome{};
    }
    if (text.front() == '/') {
        return command(text);
    }
    return broadcast(std::move(text));
}

AdminOutcome AdminBroadcaster::finish() {
    _stopped = true;
    AdminOutcome outcome;
    outcome.action = AdminOutcome::Action::Stop;
    outcome.lines.push_back("Admin console closed after " + std::to_string(_broadcasts) + " broadcast(s)");
    return outcome;
}

AdminOutcome AdminBroadcaster::broadcast(std::string text) {
    AdminOutcome outcome;
    outcome.action = AdminOutcome::Action::Broadcast;
    outcome.report = _registry->broadcast(ChatMessage{std::move(text), _identity});
    outcome.wake = outcome.report.owners;
    ++_broadcasts;

    std::ostringstream summary;
    summary << "Broadcast to " << outcome.report.delivered << "/" << outcome.report.targets
            << " connection(s)";
    if (outcome.report.dropped) summary << ", " << outcome.report.dropped << " full";
    if (outcome.report.gone) {
        summary << ", " << outcome.report.gone << " skipped ("
                << toString(Fault::BroadcastTargetGone) << ")";
    }
    outcome.lines.push_back(summary.str());
    return outcome;
}

AdminOutcome AdminBroadcaster::command(const std::string& line) {
    std::istringstream in(line);
    std::string name, argument;
    in >> name >> argument;

    if (name == "/list") return list();
    if (name == "/info") return info();
    if (name == "/kick") return shutdown(argument);

    AdminOutcome outcome;
    outcome.lines.push_back("Unknown command " + name + " (try /list, /kick <id>, /info or " + _sentinel + ")");
    return outcome;
}

AdminOutcome AdminBroadcaster::list() const {
    AdminOutcome outcome;
    outcome.action = AdminOutcome::Action::List;
    const auto ids = _registry->connections();
    outcome.lines.push_back(std::to_string(ids.size()) + " live connection(s)");
    for (const auto& id : ids) {
        auto handle = _registry->lookup(id);
        if (!handle) continue;
        outcome.lines.push_back("  " + id.to_string() + " " + toString(handle->state()) +
                                " queued=" + std::to_string(handle->mailbox().size()) +
                                " dropped=" + std::to_string(handle->mailbox().dropped()));
    }
    return outcome;
}

AdminOutcome AdminBroadcaster::shutdown(const std::string& id_prefix) {
    AdminOutcome outcome;
    if (id_prefix.empty()) {
        outcome.lines.push_back("Usage: /kick <connection id or unique prefix>");
        return outcome;
    }

    std::vector<qb::uuid> matches;
    for (const auto& id : _registry->connections()) {
        if (id.to_string().rfind(id_prefix, 0) == 0) {
            matches.push_back(id);
        }
    }
    if (matches.size() != 1) {
        outcome.lines.push_back(matches.empty()
                                    ? "No connection matches " + id_prefix
                                    : "Ambiguous id " + id_prefix + " matches " +
                                          std::to_string(matches.size()) + " connections");
        return outcome;
    }

    auto owner = _registry->shutdownSession(matches.front());
    if (!owner) {
        // Deregistered between listing and shutdown
        outcome.lines.push_back("Connection " + matches.front().to_string() + " already closed");
        return outcome;
    }
    outcome.action = AdminOutcome::Action::Shutdown;
    outcome.wake.push_back(*owner);
    outcome.lines.push_back("Closing connection " + matches.front().to_string());
    return outcome;
}

AdminOutcome AdminBroadcaster::info() const {
    AdminOutcome outcome;
    outcome.action = AdminOutcome::Action::Info;
    for (const auto& provider : _providers) {
        outcome.lines.push_back(provider->label() + ": " + provider->value());
    }
    return outcome;
}

} // namespace duplex

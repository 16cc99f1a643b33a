/**
 * @file server/AdminBroadcaster.h
 * @brief Turns operator lines typed on the server console into fan-out messages.
 *
 * @details
 * `AdminActor` feeds every line read from its `LineSource` to `handle()`:
 * - the sentinel (`exit`, any case) stops the broadcaster,
 * - `/list`, `/kick <id>` and `/info` are administrative commands,
 * - any other non-empty line is broadcast as `{line, "Server Admin"}` to every
 *   registered connection.
 *
 * The broadcaster only touches the registry and mailboxes. Waking the owners
 * of the mailboxes that received something is left to the calling actor,
 * through `AdminOutcome::wake`. Stopping it leaves every session untouched.
 */

#pragma once

#include <qb/actor.h>
#include <memory>
#include <string>
#include <vector>
#include "../shared/ConnectionRegistry.h"
#include "../shared/Config.h"
#include "InfoProvider.h"

namespace duplex {

struct AdminOutcome {
    enum class Action {
        Broadcast,  ///< Line fanned out, see `report`
        List,       ///< Live connections listed in `lines`
        Shutdown,   ///< A connection's response stream was closed
        Info,       ///< Server facts listed in `lines`
        Ignored,    ///< Empty line or unusable command, reason in `lines`
        Stop        ///< Sentinel or end of input, the loop must end
    };

    Action action = Action::Ignored;
    BroadcastReport report;
    std::vector<qb::ActorId> wake;   ///< Owners to notify with a MailboxReadyEvent
    std::vector<std::string> lines;  ///< Human readable output for the operator
};

class AdminBroadcaster {
public:
    explicit AdminBroadcaster(std::shared_ptr<ConnectionRegistry> registry,
                              std::string sentinel = SENTINEL,
                              std::string identity = ADMIN_IDENTITY);

    AdminOutcome handle(const std::string& line);

    /// The operator input is exhausted
    AdminOutcome finish();

    bool stopped() const { return _stopped; }
    std::size_t broadcasts() const { return _broadcasts; }

private:
    AdminOutcome broadcast(std::string text);
    AdminOutcome command(const std::string& line);
    AdminOutcome list() const;
    AdminOutcome shutdown(const std::string& id_prefix);
    AdminOutcome info() const;

    const std::shared_ptr<ConnectionRegistry> _registry;
    const std::string _sentinel;
    const std::string _identity;
    InfoProviders _providers;
    std::size_t _broadcasts = 0;
    bool _stopped = false;
};

} // namespace duplex

/**
 * @file server/AdminActor.h
 * @brief Operator console of the server: broadcasts and administrative commands.
 *
 * @details
 * Polls its `LineSource` once per core loop through `qb::ICallback` and hands
 * each line to a `duplex::AdminBroadcaster`. After a broadcast or a `/kick`
 * it pushes a `MailboxReadyEvent` to every ServerActor owning an affected
 * mailbox, so the corresponding OutboundPumps run on their own cores.
 *
 * The sentinel or the end of the operator input kills this actor only; the
 * sessions and the rest of the server keep running.
 */

#pragma once

#include <qb/actor.h>
#include <qb/icallback.h>
#include <memory>
#include "../shared/LineSource.h"
#include "AdminBroadcaster.h"

class AdminActor : public qb::Actor,
                   public qb::ICallback {
private:
    duplex::AdminBroadcaster _broadcaster;
    const std::shared_ptr<duplex::LineSource> _input;

public:
    /**
     * @brief Constructs the operator console
     *
     * @param registry Live connections targeted by broadcasts and commands
     * @param input Operator lines, stdin in production
     */
    AdminActor(std::shared_ptr<duplex::ConnectionRegistry> registry,
               std::shared_ptr<duplex::LineSource> input);

    /// @return true once the console callback is registered
    bool onInit() override;
    void on(const qb::KillEvent&);

private:
    /// One operator line per core loop, if any is ready
    void onCallback() override;

    /**
     * @brief Prints the outcome lines and wakes the affected owners
     *
     * A `Stop` outcome also unregisters the callback and kills this actor.
     */
    void apply(const duplex::AdminOutcome& outcome);
};

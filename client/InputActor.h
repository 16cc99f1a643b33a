/**
 * @file client/InputActor.h
 * @brief Console side of the chat client, the writer loop of the session.
 *
 * @details
 * Polls the operator's `LineSource` once per core loop (`qb::ICallback`).
 * Each line goes through `ClientDuplex::submit()`, which queues it on the
 * request mailbox; `ClientActor` is then woken with a `MailboxReadyEvent` to
 * send it. Typing `exit` (or closing stdin) closes the request stream and ends
 * this actor; the network side keeps reading until the server ends its stream.
 */

#pragma once

#include <qb/actor.h>
#include <qb/icallback.h>
#include <memory>
#include "../shared/LineSource.h"
#include "ClientDuplex.h"

class InputActor : public qb::Actor,
                   public qb::ICallback {
private:
    const qb::ActorId _client_id;
    const std::shared_ptr<duplex::ClientDuplex> _duplex;
    const std::shared_ptr<duplex::LineSource> _input;

public:
    /**
     * @brief Constructs the console side of a client session
     *
     * @param client_id ClientActor to wake after each queued line
     * @param duplex Session shared with the ClientActor
     * @param input Operator lines, stdin in production
     */
    InputActor(qb::ActorId client_id,
               std::shared_ptr<duplex::ClientDuplex> duplex,
               std::shared_ptr<duplex::LineSource> input);

    /**
     * @brief Registers the console callback and prints the prompt
     * @return true, the actor has nothing that can fail at start
     */
    bool onInit() override;

    /// Engine shutdown: unregisters the callback before dying
    void on(const qb::KillEvent&);

private:
    /**
     * @brief Polls one operator line without blocking
     *
     * - a line is submitted and the ClientActor woken if it was queued,
     * - the sentinel or end of input closes the writer half, wakes the
     *   ClientActor so it writes end-of-stream, and stops polling,
     * - nothing typed yet leaves the core loop running.
     */
    void onCallback() override;

    /// Unregisters the console callback and dies
    void stop();
};

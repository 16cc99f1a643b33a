/**
 * @file shared/ConnectionHandle.h
 * @brief State of one duplex session: identity, owning actor, mailbox and lifecycle.
 *
 * @details
 * A handle is shared (`std::shared_ptr`) by the registry and by the two pumps
 * of its connection. It is released once the last of them lets go.
 *
 * Lifecycle, never moving backwards:
 * - `Open`: both pumps active.
 * - `Closing`: one half has ended (or a shutdown was requested), the mailbox
 *   is closed and the other half may still be draining.
 * - `Closed`: both pumps have exited.
 *
 * `owner()` is the actor running both pumps. Producers living on other cores
 * push a `MailboxReadyEvent` to it after a successful enqueue.
 */

#pragma once

#include <qb/actor.h>
#include <qb/uuid.h>
#include <atomic>
#include <cstdint>
#include "Mailbox.h"

namespace duplex {

enum class ConnectionState : uint8_t {
    Open,
    Closing,
    Closed
};

const char* toString(ConnectionState state) noexcept;

class ConnectionHandle {
public:
    ConnectionHandle(qb::uuid id, qb::ActorId owner,
                     std::size_t capacity = Mailbox::DEFAULT_CAPACITY);

    ConnectionHandle(const ConnectionHandle&) = delete;
    ConnectionHandle& operator=(const ConnectionHandle&) = delete;

    const qb::uuid& id() const { return _id; }
    qb::ActorId owner() const { return _owner; }
    ConnectionState state() const { return _state.load(std::memory_order_acquire); }

    Mailbox& mailbox() { return _mailbox; }
    const Mailbox& mailbox() const { return _mailbox; }

    EnqueueResult enqueue(ChatMessage message) { return _mailbox.push(std::move(message)); }

    /**
     * @brief Closes the mailbox so the OutboundPump drains and ends the stream
     * @return true if this call closed the mailbox
     */
    bool requestClose();

    /// The InboundPump has reached end-of-stream or failed
    void markInboundFinished();
    /// The OutboundPump has ended the stream or failed
    void markOutboundFinished();

    bool inboundFinished() const { return _inbound_done.load(std::memory_order_acquire); }
    bool outboundFinished() const { return _outbound_done.load(std::memory_order_acquire); }

private:
    void advance(ConnectionState to);
    void finishHalf(std::atomic<bool>& half);

    const qb::uuid _id;
    const qb::ActorId _owner;
    Mailbox _mailbox;
    std::atomic<ConnectionState> _state{ConnectionState::Open};
    std::atomic<bool> _inbound_done{false};
    std::atomic<bool> _outbound_done{false};
    std::atomic<int> _finished_halves{0};
};

} // namespace duplex

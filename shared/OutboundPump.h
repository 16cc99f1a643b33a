/**
 * @file shared/OutboundPump.h
 * @brief Single consumer of a connection's mailbox, writing to its transport.
 *
 * @details
 * The owning actor calls `drain()` whenever the mailbox may hold work: after
 * its InboundPump queued a reply, or on a `MailboxReadyEvent` pushed by a
 * producer on another core, or once the transport flushed its output.
 * `drain()` writes queued messages in FIFO order and returns `Idle` once the
 * mailbox is empty, leaving the core free for other connections. When the sink
 * stops being writable it returns `Blocked`: the remaining messages stay in
 * the bounded mailbox, so a peer that does not read gets its newest messages
 * dropped instead of growing the socket buffer.
 *
 * The pump terminates exactly once:
 * - mailbox closed and drained: end-of-stream is written (`Finished`),
 * - the sink refuses a frame, or `abort()` reports a dropped transport (`Faulted`).
 *
 * On termination the connection is removed from the registry (when one is
 * given) and the outbound half of the handle is marked finished.
 */

#pragma once

#include <memory>
#include <string>
#include "ConnectionHandle.h"
#include "MessageSink.h"

namespace duplex {

class ConnectionRegistry;

enum class PumpStatus {
    Idle,      ///< Mailbox empty, waiting for the next wake-up
    Blocked,   ///< Sink busy, messages stay queued until the next drain
    Finished,  ///< Stream ended after draining a closed mailbox
    Faulted    ///< Transport failure, queued messages are lost
};

const char* toString(PumpStatus status) noexcept;

class OutboundPump {
public:
    /**
     * @param handle Connection whose mailbox is drained
     * @param sink Transport the messages are written to
     * @param registry Registry to leave on termination, nullptr when the
     *        connection is not registered (client side)
     */
    OutboundPump(std::shared_ptr<ConnectionHandle> handle, MessageSink& sink,
                 ConnectionRegistry* registry = nullptr);

    /**
     * @brief Writes queued messages until the mailbox is empty or the sink is busy
     * @return `Idle` or `Blocked` while running, the final status once terminated
     */
    PumpStatus drain();

    /// Transport dropped: terminates the pump if it is still running
    void abort(const std::string& reason);

    bool finished() const { return _status != PumpStatus::Idle; }
    PumpStatus status() const { return _status; }
    std::size_t written() const { return _written; }

private:
    void terminate(PumpStatus status);

    const std::shared_ptr<ConnectionHandle> _handle;
    MessageSink& _sink;
    ConnectionRegistry* const _registry;
    PumpStatus _status = PumpStatus::Idle;
    std::size_t _written = 0;
};

} // namespace duplex

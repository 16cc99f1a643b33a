/**
 * @file shared/SessionCore.h
 * @brief Transport events of one duplex session mapped onto its two pumps.
 *
 * @details
 * Both QB endpoints (`ChatSession` on the server, `ClientActor` on the client)
 * receive the same transport events and forward them here:
 *
 * | Event                        | Inbound half      | Outbound half         |
 * |------------------------------|-------------------|-----------------------|
 * | frame received               | `onMessage`       | drained               |
 * | end-of-stream received       | `onEndOfStream`   | drained, then ends    |
 * | protocol violation           | `onReadError`     | aborted               |
 * | connection lost / refused    | `onReadError`     | aborted               |
 * | wake-up, output flushed      | -                 | drained               |
 *
 * The inbound half is the `Reader`: `InboundPump` on the server, `ClientDuplex`
 * on the client. Both expose `onMessage`, `onEndOfStream` and `onReadError`.
 * The outbound half is an `OutboundPump` writing to the session as a
 * `MessageSink`.
 *
 * Once both halves have ended and the transport has flushed everything it
 * buffered, `releasable()` tells the session to close its socket.
 *
 * @tparam Reader Consumer of the frames read from the transport
 */

#pragma once

#include <memory>
#include <string>
#include "ConnectionHandle.h"
#include "MessageSink.h"
#include "OutboundPump.h"

namespace duplex {

template<typename Reader>
class SessionCore {
private:
    Reader& _reader;
    const std::shared_ptr<ConnectionHandle> _handle;
    OutboundPump _outbound;

public:
    /**
     * @param reader Inbound half, must outlive the core
     * @param handle Connection shared by both halves
     * @param sink Transport written by the outbound half
     * @param registry Registry the connection leaves on termination, if any
     */
    SessionCore(Reader& reader, std::shared_ptr<ConnectionHandle> handle,
                MessageSink& sink, ConnectionRegistry* registry = nullptr)
        : _reader(reader)
        , _handle(handle)
        , _outbound(std::move(handle), sink, registry) {}

    /// Runs the outbound half until the mailbox is empty or the sink is busy
    PumpStatus flush() {
        return _outbound.drain();
    }

    void onMessage(const ChatMessage& msg) {
        _reader.onMessage(msg);
        flush();
    }

    /**
     * @brief The peer closed its half
     *
     * The mailbox is closed by the reader, so the flush writes what is left
     * followed by end-of-stream, unless the sink is busy.
     */
    void onEndOfStream() {
        _reader.onEndOfStream();
        flush();
    }

    /// Unframeable input: both halves terminate, queued messages are lost
    void onViolation(const std::string& reason) {
        _reader.onReadError("protocol violation: " + reason);
        _outbound.abort("protocol violation");
    }

    /// Connection dropped or never established
    void onTransportLost(const std::string& reason) {
        _reader.onReadError(reason);
        _outbound.abort(reason);
    }

    /// Terminates the outbound half if it is still running
    void abort(const std::string& reason) {
        _outbound.abort(reason);
    }

    bool closed() const {
        return _handle->state() == ConnectionState::Closed;
    }

    /**
     * @brief True once the socket can be closed without losing a frame
     * @param unsent_bytes Output still buffered by the transport
     */
    bool releasable(std::size_t unsent_bytes) const {
        return closed() && !unsent_bytes;
    }

    const OutboundPump& outbound() const { return _outbound; }
    const std::shared_ptr<ConnectionHandle>& handle() const { return _handle; }
};

} // namespace duplex

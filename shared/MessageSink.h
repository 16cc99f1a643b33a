/**
 * @file shared/MessageSink.h
 * @brief Outbound half of a transport, as seen by an OutboundPump.
 */

#pragma once

#include "Protocol.h"

namespace duplex {

/**
 * @brief Write side of one duplex session
 *
 * Implemented by the QB sessions (`ChatSession` on the server, `ClientActor`
 * on the client). `send()` and `finish()` return false when the transport can
 * no longer accept frames.
 *
 * `writable()` is the flow control signal: while it is false the pump leaves
 * messages in the mailbox, which fills up and drops the newest. The session
 * drains again once its output buffer has been flushed to the socket.
 */
class MessageSink {
public:
    virtual ~MessageSink() = default;

    /**
     * @brief Writes one message frame
     * @return false if the transport is gone
     */
    virtual bool send(const ChatMessage& message) = 0;

    /// Writes end-of-stream: nothing follows on this half
    virtual bool finish() = 0;

    /// False while unsent output is above the high-water mark, or not connected yet
    virtual bool writable() = 0;
};

} // namespace duplex

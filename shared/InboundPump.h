/**
 * @file shared/InboundPump.h
 * @brief Consumer of the inbound stream of one server-side connection.
 *
 * @details
 * The session feeds every parsed frame to the pump:
 * - `onMessage()` builds the reply `"<identity> : <text>"` sent by `<identity>`,
 *   queues it on the connection's own mailbox and logs the receipt,
 * - `onEndOfStream()` is the clean termination of the inbound half,
 * - `onReadError()` is the faulted termination.
 *
 * Either termination marks the inbound half finished, which closes the mailbox
 * so the OutboundPump drains and ends the response stream.
 */

#pragma once

#include <memory>
#include <string>
#include "ConnectionHandle.h"
#include "Config.h"

namespace duplex {

class InboundPump {
public:
    /**
     * @param handle Connection whose mailbox receives the replies
     * @param identity Sender name of the replies
     */
    explicit InboundPump(std::shared_ptr<ConnectionHandle> handle,
                         std::string identity = SERVER_IDENTITY);

    /**
     * @brief Handles one inbound message
     * @return true if a reply was queued and the OutboundPump has work to do
     */
    bool onMessage(const ChatMessage& msg);

    /// Peer ended its stream: marks the inbound half finished
    void onEndOfStream();

    /**
     * @brief Faulted end of the inbound half
     *
     * Logs @p reason and marks the half finished. Replies already queued are
     * still drained by the OutboundPump.
     */
    void onReadError(const std::string& reason);

    bool finished() const { return _finished; }
    std::size_t received() const { return _received; }

    /// Reply sent back for @p msg by a server named @p identity
    static ChatMessage makeReply(const ChatMessage& msg, const std::string& identity);

private:
    const std::shared_ptr<ConnectionHandle> _handle;
    const std::string _identity;
    std::size_t _received = 0;
    bool _finished = false;
};

} // namespace duplex

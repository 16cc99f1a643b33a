/**
 * @file shared/Mailbox.h
 * @brief Bounded, closable FIFO of `duplex::ChatMessage` feeding one outbound stream.
 *
 * @details
 * A mailbox has any number of producers (the connection's own InboundPump,
 * the AdminBroadcaster running on another core) and exactly one consumer,
 * the connection's OutboundPump. Producers never block:
 * - a full mailbox drops the newest message and counts the drop,
 * - a closed mailbox refuses new messages.
 *
 * Closing is the cancellation signal of a connection. Messages already queued
 * keep flowing after `close()`; `pop()` reports `Closed` only once drained.
 */

#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include "Protocol.h"

namespace duplex {

enum class EnqueueResult {
    Enqueued,  ///< Queued for delivery
    Dropped,   ///< Mailbox full, the new message was discarded
    Closed     ///< Mailbox closed, nothing will be delivered anymore
};

enum class DequeueResult {
    Message,  ///< A message was moved out
    Empty,    ///< Nothing queued right now
    Closed    ///< Closed and fully drained
};

class Mailbox {
public:
    static constexpr std::size_t DEFAULT_CAPACITY = 128;

    /// @throws std::invalid_argument if @p capacity is zero
    explicit Mailbox(std::size_t capacity = DEFAULT_CAPACITY);

    Mailbox(const Mailbox&) = delete;
    Mailbox& operator=(const Mailbox&) = delete;

    /**
     * @brief Appends @p message unless the mailbox is full or closed
     *
     * Never blocks. A full mailbox discards @p message and counts it in
     * `dropped()`.
     */
    EnqueueResult push(ChatMessage message);

    /**
     * @brief Moves the oldest message into @p out
     * @return `Closed` only when closed and nothing is left to drain
     */
    DequeueResult pop(ChatMessage& out);

    /**
     * @brief Refuses any further message
     * @return true if this call closed the mailbox, false if it already was
     */
    bool close();

    bool closed() const;
    std::size_t size() const;
    std::size_t capacity() const { return _capacity; }
    /// Messages discarded because the mailbox was full
    std::size_t dropped() const;

private:
    const std::size_t _capacity;
    std::deque<ChatMessage> _queue;
    std::size_t _dropped = 0;
    bool _closed = false;
    mutable std::mutex _mutex;
};

} // namespace duplex

/**
 * @file shared/Mailbox.cpp
 * @brief Implementation of the bounded per-connection mailbox.
 */

#include "Mailbox.h"
#include <stdexcept>

namespace duplex {

Mailbox::Mailbox(std::size_t capacity)
    : _capacity(capacity) {
    if (!_capacity) {
        throw std::invalid_argument("mailbox capacity must be greater than zero");
    }
}

EnqueueResult Mailbox::push(ChatMessage message) {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_closed) {
        return EnqueueResult::Closed;
    }
    if (_queue.size() >= _capacity) {
        ++_dropped;
        return EnqueueResult::Dropped;
    }
    _queue.push_back(std::move(message));
    return EnqueueResult::Enqueued;
}

DequeueResult Mailbox::pop(ChatMessage& out) {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_queue.empty()) {
        return _closed ? DequeueResult::Closed : DequeueResult::Empty;
    }
    out = std::move(_queue.front());
    _queue.pop_front();
    return DequeueResult::Message;
}

bool Mailbox::close() {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_closed) return false;
    _closed = true;
    return true;
}

bool Mailbox::closed() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _closed;
}

std::size_t Mailbox::size() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _queue.size();
}

std::size_t Mailbox::dropped() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _dropped;
}

} // namespace duplex

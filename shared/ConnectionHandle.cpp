/**
 * @file shared/ConnectionHandle.cpp
 */

#include "ConnectionHandle.h"

namespace duplex {

const char* toString(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::Open: return "Open";
        case ConnectionState::Closing: return "Closing";
        case ConnectionState::Closed: return "Closed";
        default: return "Unknown";
    }
}

ConnectionHandle::ConnectionHandle(qb::uuid id, qb::ActorId owner, std::size_t capacity)
    : _id(id)
    , _owner(owner)
    , _mailbox(capacity) {}

bool ConnectionHandle::requestClose() {
    const bool closed_now = _mailbox.close();
    advance(ConnectionState::Closing);
    return closed_now;
}

void ConnectionHandle::markInboundFinished() {
    finishHalf(_inbound_done);
}

void ConnectionHandle::markOutboundFinished() {
    finishHalf(_outbound_done);
}

void ConnectionHandle::finishHalf(std::atomic<bool>& half) {
    if (half.exchange(true, std::memory_order_acq_rel)) return;

    // Either half ending closes the mailbox: the peer half observes it
    _mailbox.close();
    advance(ConnectionState::Closing);
    if (_finished_halves.fetch_add(1, std::memory_order_acq_rel) + 1 == 2) {
        advance(ConnectionState::Closed);
    }
}

void ConnectionHandle::advance(ConnectionState to) {
    auto current = _state.load(std::memory_order_acquire);
    while (current < to &&
           !_state.compare_exchange_weak(current, to, std::memory_order_acq_rel)) {
    }
}

} // namespace duplex

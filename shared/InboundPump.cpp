/**
 * @file shared/InboundPump.cpp
 */

#include "InboundPump.h"
#include "Fault.h"
#include <qb/io.h>
#include <iostream>

namespace duplex {

InboundPump::InboundPump(std::shared_ptr<ConnectionHandle> handle, std::string identity)
    : _handle(std::move(handle))
    , _identity(std::move(identity)) {}

ChatMessage InboundPump::makeReply(const ChatMessage& msg, const std::string& identity) {
    return ChatMessage{identity + " : " + msg.message, identity};
}

bool InboundPump::onMessage(const ChatMessage& msg) {
    if (_finished) return false;
    ++_received;

    const auto result = _handle->enqueue(makeReply(msg, _identity));
    qb::io::cout() << "[" << _handle->id() << "] Received message: " << msg.message
                   << " from " << msg.from << std::endl;

    switch (result) {
        case EnqueueResult::Enqueued:
            return true;
        case EnqueueResult::Dropped:
            qb::io::cerr() << "[" << _handle->id() << "] Mailbox full, reply dropped" << std::endl;
            return false;
        case EnqueueResult::Closed:
        default:
            qb::io::cerr() << "[" << _handle->id() << "] Response stream closed, reply discarded" << std::endl;
            return false;
    }
}

void InboundPump::onEndOfStream() {
    if (_finished) return;
    _finished = true;
    qb::io::cout() << "[" << _handle->id() << "] Chat session ended after "
                   << _received << " message(s)" << std::endl;
    _handle->markInboundFinished();
}

void InboundPump::onReadError(const std::string& reason) {
    if (_finished) return;
    _finished = true;
    qb::io::cerr() << "[" << _handle->id() << "] Error receiving message ("
                   << toString(Fault::TransportReadError) << "): " << reason << std::endl;
    _handle->markInboundFinished();
}

} // namespace duplex

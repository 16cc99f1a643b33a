/**
 * @file client/ClientDuplex.cpp
 */

#include "ClientDuplex.h"
#include "../shared/Fault.h"

namespace duplex {

ClientDuplex::ClientDuplex(std::shared_ptr<ConnectionHandle> handle, Display display,
                           std::string identity, std::string sentinel)
    : _handle(std::move(handle))
    , _display(std::move(display))
    , _identity(std::move(identity))
    , _sentinel(std::move(sentinel)) {}

std::string ClientDuplex::format(const ChatMessage& msg) {
    return "Received message: " + msg.message + " from " + msg.from;
}

WriterStep ClientDuplex::submit(const std::string& line) {
    if (isSentinel(line, _sentinel)) {
        return closeWriter();
    }

    auto text = trim(line);
    if (text.empty()) {
        return _handle->mailbox().closed() ? WriterStep::Closed : WriterStep::Ignored;
    }

    switch (_handle->enqueue(ChatMessage{std::move(text), _identity})) {
        case EnqueueResult::Enqueued: return WriterStep::Queued;
        case EnqueueResult::Dropped: return WriterStep::Dropped;
        case EnqueueResult::Closed:
        default: return WriterStep::Closed;
    }
}

WriterStep ClientDuplex::closeWriter() {
    _handle->requestClose();
    return WriterStep::Closed;
}

void ClientDuplex::onMessage(const ChatMessage& msg) {
    if (readerFinished()) return;
    ++_displayed;
    _display(format(msg));
}

void ClientDuplex::onEndOfStream() {
    if (readerFinished()) return;
    _display("Chat session ended by server");
    endReader();
}

void ClientDuplex::onReadError(const std::string& reason) {
    if (readerFinished()) return;
    _display(std::string("Error receiving message (") + toString(Fault::TransportReadError) +
             "): " + reason);
    endReader();
}

void ClientDuplex::endReader() {
    // Closes the outbound mailbox too: the writer half drains and ends
    _handle->markInboundFinished();
}

} // namespace duplex

/**
 * @file server/ChatSession.cpp
 * @brief Implementation of the server-side duplex session.
 *
 * @details
 * - Constructor: starts the session in the registry, switches to `ChatProtocol`.
 * - `on(ChatMessage)`: InboundPump queues the reply, the OutboundPump flushes it.
 * - `on(EndOfStream)`: clean end of the inbound half; the mailbox closes and the
 *   OutboundPump ends the response stream once drained.
 * - `on(ProtocolViolation)` / `on(disconnected)`: faulted termination of both halves.
 * - `on(eos)`: output flushed, the pump resumes and a finished session closes.
 * - Destructor: makes sure the connection left the registry.
 */

#include "ChatSession.h"
#include "ServerActor.h"
#include "../shared/Config.h"
#include <iostream>

ChatSession::ChatSession(ServerActor& server)
    : client(server)
    , _handle(server.registry().startSession(server.id()))
    , _inbound(_handle)
    , _core(_inbound, _handle, *this, &server.registry()) {
    this->template switch_protocol<Protocol>(*this);
    qb::io::cout() << "[" << _handle->id() << "] New chat session opened" << std::endl;
}

ChatSession::~ChatSession() {
    // Idempotent: leaves the registry if the transport vanished without notice
    _core.abort("session destroyed");
    qb::io::cout() << "[" << _handle->id() << "] Chat session released ("
                   << duplex::toString(_handle->state()) << ")" << std::endl;
}

bool ChatSession::flush() {
    _core.flush();
    return _connected && _core.releasable(this->out().size());
}

/**
 * @brief Ends the connection after both halves finished
 *
 * The disconnected event that follows finds both pumps terminated and only
 * releases the session.
 */
void ChatSession::close() {
    if (_closing) return;
    _closing = true;
    qb::io::cout() << "[" << _handle->id() << "] Both streams ended, closing connection" << std::endl;
    this->disconnect();
}

void ChatSession::on(const duplex::ChatMessage& msg) {
    _core.onMessage(msg);
}

void ChatSession::on(const duplex::EndOfStream&) {
    _core.onEndOfStream();
    // The response stream may have ended earlier (admin /kick)
    if (flush()) close();
}

void ChatSession::on(const duplex::ProtocolViolation& violation) {
    _core.onViolation(violation.reason);
    close();
}

void ChatSession::on(qb::io::async::event::disconnected const &) {
    _connected = false;
    _core.onTransportLost("connection closed by peer");
}

void ChatSession::on(qb::io::async::event::eos const &) {
    if (flush()) close();
}

bool ChatSession::send(const duplex::ChatMessage& message) {
    if (!_connected) return false;
    *this << message;
    return true;
}

bool ChatSession::finish() {
    if (!_connected) return false;
    *this << duplex::EndOfStream{};
    return true;
}

bool ChatSession::writable() {
    return _connected && this->out().size() < duplex::OUTPUT_HIGH_WATER_MARK;
}

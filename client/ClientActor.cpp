/**
 * @file client/ClientActor.cpp
 * @brief Connection handling and both network loops of the chat client.
 *
 * @details
 * - `connect()` / `onConnected()`: asynchronous connection, then the protocol
 *   switch and a first drain of the lines typed meanwhile.
 * - Frame handlers forward to the `SessionCore`, which drives `ClientDuplex`
 *   and the OutboundPump.
 * - `endIfDone()`: runs after every event that can end a half, and shuts the
 *   client down once nothing is left to write.
 */

#include "ClientActor.h"
#include "../shared/Config.h"
#include <iostream>

ClientActor::ClientActor(std::shared_ptr<duplex::ClientDuplex> duplex, qb::io::uri server_uri)
    : _duplex(std::move(duplex))
    , _server_uri(std::move(server_uri))
    , _core(*_duplex, _duplex->handle(), *this) {}

bool ClientActor::onInit() {
    registerEvent<MailboxReadyEvent>(*this);
    qb::io::cout() << "ClientActor initialized with ID: " << id() << std::endl;
    connect();
    return true;
}

void ClientActor::connect() {
    qb::io::async::tcp::connect<qb::io::tcp::socket>(
        _server_uri,
        [this](qb::io::tcp::socket socket) {
            if (socket.is_open()) {
                onConnected(std::move(socket));
            } else {
                onConnectionFailed();
            }
        },
        CONNECT_TIMEOUT
    );
}

/**
 * @brief Installs the connected socket
 *
 * Same sequence as any QB client taking over a socket: reset the buffers,
 * move the socket in, switch the protocol, start the I/O watcher.
 */
void ClientActor::onConnected(qb::io::tcp::socket&& socket) {
    qb::io::cout() << "Connected to chat server " << _server_uri.source() << std::endl;
    _connected = true;

    this->transport().close();
    this->in().reset();
    this->out().reset();
    this->transport() = std::move(socket);
    this->template switch_protocol<Protocol>(*this);
    this->start();

    // Lines typed while connecting are waiting in the mailbox
    _core.flush();
    endIfDone();
}

void ClientActor::onConnectionFailed() {
    qb::io::cerr() << "Failed to start chat: cannot connect to " << _server_uri.source() << std::endl;
    _core.onTransportLost("connection failed");
    endIfDone();
}

void ClientActor::on(const duplex::ChatMessage& msg) {
    _core.onMessage(msg);
}

void ClientActor::on(const duplex::EndOfStream&) {
    // Closes the request stream as well, the flush ends it
    _core.onEndOfStream();
    endIfDone();
}

void ClientActor::on(const duplex::ProtocolViolation& violation) {
    _core.onViolation(violation.reason);
    endIfDone();
}

void ClientActor::on(qb::io::async::event::disconnected const&) {
    _connected = false;
    _core.onTransportLost("connection closed by server");
    endIfDone();
}

void ClientActor::on(qb::io::async::event::eos const&) {
    _core.flush();
    endIfDone();
}

void ClientActor::on(MailboxReadyEvent&) {
    _core.flush();
    endIfDone();
}

bool ClientActor::send(const duplex::ChatMessage& message) {
    if (!_connected) return false;
    *this << message;
    return true;
}

bool ClientActor::finish() {
    if (!_connected) return false;
    *this << duplex::EndOfStream{};
    return true;
}

bool ClientActor::writable() {
    return _connected && this->out().size() < duplex::OUTPUT_HIGH_WATER_MARK;
}

/**
 * @brief Ends the client after both halves finished
 *
 * While the final end-of-stream frame is still in `out()` this waits for the
 * next `event::eos`. A connection that is already gone has nothing to flush.
 */
void ClientActor::endIfDone() {
    if (_done || !_core.releasable(_connected ? this->out().size() : 0)) return;
    _done = true;

    qb::io::cout() << "Chat session ended: " << _duplex->displayed() << " message(s) received, "
                   << _core.outbound().written() << " sent" << std::endl;

    if (_connected) {
        _connected = false;
        this->transport().close();
    }
    broadcast<qb::KillEvent>();
}

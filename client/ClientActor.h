/**
 * @file client/ClientActor.h
 * @brief Network side of the chat client: one TCP connection, one duplex session.
 *
 * @details
 * `ClientActor` is a `qb::io::use<ClientActor>::tcp::client<>` speaking
 * `duplex::ChatProtocol`. It runs both network-facing loops of the session
 * through a `SessionCore`:
 * - the reader: every parsed frame goes to `ClientDuplex` for display,
 * - the writer's OutboundPump: on each `MailboxReadyEvent` from `InputActor`
 *   it drains the request mailbox into the socket (this actor is the
 *   pump's `MessageSink`).
 *
 * Lines typed before the connection is up stay in the mailbox: the sink is
 * not writable until `onConnected()`. Once both halves are done and the last
 * end-of-stream frame has left `out()` (`event::eos`), the connection is
 * closed and every actor of the client is killed so the engine returns.
 */

#pragma once

#include <qb/actor.h>
#include <qb/io/async.h>
#include <qb/io/uri.h>
#include <memory>
#include "../shared/Protocol.h"
#include "../shared/Events.h"
#include "../shared/MessageSink.h"
#include "../shared/SessionCore.h"
#include "ClientDuplex.h"

class ClientActor : public qb::Actor,
                    public qb::io::use<ClientActor>::tcp::client<>,
                    public duplex::MessageSink {
public:
    /// Frame parser switched to once connected
    using Protocol = duplex::ChatProtocol<ClientActor>;

private:
    const std::shared_ptr<duplex::ClientDuplex> _duplex;
    const qb::io::uri _server_uri;
    duplex::SessionCore<duplex::ClientDuplex> _core;
    bool _connected{false};
    bool _done{false};

    /// Maximum time to wait for connection establishment
    static constexpr double CONNECT_TIMEOUT = 5.0;

public:
    /**
     * @brief Constructs the network side of a client session
     * @param duplex Session shared with the InputActor
     * @param server_uri Address of the chat server
     */
    ClientActor(std::shared_ptr<duplex::ClientDuplex> duplex, qb::io::uri server_uri);

    /**
     * @brief Registers the wake-up event and starts connecting
     * @return always true, a failed connection ends the session instead
     */
    bool onInit() override;

    // reader loop, frames dispatched by Protocol
    void on(const duplex::ChatMessage& msg);
    void on(const duplex::EndOfStream&);
    void on(const duplex::ProtocolViolation& violation);

    /// Server closed the connection or the socket failed
    void on(qb::io::async::event::disconnected const&);
    /// Everything buffered in `out()` reached the socket
    void on(qb::io::async::event::eos const&);

    /// Writer loop: the console queued something or closed the request stream
    void on(MailboxReadyEvent&);

    // duplex::MessageSink
    bool send(const duplex::ChatMessage& message) override;
    bool finish() override;
    bool writable() override;

private:
    void connect();
    void onConnected(qb::io::tcp::socket&& socket);
    void onConnectionFailed();

    /// Closes the connection and stops the client once the session is over
    void endIfDone();
};

/**
 * @file server/ChatSession.h
 * @brief Server-side endpoint of one duplex session.
 *
 * @details
 * `ChatSession` is the QB-IO client object created by `ServerActor` for each
 * accepted socket. On construction it starts a session in the registry, which
 * creates and registers its `ConnectionHandle`, and wires the two halves:
 * - the `InboundPump` receives every frame parsed by `ChatProtocol`,
 * - the `OutboundPump`, inside a `SessionCore`, drains the handle's mailbox
 *   into this session, which acts as its `MessageSink` (`*this << message`).
 *
 * Both pumps run on the ServerActor's core, so no locking is involved beyond
 * the mailbox itself. A dropped connection is a read fault for the inbound
 * half and aborts the outbound half; nothing leaks to other sessions.
 *
 * Flow control: the session stops accepting frames from the pump while more
 * than `OUTPUT_HIGH_WATER_MARK` bytes wait in `out()`. QB-IO reports the
 * flushed output with `event::eos`, which resumes the drain. Once both halves
 * have ended and the output is flushed, the socket is closed.
 */

#pragma once

#include <qb/io/async.h>
#include <memory>
#include "../shared/Protocol.h"
#include "../shared/MessageSink.h"
#include "../shared/InboundPump.h"
#include "../shared/SessionCore.h"

class ServerActor;

class ChatSession : public qb::io::use<ChatSession>::tcp::client<ServerActor>,
                    public duplex::MessageSink {
public:
    /// Frame parser switched to on construction
    using Protocol = duplex::ChatProtocol<ChatSession>;

    /**
     * @brief Registers the connection and starts parsing frames
     * @param server Owning actor, also the owner recorded in the handle
     */
    explicit ChatSession(ServerActor& server);
    ~ChatSession();

    /**
     * @brief Runs the OutboundPump, as far as the socket buffer allows
     * @return true if both halves ended and nothing is left to write
     */
    bool flush();

    /// Closes the socket once, after the session is done
    void close();

    const std::shared_ptr<duplex::ConnectionHandle>& handle() const { return _handle; }

    // inbound frames, dispatched by Protocol
    void on(const duplex::ChatMessage& msg);
    void on(const duplex::EndOfStream&);
    void on(const duplex::ProtocolViolation& violation);

    /// Peer closed the connection or the socket failed
    void on(qb::io::async::event::disconnected const &);
    /// Everything buffered in `out()` reached the socket
    void on(qb::io::async::event::eos const &);

    // duplex::MessageSink
    bool send(const duplex::ChatMessage& message) override;
    bool finish() override;
    bool writable() override;

private:
    std::shared_ptr<duplex::ConnectionHandle> _handle;
    duplex::InboundPump _inbound;
    duplex::SessionCore<duplex::InboundPump> _core;
    bool _connected = true;
    bool _closing = false;
};

/**
 * @file client/ClientDuplex.h
 * @brief Client side of the one duplex session: a writer half and a reader half.
 *
 * @details
 * The writer half is driven by `InputActor`: `submit()` turns each operator
 * line into `{line, "Client"}` and queues it on the outbound mailbox drained
 * by the client's OutboundPump. The sentinel closes that mailbox; once it is
 * drained the pump writes end-of-stream, which the server's InboundPump sees
 * as the clean end of the session.
 *
 * The reader half is driven by `ClientActor`: every response is displayed until
 * the server ends its stream or the connection fails. Ending the reader also
 * closes the outbound mailbox, so the writer does not outlive the server.
 *
 * The session is over when both halves are done, i.e. the handle is `Closed`.
 * `submit()` runs on the input core, the reader calls on the network core;
 * they only share the handle, which is thread-safe.
 */

#pragma once

#include <functional>
#include <memory>
#include <string>
#include "../shared/ConnectionHandle.h"
#include "../shared/Config.h"

namespace duplex {

enum class WriterStep {
    Queued,   ///< Line queued for sending
    Dropped,  ///< Outbound mailbox full, line discarded
    Ignored,  ///< Empty line
    Closed    ///< Sentinel typed, or the session is already closing
};

class ClientDuplex {
public:
    using Display = std::function<void(const std::string&)>;

    ClientDuplex(std::shared_ptr<ConnectionHandle> handle, Display display,
                 std::string identity = CLIENT_IDENTITY,
                 std::string sentinel = SENTINEL);

    // writer half

    /**
     * @brief Queues one operator line as `{line, identity}`
     *
     * The line is trimmed first. The sentinel closes the writer half instead
     * of being sent.
     */
    WriterStep submit(const std::string& line);
    /// Operator input exhausted: same as typing the sentinel
    WriterStep closeWriter();

    // reader half

    /// Displays one response
    void onMessage(const ChatMessage& msg);

    /**
     * @brief Server ended its stream
     *
     * Ends the reader half and closes the writer too: lines typed after this
     * point are refused.
     */
    void onEndOfStream();

    /// Displays @p reason and ends the reader half
    void onReadError(const std::string& reason);

    bool readerFinished() const { return _handle->inboundFinished(); }
    bool writerFinished() const { return _handle->outboundFinished(); }
    bool finished() const { return _handle->state() == ConnectionState::Closed; }

    std::size_t displayed() const { return _displayed; }
    const std::shared_ptr<ConnectionHandle>& handle() const { return _handle; }

    /// Line shown for a received response
    static std::string format(const ChatMessage& msg);

private:
    void endReader();

    const std::shared_ptr<ConnectionHandle> _handle;
    const Display _display;
    const std::string _identity;
    const std::string _sentinel;
    std::size_t _displayed = 0;
};

} // namespace duplex

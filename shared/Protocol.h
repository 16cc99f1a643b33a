/**
 * @file shared/Protocol.h
 * @brief Wire format of the duplex chat: the `ChatMessage` record, its binary
 * framing and the QB-IO protocol that parses it.
 *
 * @details
 * **Frame Format** (12-byte header followed by the payload):
 * | Offset | Size | Description                       |
 * |--------|------|-----------------------------------|
 * | 0      | 2    | Magic number (`0x5144`, 'QD')     |
 * | 2      | 1    | Version                           |
 * | 3      | 1    | Frame type (`duplex::FrameType`)  |
 * | 4      | 4    | Length of the `from` field        |
 * | 8      | 4    | Length of the `message` field     |
 *
 * The header is followed by the `from` bytes, then the `message` bytes.
 * An `END_OF_STREAM` frame carries no payload and half-closes the sender's
 * stream: the peer stops reading but may keep writing.
 *
 * **Components**:
 * - `duplex::ChatMessage`: the only record exchanged by both sides.
 * - `duplex::peekFrame()` / `duplex::decodeChat()`: framing logic, independent of any socket.
 * - `qb::allocator::pipe<char>::put<...>`: serialization into QB output pipes so that
 *   sessions can write `*this << message;`.
 * - `duplex::ChatProtocol<IO_>`: `qb::io::async::AProtocol` implementation dispatching
 *   `ChatMessage`, `EndOfStream` and `ProtocolViolation` to the `IO_` handler.
 */

#pragma once

#include <qb/io/async.h>
#include <qb/system/allocator/pipe.h>
#include <cstdint>
#include <cstring>
#include <string>

namespace duplex {

/**
 * @brief Binary header preceding every frame
 */
struct FrameHeader {
    uint16_t magic;           // 'QD' (QB Duplex)
    uint8_t version;          // Protocol version
    uint8_t type;             // FrameType
    uint32_t from_length;     // Size of the sender field
    uint32_t message_length;  // Size of the message text
};

/// Magic number 'QD' (0x5144) identifies a duplex chat frame
constexpr uint16_t PROTOCOL_MAGIC = 0x5144;
/// Current protocol version
constexpr uint8_t PROTOCOL_VERSION = 0x01;
constexpr std::size_t HEADER_SIZE = sizeof(FrameHeader);

enum class FrameType : uint8_t {
    CHAT_MESSAGE = 1,  ///< Bidirectional: one ChatMessage
    END_OF_STREAM      ///< Bidirectional: sender will write nothing more
};

/**
 * @brief The record carried in both directions
 *
 * Built once and never mutated afterwards; the core imposes no size limit.
 */
struct ChatMessage {
    std::string message;
    std::string from;

    ChatMessage() = default;
    ChatMessage(std::string m, std::string f)
        : message(std::move(m)), from(std::move(f)) {}

    bool operator==(const ChatMessage& other) const {
        return message == other.message && from == other.from;
    }
    bool operator!=(const ChatMessage& other) const { return !(*this == other); }
};

/// Marker written by a side that closes its half of the stream
struct EndOfStream {};

/// Dispatched to the handler when the byte stream cannot be framed
struct ProtocolViolation {
    std::string reason;
};

enum class DecodeStatus {
    NeedMore,  ///< The buffered bytes do not hold a complete frame yet
    Complete,  ///< A complete frame is buffered
    Invalid    ///< The header is not a duplex frame
};

FrameHeader makeHeader(FrameType type, const ChatMessage& msg) noexcept;
FrameHeader makeEndOfStreamHeader() noexcept;

/// Total size on the wire of the frame described by @p header
inline std::size_t frameSize(const FrameHeader& header) noexcept {
    return HEADER_SIZE + header.from_length + header.message_length;
}

/**
 * @brief Inspects buffered bytes for a complete frame
 *
 * On `Complete` and `NeedMore` (once a header is available) @p header is filled.
 * On `Invalid` @p reason describes what was wrong with the header.
 */
DecodeStatus peekFrame(const char* data, std::size_t size,
                       FrameHeader& header, std::string& reason) noexcept;

/// Rebuilds the ChatMessage of a complete CHAT_MESSAGE frame starting at @p frame
ChatMessage decodeChat(const FrameHeader& header, const char* frame);

} // namespace duplex

namespace qb::allocator {

template<>
pipe<char>& pipe<char>::put<duplex::ChatMessage>(const duplex::ChatMessage& msg);

template<>
pipe<char>& pipe<char>::put<duplex::EndOfStream>(const duplex::EndOfStream& eos);

} // namespace qb::allocator

namespace duplex {

/**
 * @brief Frame parser plugged into QB-IO
 *
 * A session switches to this protocol with
 * `this->template switch_protocol<Protocol>(*this);` and then receives
 * `on(const ChatMessage&)`, `on(const EndOfStream&)` and
 * `on(const ProtocolViolation&)` calls.
 *
 * @tparam IO_ The session type handling parsed frames
 */
template<typename IO_>
class ChatProtocol : public qb::io::async::AProtocol<IO_> {
private:
    FrameHeader _header{};
    bool _violated = false;

public:
    using message = ChatMessage;

    explicit ChatProtocol(IO_& io) noexcept
        : qb::io::async::AProtocol<IO_>(io) {}

    std::size_t getMessageSize() noexcept override {
        auto& buffer = this->_io.in();
        if (_violated || buffer.empty()) return 0;

        std::string reason;
        switch (peekFrame(buffer.cbegin(), buffer.size(), _header, reason)) {
            case DecodeStatus::Complete:
                return frameSize(_header);
            case DecodeStatus::Invalid:
                // The stream cannot be resynchronized, the handler tears the session down
                _violated = true;
                buffer.reset();
                this->_io.on(ProtocolViolation{std::move(reason)});
                return 0;
            case DecodeStatus::NeedMore:
            default:
                return 0;
        }
    }

    void onMessage(std::size_t) noexcept override {
        auto& buffer = this->_io.in();
        if (static_cast<FrameType>(_header.type) == FrameType::END_OF_STREAM) {
            this->_io.on(EndOfStream{});
            return;
        }
        this->_io.on(decodeChat(_header, buffer.cbegin()));
    }

    void reset() noexcept override {
        _header = FrameHeader{};
        _violated = false;
    }
};

} // namespace duplex

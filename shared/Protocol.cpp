/**
 * @file shared/Protocol.cpp
 * @brief Frame construction, inspection and serialization into QB pipes.
 *
 * @details
 * `pipe<char>::put<duplex::ChatMessage>()` writes the 12-byte header, then the
 * sender, then the text, so a session sends with `*this << message;`.
 * `pipe<char>::put<duplex::EndOfStream>()` writes a header-only frame.
 */

#include "Protocol.h"

namespace duplex {

FrameHeader makeHeader(FrameType type, const ChatMessage& msg) noexcept {
    return FrameHeader{
        PROTOCOL_MAGIC,
        PROTOCOL_VERSION,
        static_cast<uint8_t>(type),
        static_cast<uint32_t>(msg.from.size()),
        static_cast<uint32_t>(msg.message.size())
    };
}

FrameHeader makeEndOfStreamHeader() noexcept {
    return FrameHeader{
        PROTOCOL_MAGIC,
        PROTOCOL_VERSION,
        static_cast<uint8_t>(FrameType::END_OF_STREAM),
        0,
        0
    };
}

DecodeStatus peekFrame(const char* data, std::size_t size,
                       FrameHeader& header, std::string& reason) noexcept {
    if (size < HEADER_SIZE) return DecodeStatus::NeedMore;

    std::memcpy(&header, data, HEADER_SIZE);

    if (header.magic != PROTOCOL_MAGIC) {
        reason = "bad frame magic";
        return DecodeStatus::Invalid;
    }
    if (header.version != PROTOCOL_VERSION) {
        reason = "unsupported protocol version " + std::to_string(header.version);
        return DecodeStatus::Invalid;
    }

    switch (static_cast<FrameType>(header.type)) {
        case FrameType::CHAT_MESSAGE:
            break;
        case FrameType::END_OF_STREAM:
            if (header.from_length || header.message_length) {
                reason = "end-of-stream frame with payload";
                return DecodeStatus::Invalid;
            }
            break;
        default:
            reason = "unknown frame type " + std::to_string(header.type);
            return DecodeStatus::Invalid;
    }

    return size < frameSize(header) ? DecodeStatus::NeedMore : DecodeStatus::Complete;
}

ChatMessage decodeChat(const FrameHeader& header, const char* frame) {
    const char* from = frame + HEADER_SIZE;
    const char* text = from + header.from_length;
    return ChatMessage{std::string(text, header.message_length),
                       std::string(from, header.from_length)};
}

} // namespace duplex

namespace qb::allocator {

template<>
pipe<char>& pipe<char>::put<duplex::ChatMessage>(const duplex::ChatMessage& msg) {
    const auto header = duplex::makeHeader(duplex::FrameType::CHAT_MESSAGE, msg);
    this->put(reinterpret_cast<const char*>(&header), duplex::HEADER_SIZE);

    if (!msg.from.empty()) {
        this->put(msg.from.data(), msg.from.size());
    }
    if (!msg.message.empty()) {
        this->put(msg.message.data(), msg.message.size());
    }
    return *this;
}

template<>
pipe<char>& pipe<char>::put<duplex::EndOfStream>(const duplex::EndOfStream&) {
    const auto header = duplex::makeEndOfStreamHeader();
    this->put(reinterpret_cast<const char*>(&header), duplex::HEADER_SIZE);
    return *this;
}

} // namespace qb::allocator

/**
 * @file test/RecordingSink.h
 * @brief In-memory transports used by the unit tests in place of QB sessions.
 */

#pragma once

#include <functional>
#include <vector>
#include "shared/MessageSink.h"

namespace duplex::test {

/// Keeps everything written, can be told to refuse writes or to be busy
class RecordingSink : public MessageSink {
public:
    std::vector<ChatMessage> sent;
    int finished = 0;
    bool fail_send = false;
    bool fail_finish = false;
    /// Stands for a socket buffer above its high-water mark
    bool busy = false;

    bool send(const ChatMessage& message) override {
        if (fail_send) return false;
        sent.push_back(message);
        return true;
    }

    bool finish() override {
        if (fail_finish) return false;
        ++finished;
        return true;
    }

    bool writable() override { return !busy; }
};

/// Delivers writes straight to the peer's reader, like a connected socket would
class LoopbackSink : public MessageSink {
public:
    std::function<void(const ChatMessage&)> on_message;
    std::function<void()> on_end;

    bool send(const ChatMessage& message) override {
        on_message(message);
        return true;
    }

    bool finish() override {
        on_end();
        return true;
    }

    bool writable() override { return true; }
};

} // namespace duplex::test

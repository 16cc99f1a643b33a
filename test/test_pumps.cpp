#include <gtest/gtest.h>
#include <memory>
#include <string>
#include "RecordingSink.h"
#include "shared/ConnectionRegistry.h"
#include "shared/InboundPump.h"
#include "shared/OutboundPump.h"

using namespace duplex;
using duplex::test::RecordingSink;

namespace {

/// One server side session: both pumps over a registered handle
struct SessionFixture {
    explicit SessionFixture(ConnectionRegistry& registry)
        : handle(registry.startSession(qb::ActorId()))
        , inbound(handle)
        , outbound(handle, sink, &registry) {}

    std::shared_ptr<ConnectionHandle> handle;
    RecordingSink sink;
    InboundPump inbound;
    OutboundPump outbound;
};

} // namespace

TEST(InboundPump, RepliesWithServerPrefix) {
    EXPECT_EQ(InboundPump::makeReply(ChatMessage{"hi", "Client"}, SERVER_IDENTITY),
              ChatMessage("Server : hi", "Server"));
}

TEST(Pumps, SingleMessageGetsOneReply) {
    ConnectionRegistry registry;
    SessionFixture session(registry);

    EXPECT_TRUE(session.inbound.onMessage(ChatMessage{"hi", "Client"}));
    EXPECT_EQ(session.outbound.drain(), PumpStatus::Idle);

    ASSERT_EQ(session.sink.sent.size(), 1u);
    EXPECT_EQ(session.sink.sent[0], ChatMessage("Server : hi", "Server"));
    EXPECT_EQ(session.sink.finished, 0);
    EXPECT_EQ(session.handle->state(), ConnectionState::Open);
}

TEST(Pumps, RepliesFollowRequestOrder) {
    ConnectionRegistry registry;
    SessionFixture session(registry);

    for (int i = 0; i < 10; ++i) {
        session.inbound.onMessage(ChatMessage{"m" + std::to_string(i), "Client"});
        if (i % 3 == 0) session.outbound.drain();
    }
    session.outbound.drain();

    ASSERT_EQ(session.sink.sent.size(), 10u);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(session.sink.sent[i].message, "Server : m" + std::to_string(i));
    }
    EXPECT_EQ(session.inbound.received(), 10u);
    EXPECT_EQ(session.outbound.written(), 10u);
}

TEST(Pumps, EndOfStreamFlushesThenDeregisters) {
    ConnectionRegistry registry;
    SessionFixture session(registry);

    session.inbound.onMessage(ChatMessage{"one", "Client"});
    session.inbound.onMessage(ChatMessage{"two", "Client"});
    session.inbound.onEndOfStream();
    EXPECT_TRUE(session.inbound.finished());
    EXPECT_EQ(session.handle->state(), ConnectionState::Closing);
    EXPECT_EQ(registry.size(), 1u);

    EXPECT_EQ(session.outbound.drain(), PumpStatus::Finished);
    ASSERT_EQ(session.sink.sent.size(), 2u);
    EXPECT_EQ(session.sink.sent[1].message, "Server : two");
    EXPECT_EQ(session.sink.finished, 1);
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(session.handle->state(), ConnectionState::Closed);

    // Nothing more is read or written once finished
    EXPECT_FALSE(session.inbound.onMessage(ChatMessage{"late", "Client"}));
    EXPECT_EQ(session.outbound.drain(), PumpStatus::Finished);
    EXPECT_EQ(session.sink.finished, 1);
}

TEST(Pumps, ClosingOneSessionLeavesOthersIntact) {
    ConnectionRegistry registry;
    SessionFixture first(registry);
    SessionFixture second(registry);

    first.inbound.onEndOfStream();
    first.outbound.drain();
    ASSERT_EQ(first.handle->state(), ConnectionState::Closed);

    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.lookup(second.handle->id()), second.handle);
    EXPECT_EQ(second.handle->state(), ConnectionState::Open);

    EXPECT_TRUE(second.inbound.onMessage(ChatMessage{"still here", "Client"}));
    EXPECT_EQ(second.outbound.drain(), PumpStatus::Idle);
    ASSERT_EQ(second.sink.sent.size(), 1u);
    EXPECT_EQ(second.sink.sent[0].message, "Server : still here");
}

TEST(Pumps, FullMailboxDropsNewestReply) {
    ConnectionRegistry registry;
    SessionFixture session(registry);

    for (int i = 0; i < 128; ++i) {
        ASSERT_TRUE(session.inbound.onMessage(ChatMessage{std::to_string(i), "Client"}));
    }
    EXPECT_FALSE(session.inbound.onMessage(ChatMessage{"overflow", "Client"}));
    EXPECT_EQ(session.handle->mailbox().dropped(), 1u);

    session.outbound.drain();
    ASSERT_EQ(session.sink.sent.size(), 128u);
    EXPECT_EQ(session.sink.sent.back().message, "Server : 127");
}

TEST(Pumps, RepliesAndBroadcastsKeepEnqueueOrder) {
    ConnectionRegistry registry;
    SessionFixture session(registry);

    session.inbound.onMessage(ChatMessage{"a", "Client"});
    registry.broadcast(ChatMessage{"update", "Server Admin"});
    session.inbound.onMessage(ChatMessage{"b", "Client"});
    session.outbound.drain();

    ASSERT_EQ(session.sink.sent.size(), 3u);
    EXPECT_EQ(session.sink.sent[0].message, "Server : a");
    EXPECT_EQ(session.sink.sent[1], ChatMessage("update", "Server Admin"));
    EXPECT_EQ(session.sink.sent[2].message, "Server : b");
}

TEST(Pumps, ReadErrorEndsInboundAndLetsOutboundFinish) {
    ConnectionRegistry registry;
    SessionFixture session(registry);

    session.inbound.onMessage(ChatMessage{"hi", "Client"});
    session.inbound.onReadError("connection reset");
    EXPECT_TRUE(session.handle->inboundFinished());
    EXPECT_FALSE(session.inbound.onMessage(ChatMessage{"ignored", "Client"}));

    EXPECT_EQ(session.outbound.drain(), PumpStatus::Finished);
    EXPECT_EQ(session.sink.sent.size(), 1u);
    EXPECT_EQ(registry.size(), 0u);
}

TEST(Pumps, WriteFailureFaultsAndDeregisters) {
    ConnectionRegistry registry;
    SessionFixture session(registry);
    session.sink.fail_send = true;

    session.inbound.onMessage(ChatMessage{"hi", "Client"});
    EXPECT_EQ(session.outbound.drain(), PumpStatus::Faulted);
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_TRUE(session.handle->outboundFinished());
    EXPECT_TRUE(session.handle->mailbox().closed());
    EXPECT_EQ(session.handle->state(), ConnectionState::Closing);

    // Further replies are refused rather than queued for nobody
    EXPECT_FALSE(session.inbound.onMessage(ChatMessage{"again", "Client"}));
    session.inbound.onEndOfStream();
    EXPECT_EQ(session.handle->state(), ConnectionState::Closed);
}

TEST(Pumps, FailedEndOfStreamIsAFault) {
    ConnectionRegistry registry;
    SessionFixture session(registry);
    session.sink.fail_finish = true;

    session.inbound.onEndOfStream();
    EXPECT_EQ(session.outbound.drain(), PumpStatus::Faulted);
    EXPECT_EQ(registry.size(), 0u);
}

TEST(Pumps, AbortIsIdempotentAndKeepsFinalStatus) {
    ConnectionRegistry registry;
    SessionFixture aborted(registry);
    SessionFixture done(registry);

    aborted.outbound.abort("peer gone");
    aborted.outbound.abort("peer gone");
    EXPECT_EQ(aborted.outbound.status(), PumpStatus::Faulted);
    EXPECT_EQ(aborted.sink.finished, 0);

    done.inbound.onEndOfStream();
    done.outbound.drain();
    done.outbound.abort("too late");
    EXPECT_EQ(done.outbound.status(), PumpStatus::Finished);
    EXPECT_EQ(registry.size(), 0u);
}

TEST(Pumps, AdminShutdownEndsTheResponseStream) {
    ConnectionRegistry registry;
    SessionFixture session(registry);

    session.inbound.onMessage(ChatMessage{"hi", "Client"});
    ASSERT_TRUE(registry.shutdownSession(session.handle->id()).has_value());

    EXPECT_EQ(session.outbound.drain(), PumpStatus::Finished);
    EXPECT_EQ(session.sink.sent.size(), 1u);
    EXPECT_EQ(session.sink.finished, 1);
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_FALSE(session.inbound.onMessage(ChatMessage{"after kick", "Client"}));
}

TEST(Pumps, BusySinkStopsTheDrainWithoutLosingMessages) {
    ConnectionRegistry registry;
    SessionFixture session(registry);
    session.sink.busy = true;

    for (const auto* text : {"one", "two", "three"}) {
        EXPECT_TRUE(session.inbound.onMessage(ChatMessage{text, "Client"}));
    }
    EXPECT_EQ(session.outbound.drain(), PumpStatus::Blocked);
    EXPECT_TRUE(session.sink.sent.empty());
    EXPECT_FALSE(session.outbound.finished());
    EXPECT_EQ(session.handle->mailbox().size(), 3u);

    session.sink.busy = false;
    EXPECT_EQ(session.outbound.drain(), PumpStatus::Idle);
    ASSERT_EQ(session.sink.sent.size(), 3u);
    EXPECT_EQ(session.sink.sent[2], ChatMessage("Server : three", "Server"));
}

TEST(Pumps, BusySinkHoldsBackTheEndOfStream) {
    ConnectionRegistry registry;
    SessionFixture session(registry);
    session.sink.busy = true;

    EXPECT_TRUE(session.inbound.onMessage(ChatMessage{"last", "Client"}));
    session.inbound.onEndOfStream();
    EXPECT_EQ(session.outbound.drain(), PumpStatus::Blocked);
    EXPECT_EQ(session.sink.finished, 0);
    EXPECT_EQ(registry.size(), 1u);

    session.sink.busy = false;
    EXPECT_EQ(session.outbound.drain(), PumpStatus::Finished);
    ASSERT_EQ(session.sink.sent.size(), 1u);
    EXPECT_EQ(session.sink.finished, 1);
    EXPECT_EQ(registry.size(), 0u);
}

TEST(Pumps, StatusNames) {
    EXPECT_STREQ(toString(PumpStatus::Idle), "idle");
    EXPECT_STREQ(toString(PumpStatus::Blocked), "blocked");
    EXPECT_STREQ(toString(PumpStatus::Finished), "finished");
    EXPECT_STREQ(toString(PumpStatus::Faulted), "faulted");
}

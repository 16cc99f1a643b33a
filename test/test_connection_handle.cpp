#include <gtest/gtest.h>
#include "shared/ConnectionHandle.h"

using namespace duplex;

TEST(ConnectionHandle, StartsOpen) {
    ConnectionHandle handle(qb::uuid::generate_random_uuid(), qb::ActorId(), 8);
    EXPECT_EQ(handle.state(), ConnectionState::Open);
    EXPECT_EQ(handle.mailbox().capacity(), 8u);
    EXPECT_FALSE(handle.mailbox().closed());
    EXPECT_FALSE(handle.inboundFinished());
    EXPECT_FALSE(handle.outboundFinished());
}

TEST(ConnectionHandle, RequestCloseMovesToClosing) {
    ConnectionHandle handle(qb::uuid::generate_random_uuid(), qb::ActorId());
    EXPECT_TRUE(handle.requestClose());
    EXPECT_FALSE(handle.requestClose());
    EXPECT_EQ(handle.state(), ConnectionState::Closing);
    EXPECT_TRUE(handle.mailbox().closed());
    EXPECT_EQ(handle.enqueue(ChatMessage{"late", "Server"}), EnqueueResult::Closed);
}

TEST(ConnectionHandle, ClosedOnlyAfterBothHalvesFinish) {
    ConnectionHandle handle(qb::uuid::generate_random_uuid(), qb::ActorId());

    handle.markInboundFinished();
    EXPECT_EQ(handle.state(), ConnectionState::Closing);
    EXPECT_TRUE(handle.mailbox().closed());

    // Repeated notification of the same half does not count twice
    handle.markInboundFinished();
    EXPECT_EQ(handle.state(), ConnectionState::Closing);

    handle.markOutboundFinished();
    EXPECT_EQ(handle.state(), ConnectionState::Closed);
    EXPECT_TRUE(handle.inboundFinished());
    EXPECT_TRUE(handle.outboundFinished());
}

TEST(ConnectionHandle, StateNeverMovesBackwards) {
    ConnectionHandle handle(qb::uuid::generate_random_uuid(), qb::ActorId());
    handle.markOutboundFinished();
    handle.markInboundFinished();
    ASSERT_EQ(handle.state(), ConnectionState::Closed);

    handle.requestClose();
    EXPECT_EQ(handle.state(), ConnectionState::Closed);
}

TEST(ConnectionHandle, StateNames) {
    EXPECT_STREQ(toString(ConnectionState::Open), "Open");
    EXPECT_STREQ(toString(ConnectionState::Closing), "Closing");
    EXPECT_STREQ(toString(ConnectionState::Closed), "Closed");
}

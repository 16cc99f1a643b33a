#include <gtest/gtest.h>
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>
#include "shared/ConnectionRegistry.h"

using namespace duplex;

TEST(ConnectionRegistry, StartSessionRegistersAnOpenHandle) {
    ConnectionRegistry registry;
    auto handle = registry.startSession(qb::ActorId());

    ASSERT_NE(handle, nullptr);
    EXPECT_EQ(handle->state(), ConnectionState::Open);
    EXPECT_EQ(handle->mailbox().capacity(), registry.mailboxCapacity());
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.lookup(handle->id()), handle);
}

TEST(ConnectionRegistry, SessionIdsAreUnique) {
    ConnectionRegistry registry;
    auto a = registry.startSession(qb::ActorId());
    auto b = registry.startSession(qb::ActorId());
    EXPECT_NE(a->id(), b->id());
    EXPECT_EQ(registry.size(), 2u);
    EXPECT_EQ(registry.connections().size(), 2u);
}

TEST(ConnectionRegistry, DeregisteringAnAbsentIdIsANoOp) {
    ConnectionRegistry registry;
    auto handle = registry.startSession(qb::ActorId());

    EXPECT_FALSE(registry.deregisterConnection(qb::uuid::generate_random_uuid()));
    EXPECT_EQ(registry.size(), 1u);

    EXPECT_TRUE(registry.deregisterConnection(handle->id()));
    EXPECT_FALSE(registry.deregisterConnection(handle->id()));
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(registry.lookup(handle->id()), nullptr);
}

TEST(ConnectionRegistry, RejectsNullHandlesAndZeroCapacity) {
    ConnectionRegistry registry;
    EXPECT_THROW(registry.registerConnection(nullptr), std::invalid_argument);
    EXPECT_THROW(ConnectionRegistry(0), std::invalid_argument);
}

TEST(ConnectionRegistry, BroadcastReachesEveryMember) {
    ConnectionRegistry registry;
    auto a = registry.startSession(qb::ActorId());
    auto b = registry.startSession(qb::ActorId());

    const auto report = registry.broadcast(ChatMessage{"update", "Server Admin"});
    EXPECT_EQ(report.targets, 2u);
    EXPECT_EQ(report.delivered, 2u);
    EXPECT_EQ(report.dropped, 0u);
    EXPECT_EQ(report.gone, 0u);
    // Both sessions share the same owner actor, it is woken once
    EXPECT_EQ(report.owners.size(), 1u);

    for (const auto& handle : {a, b}) {
        ChatMessage out;
        ASSERT_EQ(handle->mailbox().pop(out), DequeueResult::Message);
        EXPECT_EQ(out, ChatMessage("update", "Server Admin"));
        EXPECT_EQ(handle->mailbox().pop(out), DequeueResult::Empty);
    }
}

TEST(ConnectionRegistry, BroadcastToEmptyRegistryDoesNothing) {
    ConnectionRegistry registry;
    const auto report = registry.broadcast(ChatMessage{"update", "Server Admin"});
    EXPECT_EQ(report.targets, 0u);
    EXPECT_EQ(report.delivered, 0u);
    EXPECT_TRUE(report.owners.empty());
}

TEST(ConnectionRegistry, FullOrClosingMembersDoNotAffectOthers) {
    ConnectionRegistry registry(2);
    auto full = registry.startSession(qb::ActorId());
    auto closing = registry.startSession(qb::ActorId());
    auto healthy = registry.startSession(qb::ActorId());

    full->enqueue(ChatMessage{"1", "Server"});
    full->enqueue(ChatMessage{"2", "Server"});
    closing->requestClose();

    const auto report = registry.broadcast(ChatMessage{"update", "Server Admin"});
    EXPECT_EQ(report.targets, 3u);
    EXPECT_EQ(report.delivered, 1u);
    EXPECT_EQ(report.dropped, 1u);
    EXPECT_EQ(report.gone, 1u);
    EXPECT_EQ(healthy->mailbox().size(), 1u);
    EXPECT_EQ(full->mailbox().size(), 2u);
}

TEST(ConnectionRegistry, ShutdownSessionClosesTheMailbox) {
    ConnectionRegistry registry;
    auto handle = registry.startSession(qb::ActorId());

    const auto owner = registry.shutdownSession(handle->id());
    ASSERT_TRUE(owner.has_value());
    EXPECT_EQ(*owner, qb::ActorId());
    EXPECT_TRUE(handle->mailbox().closed());
    EXPECT_EQ(handle->state(), ConnectionState::Closing);
    // Stays a member until its outbound pump has written end-of-stream
    EXPECT_EQ(registry.size(), 1u);

    EXPECT_FALSE(registry.shutdownSession(qb::uuid::generate_random_uuid()).has_value());
}

TEST(ConnectionRegistry, BroadcastConcurrentWithDeregistration) {
    constexpr int CONNECTIONS = 16;
    constexpr int ROUNDS = 500;
    ConnectionRegistry registry(ROUNDS);

    std::vector<std::shared_ptr<ConnectionHandle>> handles;
    for (int i = 0; i < CONNECTIONS; ++i) {
        handles.push_back(registry.startSession(qb::ActorId()));
    }

    std::atomic<bool> failed{false};
    std::thread broadcaster([&] {
        try {
            for (int round = 0; round < ROUNDS; ++round) {
                registry.broadcast(ChatMessage{std::to_string(round), "Server Admin"});
            }
        } catch (const std::exception&) {
            failed = true;
        }
    });
    std::thread remover([&] {
        for (const auto& handle : handles) {
            handle->requestClose();
            registry.deregisterConnection(handle->id());
            std::this_thread::yield();
        }
    });
    broadcaster.join();
    remover.join();

    EXPECT_FALSE(failed);
    EXPECT_EQ(registry.size(), 0u);

    // Whatever each connection got is an in-order prefix of the broadcasts
    for (const auto& handle : handles) {
        ChatMessage out;
        int expected = 0;
        while (handle->mailbox().pop(out) == DequeueResult::Message) {
            EXPECT_EQ(out.message, std::to_string(expected));
            ++expected;
        }
        EXPECT_LE(expected, ROUNDS);
    }
}

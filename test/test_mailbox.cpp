#include <gtest/gtest.h>
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>
#include "shared/Mailbox.h"

using namespace duplex;

TEST(Mailbox, DeliversInEnqueueOrder) {
    Mailbox mailbox;
    for (int i = 0; i < 5; ++i) {
        ASSERT_EQ(mailbox.push(ChatMessage{"m" + std::to_string(i), "Server"}), EnqueueResult::Enqueued);
    }

    ChatMessage out;
    for (int i = 0; i < 5; ++i) {
        ASSERT_EQ(mailbox.pop(out), DequeueResult::Message);
        EXPECT_EQ(out.message, "m" + std::to_string(i));
    }
    EXPECT_EQ(mailbox.pop(out), DequeueResult::Empty);
}

TEST(Mailbox, DropsNewestWhenFull) {
    Mailbox mailbox;
    ASSERT_EQ(mailbox.capacity(), 128u);
    for (int i = 0; i < 128; ++i) {
        ASSERT_EQ(mailbox.push(ChatMessage{std::to_string(i), "Server"}), EnqueueResult::Enqueued);
    }

    EXPECT_EQ(mailbox.push(ChatMessage{"overflow", "Server"}), EnqueueResult::Dropped);
    EXPECT_EQ(mailbox.size(), 128u);
    EXPECT_EQ(mailbox.dropped(), 1u);

    ChatMessage out;
    std::size_t count = 0;
    while (mailbox.pop(out) == DequeueResult::Message) {
        EXPECT_EQ(out.message, std::to_string(count));
        ++count;
    }
    EXPECT_EQ(count, 128u);
}

TEST(Mailbox, CloseKeepsQueuedMessagesDeliverable) {
    Mailbox mailbox(4);
    mailbox.push(ChatMessage{"a", "Server"});
    mailbox.push(ChatMessage{"b", "Server"});

    EXPECT_TRUE(mailbox.close());
    EXPECT_FALSE(mailbox.close());
    EXPECT_TRUE(mailbox.closed());
    EXPECT_EQ(mailbox.push(ChatMessage{"c", "Server"}), EnqueueResult::Closed);

    ChatMessage out;
    ASSERT_EQ(mailbox.pop(out), DequeueResult::Message);
    EXPECT_EQ(out.message, "a");
    ASSERT_EQ(mailbox.pop(out), DequeueResult::Message);
    EXPECT_EQ(out.message, "b");
    EXPECT_EQ(mailbox.pop(out), DequeueResult::Closed);
    EXPECT_EQ(mailbox.pop(out), DequeueResult::Closed);
}

TEST(Mailbox, RejectsZeroCapacity) {
    EXPECT_THROW(Mailbox(0), std::invalid_argument);
}

TEST(Mailbox, ConcurrentProducersNeverBlock) {
    Mailbox mailbox;
    std::atomic<std::size_t> enqueued{0};
    std::atomic<std::size_t> dropped{0};

    std::vector<std::thread> producers;
    for (int p = 0; p < 4; ++p) {
        producers.emplace_back([&] {
            for (int i = 0; i < 100; ++i) {
                if (mailbox.push(ChatMessage{"x", "Server"}) == EnqueueResult::Enqueued)
                    ++enqueued;
                else
                    ++dropped;
            }
        });
    }
    for (auto& t : producers) t.join();

    EXPECT_EQ(enqueued + dropped, 400u);
    EXPECT_EQ(enqueued.load(), 128u);
    EXPECT_EQ(mailbox.dropped(), dropped.load());
}

/**
 * @file test_bounded_queue.cpp
 * @brief Unit tests for BoundedQueue
 */

#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>
#include "ragd/ipc/bounded_queue.h"

// ============================================================================
// Basic behavior
// ============================================================================

TEST(BoundedQueueTest, PopsInPushOrder) {
    ragd::BoundedQueue<int> queue(4);
    queue.push(1);
    queue.push(2);
    queue.push(3);

    EXPECT_EQ(queue.size(), 3u);
    EXPECT_EQ(*queue.pop(), 1);
    EXPECT_EQ(*queue.pop(), 2);
    EXPECT_EQ(*queue.pop(), 3);
}

TEST(BoundedQueueTest, ZeroCapacityBecomesOne) {
    ragd::BoundedQueue<int> queue(0);
    EXPECT_EQ(queue.capacity(), 1u);
}

TEST(BoundedQueueTest, CloseDrainsRemainingItems) {
    ragd::BoundedQueue<int> queue(4);
    queue.push(7);
    queue.close();

    EXPECT_FALSE(queue.push(8));
    auto item = queue.pop();
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(*item, 7);
    EXPECT_FALSE(queue.pop().has_value());
}

// ============================================================================
// Blocking
// ============================================================================

TEST(BoundedQueueTest, PushBlocksWhileFull) {
    ragd::BoundedQueue<int> queue(1);
    queue.push(1);

    std::atomic<bool> pushed{false};
    std::thread producer([&]() {
        queue.push(2);
        pushed = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(pushed.load());

    EXPECT_EQ(*queue.pop(), 1);
    producer.join();
    EXPECT_TRUE(pushed.load());
    EXPECT_EQ(*queue.pop(), 2);
}

TEST(BoundedQueueTest, CloseWakesBlockedConsumer) {
    ragd::BoundedQueue<int> queue(1);
    std::optional<int> result = 42;

    std::thread consumer([&]() { result = queue.pop(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.close();
    consumer.join();

    EXPECT_FALSE(result.has_value());
}

TEST(BoundedQueueTest, ProducersAndConsumerSeeEveryItem) {
    ragd::BoundedQueue<int> queue(2);
    const int per_producer = 200;

    std::vector<std::thread> producers;
    for (int p = 0; p < 3; ++p) {
        producers.emplace_back([&queue, per_producer]() {
            for (int i = 0; i < per_producer; ++i) {
                queue.push(1);
            }
        });
    }

    int total = 0;
    std::thread consumer([&]() {
        while (auto item = queue.pop()) {
            total += *item;
        }
    });

    for (auto& t : producers) {
        t.join();
    }
    queue.close();
    consumer.join();

    EXPECT_EQ(total, 3 * per_producer);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

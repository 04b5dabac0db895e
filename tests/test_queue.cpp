#include <gtest/gtest.h>
#include "voxelforge/core/queue.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using namespace voxelforge;

// ============================================================================
// Basic queue operations
// ============================================================================

TEST(QueueTest, EmptyQueue) {
    Queue<int> queue;
    EXPECT_TRUE(queue.empty());
    EXPECT_EQ(queue.size(), 0u);
    EXPECT_FALSE(queue.tryPop().has_value());
}

TEST(QueueTest, FIFOOrder) {
    Queue<int> queue;
    EXPECT_TRUE(queue.push(1));
    EXPECT_TRUE(queue.push(2));
    EXPECT_TRUE(queue.push(3));
    EXPECT_EQ(queue.size(), 3u);

    EXPECT_EQ(*queue.tryPop(), 1);
    EXPECT_EQ(*queue.tryPop(), 2);
    EXPECT_EQ(*queue.tryPop(), 3);
    EXPECT_TRUE(queue.empty());
}

TEST(QueueTest, MoveOnlyItems) {
    Queue<std::unique_ptr<int>> queue;
    queue.push(std::make_unique<int>(42));

    auto item = queue.tryPop();
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(**item, 42);
}

TEST(QueueTest, DrainAll) {
    Queue<int> queue;
    for (int i = 0; i < 5; ++i) {
        queue.push(i);
    }

    auto items = queue.drainAll();
    ASSERT_EQ(items.size(), 5u);
    EXPECT_EQ(items.front(), 0);
    EXPECT_EQ(items.back(), 4);
    EXPECT_TRUE(queue.empty());
}

// ============================================================================
// Shutdown
// ============================================================================

TEST(QueueTest, ShutdownRefusesPushButKeepsItems) {
    Queue<int> queue;
    queue.push(7);
    queue.shutdown();

    EXPECT_TRUE(queue.isShutdown());
    EXPECT_FALSE(queue.push(8));
    EXPECT_EQ(queue.size(), 1u);

    // Drains what was queued before shutdown
    EXPECT_TRUE(queue.waitForWork());
    EXPECT_EQ(*queue.tryPop(), 7);
    EXPECT_FALSE(queue.waitForWork());
}

TEST(QueueTest, ResetShutdown) {
    Queue<int> queue;
    queue.shutdown();
    queue.resetShutdown();

    EXPECT_FALSE(queue.isShutdown());
    EXPECT_TRUE(queue.push(1));
}

// ============================================================================
// Blocking behavior
// ============================================================================

TEST(QueueTest, PushWakesWaiter) {
    Queue<int> queue;
    std::atomic<bool> woke{false};

    std::thread waiter([&]() {
        if (queue.waitForWork()) {
            woke = true;
        }
    });

    // Give waiter time to block
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_FALSE(woke);

    queue.push(1);
    waiter.join();
    EXPECT_TRUE(woke);
}

TEST(QueueTest, ShutdownWakesWaiterAndReturnsFalse) {
    Queue<int> queue;
    std::atomic<bool> result{true};

    std::thread waiter([&]() {
        result = queue.waitForWork();
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.shutdown();
    waiter.join();

    EXPECT_FALSE(result);
}

TEST(QueueTest, ConcurrentProducersConsumers) {
    Queue<int> queue;
    constexpr int PER_PRODUCER = 500;
    std::atomic<int> consumed{0};
    std::atomic<long> sum{0};

    std::vector<std::thread> consumers;
    for (int c = 0; c < 3; ++c) {
        consumers.emplace_back([&]() {
            while (true) {
                if (auto item = queue.tryPop()) {
                    sum += *item;
                    ++consumed;
                    continue;
                }
                if (!queue.waitForWork()) break;
            }
        });
    }

    std::vector<std::thread> producers;
    for (int p = 0; p < 2; ++p) {
        producers.emplace_back([&]() {
            for (int i = 1; i <= PER_PRODUCER; ++i) {
                queue.push(i);
            }
        });
    }
    for (auto& t : producers) t.join();

    queue.shutdown();
    for (auto& t : consumers) t.join();

    EXPECT_EQ(consumed.load(), 2 * PER_PRODUCER);
    EXPECT_EQ(sum.load(), 2L * PER_PRODUCER * (PER_PRODUCER + 1) / 2);
}

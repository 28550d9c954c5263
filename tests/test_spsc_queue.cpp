/**
 * @file test_spsc_queue.cpp
 * @brief Unit tests for the SPSC semaphore queue feeding each shard
 */

#include <gtest/gtest.h>

#include <cpe/concurrency/spsc_semaphore_queue.hpp>
#include <cpe/engine/event.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <thread>

using namespace cpe;

TEST(SpscQueueTest, BasicOperations) {
    SpscSemaphoreQueue<int, 16> queue;

    int value = 0;
    EXPECT_FALSE(queue.try_pop(value));  // Empty

    EXPECT_TRUE(queue.try_push(42));
    EXPECT_TRUE(queue.try_pop(value));
    EXPECT_EQ(value, 42);
}

TEST(SpscQueueTest, BlockingPushPopKeepsOrder) {
    SpscSemaphoreQueue<int, 8> queue;

    queue.push(1);
    queue.push(2);
    queue.push(3);

    EXPECT_EQ(queue.pop(), 1);
    EXPECT_EQ(queue.pop(), 2);
    EXPECT_EQ(queue.pop(), 3);
}

TEST(SpscQueueTest, TryPushFailsWhenFull) {
    SpscSemaphoreQueue<int, 4> queue;

    for (int i = 0; i < 4; ++i) {
        EXPECT_TRUE(queue.try_push(i));
    }
    EXPECT_FALSE(queue.try_push(99));
    EXPECT_FALSE(queue.try_push_for(99, std::chrono::milliseconds(5)));

    int value = -1;
    EXPECT_TRUE(queue.try_pop(value));
    EXPECT_EQ(value, 0);
    EXPECT_TRUE(queue.try_push(99));
}

TEST(SpscQueueTest, ConcurrentProducerConsumer) {
    constexpr std::uint64_t NUM_ITEMS = 10000;
    SpscSemaphoreQueue<std::uint64_t, 256> queue;

    std::uint64_t sum_consumed = 0;
    bool in_order = true;

    std::thread producer([&]() {
        for (std::uint64_t i = 1; i <= NUM_ITEMS; ++i) {
            queue.push(i);
        }
    });

    std::thread consumer([&]() {
        std::uint64_t expected = 1;
        while (expected <= NUM_ITEMS) {
            std::uint64_t value = queue.pop();
            in_order = in_order && value == expected;
            sum_consumed += value;
            ++expected;
        }
    });

    producer.join();
    consumer.join();

    EXPECT_TRUE(in_order);
    EXPECT_EQ(sum_consumed, NUM_ITEMS * (NUM_ITEMS + 1) / 2);
}

TEST(SpscQueueTest, Timeout) {
    SpscSemaphoreQueue<int, 8> queue;

    int value;
    auto start = std::chrono::steady_clock::now();
    bool result = queue.try_pop_for(value, std::chrono::milliseconds(50));
    auto end = std::chrono::steady_clock::now();

    EXPECT_FALSE(result);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
    EXPECT_GE(elapsed.count(), 40);
}

TEST(SpscQueueTest, CarriesEvents) {
    SpscSemaphoreQueue<Event, 16> queue;

    Event deposit = Event::deposit(ClientId{7}, TxId{1}, Amount::from_ticks(12'345));
    Event dispute = Event::dispute(ClientId{7}, TxId{1});
    queue.push(deposit);
    queue.push(dispute);

    EXPECT_EQ(queue.pop(), deposit);
    Event out;
    queue.pop(out);
    EXPECT_EQ(out, dispute);
    EXPECT_FALSE(out.amount.has_value());
}

TEST(SpscQueueTest, SizeApprox) {
    SpscSemaphoreQueue<int, 16> queue;

    EXPECT_EQ(queue.size_approx(), 0);
    EXPECT_TRUE(queue.empty_approx());
    EXPECT_EQ(queue.capacity(), 16);

    queue.push(1);
    queue.push(2);
    queue.push(3);

    EXPECT_EQ(queue.size_approx(), 3);
    EXPECT_FALSE(queue.empty_approx());

    int value;
    EXPECT_TRUE(queue.try_pop(value));
    EXPECT_EQ(queue.size_approx(), 2);
}

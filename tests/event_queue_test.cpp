#include <gtest/gtest.h>
#include "event_queue.hpp"
#include <chrono>
#include <string>
#include <thread>

using networking::EventQueue;

TEST(EventQueueTest, PopsInPushOrder) {
    EventQueue<int> queue(8);
    queue.push(1);
    queue.push(2);
    queue.push(3);

    EXPECT_EQ(queue.size(), 3u);
    EXPECT_EQ(queue.try_pop(), 1);
    EXPECT_EQ(queue.try_pop(), 2);
    EXPECT_EQ(queue.try_pop(), 3);
    EXPECT_FALSE(queue.try_pop().has_value());
}

TEST(EventQueueTest, FullQueueDropsOldest) {
    EventQueue<std::string> queue(2);
    queue.push("progress 1");
    queue.push("progress 2");
    queue.push("done");

    EXPECT_EQ(queue.size(), 2u);
    EXPECT_EQ(queue.dropped(), 1u);
    EXPECT_EQ(queue.try_pop(), "progress 2");
    EXPECT_EQ(queue.try_pop(), "done");
}

TEST(EventQueueTest, ZeroCapacityStillHoldsOne) {
    EventQueue<int> queue(0);
    queue.push(7);
    queue.push(8);
    EXPECT_EQ(queue.try_pop(), 8);
}

TEST(EventQueueTest, WaitPopTimesOut) {
    EventQueue<int> queue(4);
    auto start = std::chrono::steady_clock::now();

    EXPECT_FALSE(queue.wait_pop(std::chrono::milliseconds(50)).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(40));
}

TEST(EventQueueTest, WaitPopReceivesFromAnotherThread) {
    EventQueue<int> queue(4);
    std::thread producer([&queue]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        queue.push(42);
    });

    auto value = queue.wait_pop(std::chrono::seconds(5));
    producer.join();
    EXPECT_EQ(value, 42);
}

TEST(EventQueueTest, CloseDrainsThenEnds) {
    EventQueue<int> queue(4);
    queue.push(1);
    queue.close();
    queue.push(2);

    EXPECT_TRUE(queue.closed());
    EXPECT_EQ(queue.wait_pop(std::chrono::seconds(5)), 1);
    EXPECT_FALSE(queue.wait_pop(std::chrono::seconds(5)).has_value());
}

TEST(EventQueueTest, CloseWakesWaiter) {
    EventQueue<int> queue(4);
    std::thread closer([&queue]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        queue.close();
    });

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(queue.wait_pop(std::chrono::seconds(10)).has_value());
    closer.join();
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}

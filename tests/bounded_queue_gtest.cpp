// GoogleTest unit tests for BoundedQueue and Deadline
#include "BoundedQueue.hpp"
#include "Deadline.hpp"
#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>

using namespace speedwire;
using namespace std::chrono_literals;

TEST(BoundedQueueTest, TryPushDropsNewestWhenFull)
{
    BoundedQueue<int> q(2);
    EXPECT_TRUE(q.try_push(1));
    EXPECT_TRUE(q.try_push(2));
    EXPECT_FALSE(q.try_push(3));
    EXPECT_EQ(q.size(), 2u);

    EXPECT_EQ(q.try_pop(), 1);
    EXPECT_EQ(q.try_pop(), 2);
    EXPECT_FALSE(q.try_pop().has_value());
}

TEST(BoundedQueueTest, ZeroCapacityHoldsOne)
{
    BoundedQueue<int> q(0);
    EXPECT_EQ(q.capacity(), 1u);
    EXPECT_TRUE(q.try_push(7));
    EXPECT_FALSE(q.try_push(8));
}

TEST(BoundedQueueTest, CloseDrainsThenEnds)
{
    BoundedQueue<std::string> q(4);
    q.try_push("a");
    q.close();
    EXPECT_FALSE(q.try_push("b"));
    EXPECT_FALSE(q.push("c"));
    EXPECT_EQ(q.pop(), "a");
    EXPECT_FALSE(q.pop().has_value());
    EXPECT_TRUE(q.closed());
}

TEST(BoundedQueueTest, PushBlocksUntilRoom)
{
    BoundedQueue<int> q(1);
    q.try_push(1);

    std::thread producer([&q] { EXPECT_TRUE(q.push(2)); });
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(q.size(), 1u);

    EXPECT_EQ(q.pop(), 1);
    producer.join();
    EXPECT_EQ(q.pop(), 2);
}

TEST(BoundedQueueTest, CloseWakesBlockedConsumer)
{
    BoundedQueue<int> q(1);
    std::thread consumer([&q] { EXPECT_FALSE(q.pop().has_value()); });
    std::this_thread::sleep_for(20ms);
    q.close();
    consumer.join();
}

TEST(BoundedQueueTest, PopForTimesOut)
{
    BoundedQueue<int> q(1);
    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(q.pop_for(50ms).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 45ms);
}

TEST(DeadlineTest, ExpiresAfterTimeout)
{
    Deadline d(80ms);
    EXPECT_FALSE(d.expired());
    EXPECT_FALSE(d.wait_for(10ms));
    d.wait();
    EXPECT_TRUE(d.expired());
    EXPECT_EQ(d.remaining(), Deadline::Clock::duration::zero());
}

TEST(DeadlineTest, WaitForNeverOversleepsDeadline)
{
    Deadline d(50ms);
    const auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(d.wait_for(5s));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
}

TEST(DeadlineTest, CancelWakesWaiters)
{
    Deadline d(10s);
    std::thread canceller([&d] {
        std::this_thread::sleep_for(30ms);
        d.cancel();
    });
    const auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(d.wait_for(5s));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
    EXPECT_TRUE(d.cancelled());
    EXPECT_TRUE(d.expired());
    canceller.join();
}

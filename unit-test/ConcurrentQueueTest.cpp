#include <atomic>
#include <chrono>
#include <thread>
#include "arbiter/common/concurrent_queue.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace arbiter;

TEST(ConcurrentQueueTest, FirstInFirstOut) {
    concurrent_queue<int> q;
    EXPECT_TRUE(q.push(1));
    EXPECT_TRUE(q.push(2));
    EXPECT_EQ(2, q.size());
    EXPECT_EQ(1, q.pop());
    int value = 0;
    EXPECT_TRUE(q.try_pop(value));
    EXPECT_EQ(2, value);
    EXPECT_FALSE(q.try_pop(value));
}

TEST(ConcurrentQueueTest, PushBlocksWhenFull) {
    concurrent_queue<int> q(1);
    EXPECT_TRUE(q.push(1));

    atomic<bool> pushed(false);
    thread producer([&] {
        q.push(2);
        pushed = true;
    });

    this_thread::sleep_for(chrono::milliseconds(100));
    EXPECT_FALSE(pushed);
    EXPECT_EQ(1, q.pop());
    producer.join();
    EXPECT_TRUE(pushed);
    EXPECT_EQ(2, q.pop());
}

TEST(ConcurrentQueueTest, CloseDrainsRemainingElements) {
    concurrent_queue<unique_ptr<int>> q;
    q.push(make_unique<int>(1));
    q.close();
    EXPECT_FALSE(q.push(make_unique<int>(2)));

    auto first = q.pop();
    ASSERT_TRUE(first);
    EXPECT_EQ(1, **first);
    EXPECT_FALSE(q.pop());
}

TEST(ConcurrentQueueTest, CloseWakesConsumers) {
    concurrent_queue<int> q;
    thread consumer([&] { EXPECT_FALSE(q.pop()); });
    this_thread::sleep_for(chrono::milliseconds(50));
    q.close();
    consumer.join();
}

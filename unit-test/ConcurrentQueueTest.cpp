#include <thread>
#include <vector>
#include "common/cancellation.hpp"
#include "common/concurrent_queue.hpp"
#include "common/defer.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace streamjudge;

TEST(ConcurrentQueueTest, DrainsBeforeClosing) {
    concurrent_queue<int> q;
    EXPECT_TRUE(q.push(1));
    EXPECT_TRUE(q.push(2));
    q.close();
    EXPECT_FALSE(q.push(3));
    EXPECT_TRUE(q.closed());
    EXPECT_EQ(1, q.pop().value_or(-1));
    EXPECT_EQ(2, q.pop().value_or(-1));
    EXPECT_FALSE(q.pop().has_value());
}

TEST(ConcurrentQueueTest, ClearDropsPendingItems) {
    concurrent_queue<int> q;
    q.push(1);
    q.close();
    q.clear();
    EXPECT_FALSE(q.pop().has_value());
}

TEST(ConcurrentQueueTest, TimedPop) {
    concurrent_queue<int> q;
    EXPECT_FALSE(q.pop_for(chrono::milliseconds(10)).has_value());
    EXPECT_FALSE(q.drained());
    q.push(1);
    q.close();
    EXPECT_FALSE(q.drained());
    EXPECT_EQ(1, q.pop_for(chrono::milliseconds(10)).value_or(-1));
    EXPECT_TRUE(q.drained());
}

TEST(ConcurrentQueueTest, CloseWakesReader) {
    concurrent_queue<int> q;
    thread reader([&] { EXPECT_FALSE(q.pop().has_value()); });
    this_thread::sleep_for(chrono::milliseconds(50));
    q.close();
    reader.join();
}

TEST(ConcurrentQueueTest, ManyWriters) {
    concurrent_queue<int> q;
    vector<thread> writers;
    for (int i = 0; i < 8; ++i)
        writers.emplace_back([&q, i] {
            for (int j = 0; j < 100; ++j) q.push(i * 100 + j);
        });
    for (auto &writer : writers) writer.join();
    q.close();

    vector<bool> seen(800, false);
    int count = 0;
    while (auto value = q.pop()) {
        EXPECT_FALSE(seen[*value]);
        seen[*value] = true;
        ++count;
    }
    EXPECT_EQ(800, count);
}

TEST(CancellationTokenTest, CopiesShareFlag) {
    cancellation_token token;
    cancellation_token copy = token;
    EXPECT_FALSE(copy.cancelled());
    token.cancel();
    EXPECT_TRUE(copy.cancelled());
    EXPECT_FALSE(cancellation_token().cancelled());
}

TEST(DeferTest, RunsOnScopeExit) {
    int count = 0;
    {
        defer { ++count; };
        EXPECT_EQ(0, count);
    }
    EXPECT_EQ(1, count);
}

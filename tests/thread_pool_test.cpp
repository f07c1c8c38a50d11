#include <gtest/gtest.h>

#include <atomic>
#include <vector>

#include "thread_pool.h"

TEST(ThreadPoolTest, RunsEveryTaskAndReturnsResults) {
    ThreadPool pool(4);
    std::vector<std::future<int>> futures;
    for (int i = 0; i < 50; ++i) {
        futures.push_back(pool.enqueue([i]() { return i * i; }));
    }

    for (int i = 0; i < 50; ++i) {
        EXPECT_EQ(futures[i].get(), i * i);
    }
}

TEST(ThreadPoolTest, ExceptionsReachTheCaller) {
    ThreadPool pool(2);
    auto future = pool.enqueue([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST(ThreadPoolTest, DestructorDrainsQueuedTasks) {
    std::atomic<int> done(0);
    {
        ThreadPool pool(1);
        for (int i = 0; i < 20; ++i) {
            pool.enqueue([&done]() { done++; });
        }
    }
    EXPECT_EQ(done.load(), 20);
}

TEST(ThreadPoolTest, ZeroThreadsMeansOne) {
    ThreadPool pool(0);
    EXPECT_EQ(pool.size(), 1u);
    EXPECT_EQ(pool.enqueue([]() { return 7; }).get(), 7);
}

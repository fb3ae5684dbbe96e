/**
 * @file    task_pool_test.cpp
 * @brief   Worker pool and event queue
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "app/task_pool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <thread>

namespace loupe {
namespace {

TEST(TaskPoolTest, RunsEveryTaskBeforeShutdown) {
    std::atomic<int> done{0};
    {
        TaskPool pool(3);
        EXPECT_EQ(pool.worker_count(), 3u);
        for (int i = 0; i < 200; ++i) {
            pool.submit([&done] { done.fetch_add(1); });
        }
    }
    EXPECT_EQ(done.load(), 200);
}

TEST(TaskPoolTest, FailingTaskDoesNotKillWorker) {
    std::atomic<int> done{0};
    {
        TaskPool pool(1);
        pool.submit([] { throw std::runtime_error("boom"); });
        pool.submit([&done] { done.fetch_add(1); });
    }
    EXPECT_EQ(done.load(), 1);
}

TEST(TaskPoolTest, WorkerCountIsAtLeastOne) {
    TaskPool pool(0);
    EXPECT_EQ(pool.worker_count(), 1u);
    EXPECT_GE(TaskPool::default_worker_count(), 1u);
}

TEST(TaskPoolTest, EmptyTaskIsIgnored) {
    TaskPool pool(1);
    pool.submit(Task{});
    EXPECT_EQ(pool.pending(), 0u);
}

TEST(InlineExecutorTest, RunsImmediately) {
    InlineExecutor executor;
    int value = 0;
    executor.submit([&value] { value = 42; });
    EXPECT_EQ(value, 42);

    EXPECT_NO_THROW(executor.submit([] { throw std::runtime_error("contained"); }));
}

TEST(EventQueueTest, FifoOrder) {
    EventQueue<int> queue;
    EXPECT_TRUE(queue.empty());
    EXPECT_FALSE(queue.try_pop().has_value());

    queue.push(1);
    queue.push(2);
    EXPECT_FALSE(queue.empty());
    EXPECT_EQ(queue.try_pop(), 1);
    EXPECT_EQ(queue.try_pop(), 2);
    EXPECT_TRUE(queue.empty());
}

TEST(EventQueueTest, WorkersPublishToQueue) {
    EventQueue<int> queue;
    {
        TaskPool pool(4);
        for (int i = 0; i < 50; ++i) {
            pool.submit([&queue, i] { queue.push(i); });
        }
    }

    int count = 0;
    int sum = 0;
    while (auto value = queue.try_pop()) {
        ++count;
        sum += *value;
    }
    EXPECT_EQ(count, 50);
    EXPECT_EQ(sum, 49 * 50 / 2);
}

}  // anonymous namespace
}  // namespace loupe

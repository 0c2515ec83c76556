#include <algorithm>
#include <atomic>
#include <gtest/gtest.h>
#include <mutex>
#include <thread>
#include "../../src/engine/task/task_queue.hpp"

using namespace Harvest::Engine;

namespace {
Task make_task(TaskId id, int priority) {
    Task t;
    t.id       = id;
    t.priority = priority;
    t.type     = "news";
    t.url      = "http://example.com/" + std::to_string(id);
    return t;
}
}  // namespace

TEST(TaskQueueTest, HigherPriorityFirst) {
    TaskQueue queue;
    queue.push(make_task(0, 5));
    queue.push(make_task(1, 1));
    queue.push(make_task(2, 3));

    EXPECT_EQ(queue.pop()->priority, 5);
    EXPECT_EQ(queue.pop()->priority, 3);
    EXPECT_EQ(queue.pop()->priority, 1);
}

TEST(TaskQueueTest, TiesPopInIdOrder) {
    TaskQueue queue;
    queue.push_all({make_task(3, 2), make_task(1, 2), make_task(2, 2), make_task(0, 7)});

    EXPECT_EQ(queue.pop()->id, 0u);
    EXPECT_EQ(queue.pop()->id, 1u);
    EXPECT_EQ(queue.pop()->id, 2u);
    EXPECT_EQ(queue.pop()->id, 3u);
}

TEST(TaskQueueTest, NegativePriorities) {
    TaskQueue queue;
    queue.push(make_task(0, -10));
    queue.push(make_task(1, 0));
    queue.push(make_task(2, -1));

    EXPECT_EQ(queue.pop()->id, 1u);
    EXPECT_EQ(queue.pop()->id, 2u);
    EXPECT_EQ(queue.pop()->id, 0u);
}

TEST(TaskQueueTest, CloseWakesBlockedConsumers) {
    TaskQueue                queue;
    std::atomic<int>         woke{0};
    std::vector<std::thread> consumers;
    for (int i = 0; i < 4; ++i) {
        consumers.emplace_back([&]() {
            if (!queue.pop())
                ++woke;
        });
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    queue.close();
    for (auto& t : consumers)
        t.join();

    EXPECT_EQ(woke, 4);
    EXPECT_TRUE(queue.closed());
}

TEST(TaskQueueTest, ClosedQueueKeepsTasksForDrain) {
    TaskQueue queue;
    queue.push_all({make_task(0, 1), make_task(1, 9)});
    queue.close();

    EXPECT_FALSE(queue.pop().has_value());
    EXPECT_EQ(queue.size(), 2u);

    auto drained = queue.drain();
    ASSERT_EQ(drained.size(), 2u);
    EXPECT_EQ(drained[0].id, 1u);
    EXPECT_EQ(drained[1].id, 0u);
    EXPECT_TRUE(queue.empty());
}

TEST(TaskQueueTest, ConcurrentConsumersSeeEveryTaskOnce) {
    TaskQueue         queue;
    std::vector<Task> batch;
    for (TaskId i = 0; i < 500; ++i)
        batch.push_back(make_task(i, static_cast<int>(i % 7)));
    queue.push_all(std::move(batch));

    std::mutex               mutex;
    std::vector<TaskId>      seen;
    std::vector<std::thread> consumers;
    for (int i = 0; i < 8; ++i) {
        consumers.emplace_back([&]() {
            while (auto task = queue.pop()) {
                std::lock_guard<std::mutex> lock(mutex);
                seen.push_back(task->id);
            }
        });
    }
    while (!queue.empty())
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    queue.close();
    for (auto& t : consumers)
        t.join();

    std::sort(seen.begin(), seen.end());
    ASSERT_EQ(seen.size(), 500u);
    for (TaskId i = 0; i < 500; ++i)
        EXPECT_EQ(seen[i], i);
}

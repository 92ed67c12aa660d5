// ============================================================================
// ManualExecutor Tests
// ============================================================================

#include "colock/io/manual_executor.hpp"

#include "colock/core/task.hpp"

#include <functional>
#include <gtest/gtest.h>
#include <vector>

using namespace colock;

namespace {

Task<void> Record(std::vector<int>& order, int id) {
    order.push_back(id);
    co_return;
}

}  // namespace

TEST(ManualExecutorTest, StartsIdle) {
    ManualExecutor executor;
    EXPECT_FALSE(executor.IsRunning());
    EXPECT_EQ(executor.PendingTasks(), 0u);
    EXPECT_EQ(executor.RunUntilIdle(), 0u);
}

TEST(ManualExecutorTest, RunsInScheduleOrder) {
    ManualExecutor executor;
    std::vector<int> order;

    auto t1 = Record(order, 1);
    auto t2 = Record(order, 2);
    executor.Schedule(t1.GetHandle());
    executor.Post([&] { order.push_back(3); });
    executor.Schedule(t2.GetHandle());

    EXPECT_EQ(executor.RunUntilIdle(), 3u);
    EXPECT_EQ(order, (std::vector<int>{1, 3, 2}));
    EXPECT_TRUE(t1.IsDone());
    EXPECT_TRUE(t2.IsDone());
}

TEST(ManualExecutorTest, RunOnceLeavesNewWorkQueued) {
    ManualExecutor executor;
    std::vector<int> order;

    executor.Post([&] {
        order.push_back(1);
        executor.Post([&] { order.push_back(2); });
    });

    executor.RunOnce();
    EXPECT_EQ(order, (std::vector<int>{1}));
    EXPECT_EQ(executor.PendingTasks(), 1u);

    executor.RunOnce();
    EXPECT_EQ(order, (std::vector<int>{1, 2}));
}

TEST(ManualExecutorTest, RunUntilIdleDrainsFollowUps) {
    ManualExecutor executor;
    int depth = 0;

    std::function<void()> step = [&] {
        if (++depth < 5) {
            executor.Post(step);
        }
    };
    executor.Post(step);

    EXPECT_EQ(executor.RunUntilIdle(), 5u);
    EXPECT_EQ(depth, 5);
}

TEST(ManualExecutorTest, CurrentExecutorSetWhileRunning) {
    ManualExecutor executor;
    Executor* seen = nullptr;
    bool running = false;

    executor.Post([&] {
        seen = GetCurrentExecutor();
        running = executor.IsRunning();
    });
    executor.Run();

    EXPECT_EQ(seen, &executor);
    EXPECT_TRUE(running);
    EXPECT_EQ(GetCurrentExecutor(), nullptr);
}

TEST(ManualExecutorTest, StopEndsDrain) {
    ManualExecutor executor;
    int runs = 0;

    executor.Post([&] {
        ++runs;
        executor.Post([&] { ++runs; });
        executor.Stop();
    });

    executor.RunUntilIdle();
    EXPECT_EQ(runs, 1);
    EXPECT_EQ(executor.PendingTasks(), 1u);
}

TEST(ManualExecutorTest, NullWorkIgnored) {
    ManualExecutor executor;
    executor.Schedule(std::coroutine_handle<>{nullptr});
    executor.Post(nullptr);
    EXPECT_EQ(executor.PendingTasks(), 0u);
}

TEST(ExecutorGuardTest, RestoresPrevious) {
    ManualExecutor outer;
    ManualExecutor inner;

    EXPECT_EQ(GetCurrentExecutor(), nullptr);
    {
        ExecutorGuard g1(&outer);
        EXPECT_EQ(GetCurrentExecutor(), &outer);
        {
            ExecutorGuard g2(&inner);
            EXPECT_EQ(GetCurrentExecutor(), &inner);
        }
        EXPECT_EQ(GetCurrentExecutor(), &outer);
    }
    EXPECT_EQ(GetCurrentExecutor(), nullptr);
}

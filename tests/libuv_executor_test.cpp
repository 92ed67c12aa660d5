// ============================================================================
// LibuvExecutor Tests
// ============================================================================

#include "colock/io/libuv_executor.hpp"

#include "colock/core/spawn.hpp"
#include "colock/core/task.hpp"
#include "colock/sync/mutex.hpp"

#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <thread>

using namespace colock;
using namespace std::chrono_literals;

// ============================================================================
// Basic Executor Tests
// ============================================================================

TEST(LibuvExecutorTest, CreateAndDestroy) {
    auto executor_result = LibuvExecutor::Create();
    ASSERT_TRUE(executor_result.IsOk());
    auto& executor = *executor_result.Value();
    EXPECT_FALSE(executor.IsRunning());
    EXPECT_NE(executor.GetLoop(), nullptr);
}

TEST(LibuvExecutorTest, RunOnceEmpty) {
    auto executor_ptr = LibuvExecutor::Create().Value();
    executor_ptr->RunOnce();
    EXPECT_FALSE(executor_ptr->IsRunning());
}

TEST(LibuvExecutorTest, ScheduleAndRun) {
    auto executor_ptr = LibuvExecutor::Create().Value();
    auto& executor = *executor_ptr;
    bool executed = false;

    auto task = [&]() -> Task<void> {
        executed = true;
        executor.Stop();
        co_return;
    };

    auto t = task();
    executor.Schedule(t.GetHandle());
    executor.Run();

    EXPECT_TRUE(executed);
    EXPECT_FALSE(executor.IsRunning());
}

TEST(LibuvExecutorTest, PostCallback) {
    auto executor_ptr = LibuvExecutor::Create().Value();
    auto& executor = *executor_ptr;
    bool called = false;

    executor.Post([&]() {
        called = true;
        EXPECT_EQ(GetCurrentExecutor(), &executor);
        executor.Stop();
    });

    executor.Run();
    EXPECT_TRUE(called);
}

// ============================================================================
// Lock Waiters on the Loop
// ============================================================================

Task<void> IncrementThenStop(Mutex<int> mutex, Executor& executor, std::atomic<bool>& resumed_on_loop,
                             std::thread::id loop_thread) {
    auto guard = co_await mutex.Lock();
    ++*guard;
    resumed_on_loop = std::this_thread::get_id() == loop_thread;
    executor.Stop();
}

TEST(LibuvExecutorTest, WaiterResumesOnLoopThread) {
    auto executor_ptr = LibuvExecutor::Create().Value();
    auto& executor = *executor_ptr;
    Mutex<int> mutex(0);
    std::atomic<bool> resumed_on_loop{false};

    auto held = mutex.TryLock();
    ASSERT_TRUE(held.IsOk());

    Spawn(executor, IncrementThenStop(mutex, executor, resumed_on_loop, std::this_thread::get_id()));

    // Released from a foreign thread once the task has queued.
    std::thread releaser([&] {
        while (mutex.WaiterCount() == 0) {
            std::this_thread::sleep_for(1ms);
        }
        auto release = std::move(held).Value();
    });

    executor.Run();
    releaser.join();

    EXPECT_TRUE(resumed_on_loop.load());
    auto guard = mutex.TryLock();
    ASSERT_TRUE(guard.IsOk());
    EXPECT_EQ(*guard.Value(), 1);
}

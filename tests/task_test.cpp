// ============================================================================
// Task Unit Tests
// ============================================================================

#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "colock/core/task.hpp"
#include "colock/sync/sync_wait.hpp"

using namespace colock;

// ============================================================================
// Basic Task Tests
// ============================================================================

TEST(TaskTest, SimpleReturnValue) {
    auto task = []() -> Task<int> {
        co_return 42;
    };

    EXPECT_EQ(SyncWait(task()), 42);
}

TEST(TaskTest, VoidTask) {
    bool executed = false;
    auto task = [&]() -> Task<void> {
        executed = true;
        co_return;
    };

    SyncWait(task());
    EXPECT_TRUE(executed);
}

TEST(TaskTest, StringReturnValue) {
    auto task = []() -> Task<std::string> {
        co_return "hello colock";
    };

    EXPECT_EQ(SyncWait(task()), "hello colock");
}

TEST(TaskTest, MoveOnlyReturnValue) {
    auto task = []() -> Task<std::unique_ptr<int>> {
        co_return std::make_unique<int>(7);
    };

    auto value = SyncWait(task());
    ASSERT_NE(value, nullptr);
    EXPECT_EQ(*value, 7);
}

// ============================================================================
// Laziness
// ============================================================================

TEST(TaskTest, DoesNotStartUntilResumed) {
    bool started = false;
    auto make = [&]() -> Task<void> {
        started = true;
        co_return;
    };

    auto task = make();
    EXPECT_FALSE(started);
    EXPECT_FALSE(task.IsDone());

    task.GetHandle().resume();
    EXPECT_TRUE(started);
    EXPECT_TRUE(task.IsDone());
}

TEST(TaskTest, DestroyWithoutRunning) {
    bool started = false;
    {
        auto make = [&]() -> Task<void> {
            started = true;
            co_return;
        };
        auto task = make();
    }
    EXPECT_FALSE(started);
}

// ============================================================================
// Chained Coroutines
// ============================================================================

TEST(TaskTest, ChainedCoroutines) {
    auto inner = []() -> Task<int> {
        co_return 21;
    };

    auto outer = [&]() -> Task<int> {
        int value = co_await inner();
        co_return value * 2;
    };

    EXPECT_EQ(SyncWait(outer()), 42);
}

TEST(TaskTest, DeepChainUsesSymmetricTransfer) {
    // Recursion through co_await; symmetric transfer keeps the stack flat
    // on the way back up.
    struct Chain {
        static Task<int> Depth(int n) {
            if (n == 0) {
                co_return 0;
            }
            int below = co_await Depth(n - 1);
            co_return below + 1;
        }
    };

    EXPECT_EQ(SyncWait(Chain::Depth(1000)), 1000);
}

TEST(TaskTest, MoveAssignmentDestroysPreviousFrame) {
    int destroyed = 0;
    struct Tracker {
        int* count;
        ~Tracker() { ++*count; }
    };

    auto make = [](int* count) -> Task<void> {
        Tracker tracker{count};
        co_return;
    };

    auto a = make(&destroyed);
    auto b = make(&destroyed);
    a.GetHandle().resume();  // parks at final_suspend with the tracker gone
    EXPECT_EQ(destroyed, 1);

    a = std::move(b);  // destroys a's frame; b's was never started
    EXPECT_FALSE(a.IsDone());
}

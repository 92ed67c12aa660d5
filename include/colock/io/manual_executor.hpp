// ============================================================================
// colock/io/manual_executor.hpp - Caller-Driven Single-Threaded Executor
// ============================================================================
//
// ManualExecutor keeps a FIFO ready queue and runs it only when asked. No
// thread is created: whoever calls RunOnce()/RunUntilIdle() becomes the worker
// and the executor is installed as current for the duration.
//
// This gives lock tests a deterministic interleaving: a released guard
// schedules the next waiter here, and nothing runs until the test drains the
// queue.
//
// USAGE:
// ------
//   ManualExecutor executor;
//   Spawn(executor, Reader(lock));
//   Spawn(executor, Writer(lock));
//   executor.RunUntilIdle();
//
// ============================================================================

#pragma once

#include "colock/io/executor.hpp"

#include <atomic>
#include <coroutine>
#include <deque>
#include <functional>
#include <mutex>

namespace colock {

class ManualExecutor : public Executor {
   public:
    ManualExecutor() = default;
    ~ManualExecutor() override = default;

    ManualExecutor(const ManualExecutor&) = delete;
    ManualExecutor& operator=(const ManualExecutor&) = delete;

    // Drains the queue until it stays empty or Stop() is called.
    void Run() override;

    // Runs the items queued at the time of the call; items they schedule wait
    // for the next call.
    void RunOnce() override;

    void Stop() override;
    bool IsRunning() const override;

    void Schedule(std::coroutine_handle<> handle) override;
    void Post(std::function<void()> callback) override;

    // Like Run(), but reports how many items were executed.
    size_t RunUntilIdle();

    size_t PendingTasks() const;

   private:
    struct WorkItem {
        std::coroutine_handle<> handle;
        std::function<void()> callback;
    };

    size_t RunBatch();

    mutable std::mutex queue_mutex_;
    std::deque<WorkItem> ready_queue_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
};

}  // namespace colock

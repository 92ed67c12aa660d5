// ============================================================================
// colock/io/manual_executor.cpp - Caller-Driven Single-Threaded Executor
// ============================================================================

#include "colock/io/manual_executor.hpp"

#include <utility>

namespace colock {

void ManualExecutor::Run() {
    RunUntilIdle();
}

void ManualExecutor::RunOnce() {
    ExecutorGuard guard(this);
    RunBatch();
}

size_t ManualExecutor::RunUntilIdle() {
    ExecutorGuard guard(this);
    running_ = true;
    stop_requested_ = false;

    size_t executed = 0;
    while (!stop_requested_) {
        size_t n = RunBatch();
        if (n == 0) {
            break;
        }
        executed += n;
    }

    running_ = false;
    return executed;
}

void ManualExecutor::Stop() {
    stop_requested_ = true;
}

bool ManualExecutor::IsRunning() const {
    return running_;
}

void ManualExecutor::Schedule(std::coroutine_handle<> handle) {
    if (!handle) return;

    std::lock_guard<std::mutex> lock(queue_mutex_);
    ready_queue_.push_back(WorkItem{handle, nullptr});
}

void ManualExecutor::Post(std::function<void()> callback) {
    if (!callback) return;

    std::lock_guard<std::mutex> lock(queue_mutex_);
    ready_queue_.push_back(WorkItem{nullptr, std::move(callback)});
}

size_t ManualExecutor::PendingTasks() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return ready_queue_.size();
}

size_t ManualExecutor::RunBatch() {
    std::deque<WorkItem> batch;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        std::swap(batch, ready_queue_);
    }

    // Resumed outside the lock: a coroutine may Schedule() more work.
    for (auto& item : batch) {
        if (item.handle) {
            item.handle.resume();
        } else if (item.callback) {
            item.callback();
        }
    }
    return batch.size();
}

}  // namespace colock

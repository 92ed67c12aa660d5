// ============================================================================
// colock/io/thread_pool_executor.hpp - Multi-Threaded Executor
// ============================================================================
//
// ThreadPoolExecutor resumes coroutines on a fixed set of worker threads that
// share one FIFO work queue. Locks driven from this executor are contended
// for real: two workers can release and acquire the same lock at the same
// time, which is what the stress tests rely on.
//
// USAGE:
// ------
//   ThreadPoolExecutor::Options opts;
//   opts.num_threads = 4;
//   opts.thread_name_prefix = "lock-worker";
//   ThreadPoolExecutor pool(opts);
//
//   for (int i = 0; i < 100; ++i) Spawn(pool, Increment(counter));
//   pool.Run();   // returns once the queue is empty and no worker is busy
//
// ============================================================================

#pragma once

#include "colock/io/executor.hpp"

#include <atomic>
#include <condition_variable>
#include <coroutine>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace colock {

class ThreadPoolExecutor : public Executor {
   public:
    struct Options {
        // Zero is treated as one.
        size_t num_threads = std::thread::hardware_concurrency();

        // Workers are named "<prefix>-<index>" (truncated to 15 characters).
        // Empty leaves thread names alone.
        std::string thread_name_prefix = "colock-worker";

        Options() = default;
    };

    ThreadPoolExecutor();
    explicit ThreadPoolExecutor(size_t num_threads);
    explicit ThreadPoolExecutor(const Options& options);

    ~ThreadPoolExecutor() override;

    ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;

    // Blocks the caller until Stop() or until the pool goes idle.
    void Run() override;

    // Executes one queued item on the calling thread, if there is one.
    void RunOnce() override;

    void Stop() override;
    bool IsRunning() const override;

    void Schedule(std::coroutine_handle<> handle) override;
    void Post(std::function<void()> callback) override;

    size_t NumThreads() const { return workers_.size(); }

    size_t PendingTasks() const;

   private:
    struct WorkItem {
        std::coroutine_handle<> handle{nullptr};
        std::function<void()> callback;

        explicit WorkItem(std::coroutine_handle<> h) : handle(h) {}
        explicit WorkItem(std::function<void()> cb) : callback(std::move(cb)) {}
    };

    void InitWorkers();
    void WorkerLoop(size_t worker_index);
    void Execute(WorkItem& item);

    Options options_;
    std::vector<std::thread> workers_;

    std::queue<WorkItem> work_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable work_available_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
    std::atomic<size_t> active_tasks_{0};
};

}  // namespace colock

// ============================================================================
// colock/io/executor.hpp - Scheduler Interface
// ============================================================================
//
// The locks never run or block threads themselves. When a waiter is granted
// the lock, its coroutine has to be resumed somewhere; an Executor is that
// somewhere. A suspended acquisition remembers the executor that was current
// on its thread when it suspended and hands the coroutine back to it through
// Schedule().
//
// Implementations shipped with colock:
//   ManualExecutor      single-threaded queue driven by the caller
//   ThreadPoolExecutor  fixed pool of worker threads
//   LibuvExecutor       libuv event loop (when built with libuv)
//
// USAGE:
// ------
//   ThreadPoolExecutor pool(4);
//   Spawn(pool, Worker(mutex));   // Worker co_awaits mutex.Lock()
//
// ============================================================================

#pragma once

#include <coroutine>
#include <functional>

namespace colock {

class Executor {
   public:
    virtual ~Executor() = default;

    // Run until Stop() is called or there is no more work.
    virtual void Run() = 0;

    // Run the work that is ready now, without waiting for more.
    virtual void RunOnce() = 0;

    virtual void Stop() = 0;

    [[nodiscard]] virtual bool IsRunning() const = 0;

    // Resume the coroutine on this executor as soon as possible. Safe to call
    // from any thread, including from inside a running coroutine.
    virtual void Schedule(std::coroutine_handle<> handle) = 0;

    virtual void Post(std::function<void()> callback) = 0;
};

// The executor driving the calling thread, or nullptr.
[[nodiscard]] Executor* GetCurrentExecutor();

void SetCurrentExecutor(Executor* executor);

// Installs an executor as current for a scope and restores the previous one.
class ExecutorGuard {
   public:
    explicit ExecutorGuard(Executor* executor);
    ~ExecutorGuard();

    ExecutorGuard(const ExecutorGuard&) = delete;
    ExecutorGuard& operator=(const ExecutorGuard&) = delete;

   private:
    Executor* previous_;
};

}  // namespace colock

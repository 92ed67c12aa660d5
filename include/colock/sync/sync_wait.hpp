// ============================================================================
// colock/sync/sync_wait.hpp - Block a Thread on a Task
// ============================================================================
//
// SyncWait() is the bridge from ordinary code into coroutines: it starts the
// task on the calling thread and blocks that thread until the task finishes.
//
// A task that suspends on a lock inside SyncWait has no executor, so the
// releasing guard resumes it inline on the releasing thread; SyncWait then
// wakes up once the task completes there.
//
// Never call SyncWait from inside a coroutine running on an executor: it
// blocks the worker thread, which is exactly what the locks exist to avoid.
//
// USAGE:
// ------
//   int value = SyncWait(ReadCounter(counter));
//
// ============================================================================

#pragma once

#include "colock/core/task.hpp"

#include <condition_variable>
#include <coroutine>
#include <cstdlib>
#include <mutex>
#include <optional>
#include <utility>

namespace colock {

namespace detail {

class SyncWaitEvent {
   public:
    void Signal() {
        std::lock_guard lock(mutex_);
        signaled_ = true;
        cv_.notify_one();
    }

    void Wait() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return signaled_; });
    }

   private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool signaled_ = false;
};

// Runner coroutine. It signals from final_suspend, after its body is done and
// while suspended, so the blocked thread may destroy the frame right away.
class SyncWaitTask {
   public:
    struct promise_type {
        SyncWaitEvent* event = nullptr;

        SyncWaitTask get_return_object() noexcept {
            return SyncWaitTask{std::coroutine_handle<promise_type>::from_promise(*this)};
        }

        std::suspend_always initial_suspend() noexcept { return {}; }

        auto final_suspend() noexcept {
            struct Notifier {
                bool await_ready() noexcept { return false; }
                void await_suspend(std::coroutine_handle<promise_type> h) noexcept { h.promise().event->Signal(); }
                void await_resume() noexcept {}
            };
            return Notifier{};
        }

        void return_void() noexcept {}

        void unhandled_exception() noexcept { std::abort(); }
    };

    using Handle = std::coroutine_handle<promise_type>;

    explicit SyncWaitTask(Handle handle) noexcept : handle_(handle) {}

    ~SyncWaitTask() {
        if (handle_) {
            handle_.destroy();
        }
    }

    SyncWaitTask(const SyncWaitTask&) = delete;
    SyncWaitTask& operator=(const SyncWaitTask&) = delete;

    void Run() {
        SyncWaitEvent event;
        handle_.promise().event = &event;
        handle_.resume();
        event.Wait();
    }

   private:
    Handle handle_;
};

template <typename T>
SyncWaitTask MakeSyncWaitTask(Task<T>& task, std::optional<T>& result) {
    result.emplace(co_await std::move(task));
}

inline SyncWaitTask MakeSyncWaitTask(Task<void>& task) {
    co_await std::move(task);
}

}  // namespace detail

template <typename T>
T SyncWait(Task<T> task) {
    std::optional<T> result;
    detail::MakeSyncWaitTask(task, result).Run();
    return std::move(*result);
}

inline void SyncWait(Task<void> task) {
    detail::MakeSyncWaitTask(task).Run();
}

}  // namespace colock

// ============================================================================
// colock/core/spawn.hpp - Fire-and-Forget Tasks on an Executor
// ============================================================================
//
// Spawn() hands a Task<void> to an executor and returns immediately. The
// spawned coroutine owns itself: its frame is destroyed when it finishes,
// right after the optional completion callback runs.
//
// USAGE:
// ------
//   ThreadPoolExecutor pool(4);
//   std::atomic<int> done{0};
//   for (int i = 0; i < 100; ++i) {
//       Spawn(pool, Increment(counter), [&] { ++done; });
//   }
//
//   // Without an explicit executor the current thread's executor is used.
//   auto spawned = Spawn(Increment(counter));
//   if (spawned.IsErr()) { /* Errc::NoExecutor */ }
//
// ============================================================================

#pragma once

#include "colock/core/error.hpp"
#include "colock/core/result.hpp"
#include "colock/core/task.hpp"
#include "colock/io/executor.hpp"

#include <coroutine>
#include <cstdlib>
#include <functional>
#include <utility>

namespace colock {

namespace detail {

class SpawnedTask {
   public:
    struct promise_type {
        std::function<void()> on_complete;

        SpawnedTask get_return_object() noexcept {
            return SpawnedTask{std::coroutine_handle<promise_type>::from_promise(*this)};
        }

        std::suspend_always initial_suspend() noexcept { return {}; }

        auto final_suspend() noexcept {
            struct SelfDestroy {
                bool await_ready() noexcept { return false; }
                void await_suspend(std::coroutine_handle<promise_type> h) noexcept {
                    auto callback = std::move(h.promise().on_complete);
                    h.destroy();
                    if (callback) {
                        callback();
                    }
                }
                void await_resume() noexcept {}
            };
            return SelfDestroy{};
        }

        void return_void() noexcept {}

        void unhandled_exception() noexcept { std::abort(); }
    };

    using Handle = std::coroutine_handle<promise_type>;

    explicit SpawnedTask(Handle handle) noexcept : handle_(handle) {}

    // Never started: nobody else will destroy the frame.
    ~SpawnedTask() {
        if (handle_) {
            handle_.destroy();
        }
    }

    SpawnedTask(const SpawnedTask&) = delete;
    SpawnedTask& operator=(const SpawnedTask&) = delete;

    void SetCallback(std::function<void()> callback) { handle_.promise().on_complete = std::move(callback); }

    // Gives up ownership; from here on the frame destroys itself.
    Handle Release() noexcept { return std::exchange(handle_, nullptr); }

   private:
    Handle handle_;
};

inline SpawnedTask WrapForSpawn(Task<void> task) {
    co_await std::move(task);
}

}  // namespace detail

inline void Spawn(Executor& executor, Task<void> task, std::function<void()> on_complete = {}) {
    auto spawned = detail::WrapForSpawn(std::move(task));
    if (on_complete) {
        spawned.SetCallback(std::move(on_complete));
    }
    executor.Schedule(spawned.Release());
}

inline Result<void, Error> Spawn(Task<void> task, std::function<void()> on_complete = {}) {
    auto* executor = GetCurrentExecutor();
    if (!executor) {
        return Err(make_error_code(Errc::NoExecutor));
    }
    Spawn(*executor, std::move(task), std::move(on_complete));
    return Ok();
}

}  // namespace colock

// ============================================================================
// colock/core/task.hpp - Lazy Coroutine Task
// ============================================================================
//
// Task<T> is the coroutine type user code runs lock acquisitions in. It is the
// smallest piece of host runtime the locks need: a lazily started coroutine
// that resumes whoever co_awaited it when it finishes.
//
//   Task<int> Increment(Mutex<int> counter) {
//       auto guard = co_await counter.Lock();
//       co_return ++*guard;
//   }
//
// A Task does not start until it is co_awaited (or its handle is resumed by an
// executor). Completion transfers control straight back to the awaiting
// coroutine through symmetric transfer, so long chains of awaits do not grow
// the stack.
//
// ============================================================================

#pragma once

#include "colock/core/check.hpp"

#include <coroutine>
#include <cstdlib>
#include <optional>
#include <type_traits>
#include <utility>

namespace colock {

template <typename T>
class Task;

namespace detail {

// Continuation bookkeeping shared by the value and void promises.
class TaskPromiseBase {
   public:
    struct FinalAwaiter {
        bool await_ready() noexcept { return false; }

        template <typename Promise>
        std::coroutine_handle<> await_suspend(std::coroutine_handle<Promise> finishing) noexcept {
            auto continuation = finishing.promise().Continuation();
            return continuation ? continuation : std::noop_coroutine();
        }

        void await_resume() noexcept {}
    };

    std::suspend_always initial_suspend() noexcept { return {}; }
    FinalAwaiter final_suspend() noexcept { return {}; }

    // Exceptions are disabled in the library; reaching this is fatal.
    void unhandled_exception() noexcept { std::abort(); }

    void SetContinuation(std::coroutine_handle<> cont) noexcept {
        COLOCK_CHECK(!awaited_, "Task co_awaited twice");
        awaited_ = true;
        continuation_ = cont;
    }

    std::coroutine_handle<> Continuation() const noexcept { return continuation_; }

   private:
    std::coroutine_handle<> continuation_;
    bool awaited_ = false;
};

template <typename T>
class TaskPromise : public TaskPromiseBase {
   public:
    Task<T> get_return_object() noexcept;

    template <typename U>
    void return_value(U&& value) noexcept(std::is_nothrow_constructible_v<T, U&&>) {
        result_.emplace(std::forward<U>(value));
    }

    T TakeResult() noexcept {
        COLOCK_CHECK(result_.has_value(), "Task result read before completion");
        return std::move(*result_);
    }

   private:
    std::optional<T> result_;
};

template <>
class TaskPromise<void> : public TaskPromiseBase {
   public:
    Task<void> get_return_object() noexcept;

    void return_void() noexcept {}

    void TakeResult() noexcept {}
};

}  // namespace detail

template <typename T = void>
class [[nodiscard("Task must be co_awaited or scheduled")]] Task {
   public:
    using promise_type = detail::TaskPromise<T>;
    using Handle = std::coroutine_handle<promise_type>;

    explicit Task(Handle handle) noexcept : handle_(handle) {}

    ~Task() {
        if (handle_) {
            handle_.destroy();
        }
    }

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    Task(Task&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}

    Task& operator=(Task&& other) noexcept {
        if (this != &other) {
            if (handle_) {
                handle_.destroy();
            }
            handle_ = std::exchange(other.handle_, nullptr);
        }
        return *this;
    }

    struct Awaiter {
        Handle handle_;

        bool await_ready() noexcept { return false; }

        std::coroutine_handle<> await_suspend(std::coroutine_handle<> awaiting) noexcept {
            handle_.promise().SetContinuation(awaiting);
            return handle_;
        }

        T await_resume() noexcept { return handle_.promise().TakeResult(); }
    };

    Awaiter operator co_await() noexcept { return Awaiter{handle_}; }

    // Raw access for executors, SyncWait and tests.
    [[nodiscard]] Handle GetHandle() const noexcept { return handle_; }

    [[nodiscard]] bool IsDone() const noexcept { return handle_ && handle_.done(); }

   private:
    Handle handle_;
};

namespace detail {

template <typename T>
Task<T> TaskPromise<T>::get_return_object() noexcept {
    return Task<T>{Task<T>::Handle::from_promise(*this)};
}

inline Task<void> TaskPromise<void>::get_return_object() noexcept {
    return Task<void>{Task<void>::Handle::from_promise(*this)};
}

}  // namespace detail

}  // namespace colock

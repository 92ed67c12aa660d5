// ============================================================================
// colock/core/waker.hpp - Wake Handle for Suspended Acquisitions
// ============================================================================
//
// A Waker is the only channel through which a releasing guard tells a
// suspended acquisition that it now holds the lock. Each waiter record in a
// lock's queue owns one.
//
// Two kinds exist:
//
//   ForCoroutine(h, executor)   resume `h` on `executor` through Schedule();
//                               with no executor, resume inline
//   FromCallback(fn)            run `fn` (explicit Poll()-driven futures)
//
// Wake() is always called outside the lock's internal critical section, so a
// woken coroutine that runs inline may take and release the same lock again.
//
// ============================================================================

#pragma once

#include "colock/io/executor.hpp"

#include <coroutine>
#include <functional>

namespace colock {

class Waker {
   public:
    // An empty waker; Wake() does nothing.
    Waker() = default;

    static Waker ForCoroutine(std::coroutine_handle<> handle, Executor* executor) noexcept;

    static Waker FromCallback(std::function<void()> callback);

    void Wake() const;

    [[nodiscard]] bool IsEmpty() const noexcept { return !handle_ && !callback_; }

    explicit operator bool() const noexcept { return !IsEmpty(); }

   private:
    std::coroutine_handle<> handle_;
    Executor* executor_ = nullptr;
    std::function<void()> callback_;
};

}  // namespace colock

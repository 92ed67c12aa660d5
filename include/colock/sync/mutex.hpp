// ============================================================================
// colock/sync/mutex.hpp - Coroutine-Aware Mutex Owning Its Data
// ============================================================================
//
// Mutex<T> protects a value of type T. Acquiring it under contention suspends
// only the acquiring coroutine; the worker thread goes on running other
// tasks. When the holder's guard is destroyed, the longest-waiting task is
// granted the lock and woken.
//
// DESIGN:
// -------
// 1. DATA INSIDE: the value is reachable only through a MutexGuard
// 2. FIFO: waiters are granted in the order they queued
// 3. CLONEABLE: copies of a Mutex are handles to the same lock and value
// 4. RAII: destroying the guard is the only way to unlock
//
// USAGE:
// ------
//   Mutex<int> counter(0);
//
//   Task<void> Work(Mutex<int> counter) {
//       auto guard = co_await counter.Lock();
//       *guard += 1;
//   }   // unlocked here, next waiter resumes
//
//   if (auto guard = counter.TryLock(); guard.IsOk()) { ... }
//
//   int total = std::move(counter).TryUnwrap().Value();
//
// ============================================================================

#pragma once

#include "colock/sync/acquire_future.hpp"
#include "colock/sync/lock_guard.hpp"
#include "colock/sync/lock_handle.hpp"

#include <concepts>
#include <utility>

namespace colock {

template <typename T>
class Mutex : public detail::LockHandle<Mutex<T>, T> {
    using Base = detail::LockHandle<Mutex<T>, T>;

   public:
    Mutex()
        requires std::default_initializable<T>
        : Base(std::in_place) {}

    explicit Mutex(T value) : Base(std::in_place, std::move(value)) {}

    template <typename... Args>
    explicit Mutex(std::in_place_t, Args&&... args) : Base(std::in_place, std::forward<Args>(args)...) {}

    // Suspends the awaiting task until it holds the lock.
    MutexFuture<T> Lock() const { return this->template Acquire<AccessMode::Exclusive>(); }

    // Never suspends: Errc::WouldBlock if the lock is held or has waiters.
    Result<MutexGuard<T>, Error> TryLock() const { return this->template TryAcquire<AccessMode::Exclusive>(); }
};

}  // namespace colock

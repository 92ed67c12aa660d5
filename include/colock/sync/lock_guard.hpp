// ============================================================================
// colock/sync/lock_guard.hpp - RAII Proof of Access
// ============================================================================
//
// A LockGuard is what a successful acquisition produces. While it is alive its
// owner may use the protected value; destroying it is the one and only way
// the corresponding access is given back.
//
//   LockGuard<T, Exclusive>   MutexGuard<T>, RwLockWriteGuard<T>: T&
//   LockGuard<T, Shared>      RwLockReadGuard<T>: const T& only
//
// Guards are move-only. Moving transfers the release obligation, leaving the
// source empty, so a unit of access is released exactly once no matter how
// the guard travels. Move-assigning into a guard that still holds access
// releases that access first.
//
// The guard keeps the lock's shared state alive, so a guard may outlive every
// handle of its lock.
//
// ============================================================================

#pragma once

#include "colock/core/check.hpp"
#include "colock/sync/lock_state.hpp"

#include <utility>

namespace colock {

template <typename T, AccessMode Mode>
class AcquireFuture;

namespace detail {
template <typename Derived, typename T>
class LockHandle;
}  // namespace detail

template <typename T, AccessMode Mode>
class LockGuard {
   public:
    LockGuard(LockGuard&& other) noexcept : state_(std::move(other.state_)) {}

    LockGuard& operator=(LockGuard&& other) noexcept {
        if (this != &other) {
            Release();
            state_ = std::move(other.state_);
        }
        return *this;
    }

    LockGuard(const LockGuard&) = delete;
    LockGuard& operator=(const LockGuard&) = delete;

    ~LockGuard() { Release(); }

    const T& Get() const {
        COLOCK_CHECK(state_ != nullptr, "access through an empty guard");
        return state_->value;
    }

    T& Get()
        requires(Mode == AccessMode::Exclusive)
    {
        COLOCK_CHECK(state_ != nullptr, "access through an empty guard");
        return state_->value;
    }

    const T& operator*() const { return Get(); }
    const T* operator->() const { return &Get(); }

    T& operator*()
        requires(Mode == AccessMode::Exclusive)
    {
        return Get();
    }

    T* operator->()
        requires(Mode == AccessMode::Exclusive)
    {
        return &Get();
    }

    // False only for a moved-from guard.
    [[nodiscard]] bool OwnsLock() const noexcept { return state_ != nullptr; }

   private:
    friend class AcquireFuture<T, Mode>;
    template <typename, typename>
    friend class detail::LockHandle;

    // Adopts access that the state machine has already granted.
    explicit LockGuard(detail::LockStatePtr<T> state) noexcept : state_(std::move(state)) {}

    void Release() {
        if (state_) {
            auto state = std::move(state_);
            state->core.Release(Mode);
        }
    }

    detail::LockStatePtr<T> state_;
};

template <typename T>
using MutexGuard = LockGuard<T, AccessMode::Exclusive>;

template <typename T>
using RwLockWriteGuard = LockGuard<T, AccessMode::Exclusive>;

template <typename T>
using RwLockReadGuard = LockGuard<T, AccessMode::Shared>;

}  // namespace colock

// ============================================================================
// colock/sync/lock_handle.hpp - Cloneable Handle Over a Lock's Shared State
// ============================================================================
//
// LockHandle is the machinery Mutex and RwLock share: the shared_ptr to the
// LockState, acquisition in a given AccessMode, and the operations that take
// the payload back out without locking.
//
// Copying a handle clones it: both copies name the same lock. Copying never
// touches the lock's status.
//
// SOLE OWNERSHIP:
// ---------------
// GetMut() and TryUnwrap() bypass the state machine, so they only succeed
// when nothing else can reach the payload: this handle holds the only
// reference (no clones, no live guards, no pending futures) and the lock is
// unlocked with nobody queued.
//
// ============================================================================

#pragma once

#include "colock/core/check.hpp"
#include "colock/core/error.hpp"
#include "colock/core/result.hpp"
#include "colock/sync/acquire_future.hpp"
#include "colock/sync/lock_guard.hpp"
#include "colock/sync/lock_state.hpp"
#include "colock/sync/lock_status.hpp"

#include <memory>
#include <utility>

namespace colock::detail {

template <typename Derived, typename T>
class LockHandle {
   public:
    using value_type = T;

    // Direct access to the payload, without locking, when this handle is the
    // sole owner; Errc::NotSoleOwner otherwise.
    Result<T*, Error> GetMut() {
        if (!IsSoleOwner()) {
            return Err(make_error_code(Errc::NotSoleOwner));
        }
        return Ok(&state_->value);
    }

    // Consumes the handle and returns the payload when this handle is the sole
    // owner. Otherwise the handle comes back unchanged as the error.
    Result<T, Derived> TryUnwrap() && {
        if (!IsSoleOwner()) {
            return Err(std::move(static_cast<Derived&>(*this)));
        }
        T value = std::move(state_->value);
        state_.reset();
        return Ok(std::move(value));
    }

    // Snapshot of the occupancy; may be stale as soon as it returns.
    LockStatus Status() const { return State()->core.Status(); }

    size_t WaiterCount() const { return State()->core.WaiterCount(); }

    // References to the shared state: handles, guards and pending futures.
    long UseCount() const noexcept { return state_.use_count(); }

    // Whether two handles name the same lock.
    bool SameLock(const Derived& other) const noexcept {
        return state_ == static_cast<const LockHandle&>(other).state_;
    }

   protected:
    template <typename... Args>
    explicit LockHandle(std::in_place_t, Args&&... args)
        : state_(std::make_shared<LockState<T>>(std::in_place, std::forward<Args>(args)...)) {}

    LockHandle(const LockHandle&) = default;
    LockHandle(LockHandle&&) noexcept = default;
    LockHandle& operator=(const LockHandle&) = default;
    LockHandle& operator=(LockHandle&&) noexcept = default;
    ~LockHandle() = default;

    template <AccessMode Mode>
    AcquireFuture<T, Mode> Acquire() const {
        return AcquireFuture<T, Mode>(State());
    }

    template <AccessMode Mode>
    Result<LockGuard<T, Mode>, Error> TryAcquire() const {
        const auto& state = State();
        if (!state->core.TryAcquire(Mode)) {
            return Err(make_error_code(Errc::WouldBlock));
        }
        return Ok(LockGuard<T, Mode>(state));
    }

   private:
    const LockStatePtr<T>& State() const {
        COLOCK_CHECK(state_ != nullptr, "use of a moved-from or unwrapped lock handle");
        return state_;
    }

    bool IsSoleOwner() const { return state_.use_count() == 1 && state_->core.IsIdle(); }

    LockStatePtr<T> state_;
};

}  // namespace colock::detail

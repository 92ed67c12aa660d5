// ============================================================================
// colock/sync/acquire_future.hpp - Pending Lock Acquisition
// ============================================================================
//
// AcquireFuture<T, Mode> is returned by Mutex::Lock(), RwLock::Read() and
// RwLock::Write(). It is lazy: nothing happens to the lock until the future
// is first driven.
//
// DRIVING:
// --------
// Poll(waker) is the drive step. It returns the guard once access is held and
// std::nullopt while the request has to wait.
//
//   first poll    lock available and nobody queued -> guard
//                 otherwise -> enqueue one waiter record, return nullopt
//   later polls   record granted by a release -> guard
//                 otherwise -> keep waiting with the newest waker
//
// A future is only re-polled after its waker fired; a record is enqueued at
// most once. After the guard has been produced the future is spent and must
// not be polled again.
//
// Inside a coroutine the future is simply awaited; the awaiter protocol is
// layered on Poll() and suspends the coroutine until a release wakes it:
//
//   auto guard = co_await mutex.Lock();
//
// CANCELLATION:
// -------------
// Destroying a future that is still waiting removes its record from the
// queue. If a release already granted the record but the future never
// collected it, the destructor releases that access instead, so an abandoned
// request can never end up holding the lock.
//
// THREADING:
// ----------
// Once a poll has enqueued the record, a release on another thread may wake
// the waiter at any moment, so Poll() does not touch the future after the
// record is published.
//
// ============================================================================

#pragma once

#include "colock/core/check.hpp"
#include "colock/core/waker.hpp"
#include "colock/io/executor.hpp"
#include "colock/sync/lock_guard.hpp"
#include "colock/sync/lock_state.hpp"
#include "colock/sync/waiter_queue.hpp"

#include <coroutine>
#include <memory>
#include <optional>
#include <utility>

namespace colock {

template <typename T, AccessMode Mode>
class [[nodiscard("an AcquireFuture does nothing unless polled or co_awaited")]] AcquireFuture {
   public:
    using Guard = LockGuard<T, Mode>;

    explicit AcquireFuture(detail::LockStatePtr<T> state) noexcept : state_(std::move(state)) {}

    ~AcquireFuture() {
        if (node_) {
            state_->core.Abandon(*node_);
        }
    }

    AcquireFuture(AcquireFuture&&) noexcept = default;
    AcquireFuture& operator=(AcquireFuture&&) = delete;

    AcquireFuture(const AcquireFuture&) = delete;
    AcquireFuture& operator=(const AcquireFuture&) = delete;

    std::optional<Guard> Poll(const Waker& waker) {
        COLOCK_CHECK(state_ != nullptr, "AcquireFuture polled after it produced its guard");

        if (!node_) {
            // Published before the call: once enqueued, a release may wake
            // the owner, which polls again and must find the node.
            node_ = std::make_unique<detail::WaitNode>(Mode);
            if (!state_->core.AcquireOrEnqueue(*node_, waker)) {
                return std::nullopt;
            }
        } else if (!state_->core.CollectGrant(*node_, waker)) {
            return std::nullopt;
        }

        node_.reset();
        return Guard(std::move(state_));
    }

    // True once a record has been queued and not yet collected.
    [[nodiscard]] bool IsWaiting() const noexcept { return node_ != nullptr; }

    // True once the guard has been handed out.
    [[nodiscard]] bool IsDone() const noexcept { return state_ == nullptr; }

    // ------------------------------------------------------------------------
    // Awaiter protocol
    // ------------------------------------------------------------------------

    bool await_ready() {
        COLOCK_CHECK(state_ != nullptr, "AcquireFuture awaited after it produced its guard");
        if (state_->core.TryAcquire(Mode)) {
            result_.emplace(Guard(std::move(state_)));
            return true;
        }
        return false;
    }

    bool await_suspend(std::coroutine_handle<> awaiting) {
        auto guard = Poll(Waker::ForCoroutine(awaiting, GetCurrentExecutor()));
        if (!guard) {
            return true;
        }
        result_.emplace(std::move(*guard));
        return false;
    }

    Guard await_resume() {
        if (!result_) {
            result_ = Poll(Waker{});
            COLOCK_CHECK(result_.has_value(), "acquisition resumed before the lock was granted");
        }
        return std::move(*result_);
    }

   private:
    detail::LockStatePtr<T> state_;
    std::unique_ptr<detail::WaitNode> node_;
    std::optional<Guard> result_;
};

template <typename T>
using MutexFuture = AcquireFuture<T, AccessMode::Exclusive>;

template <typename T>
using RwLockWriteFuture = AcquireFuture<T, AccessMode::Exclusive>;

template <typename T>
using RwLockReadFuture = AcquireFuture<T, AccessMode::Shared>;

}  // namespace colock

// ============================================================================
// colock/sync/rwlock.hpp - Coroutine-Aware Reader/Writer Lock
// ============================================================================
//
// RwLock<T> lets any number of readers, or a single writer, access a T.
// Waiting tasks suspend instead of blocking their thread.
//
// FAIRNESS:
// ---------
// Requests are served in arrival order. Readers that queue back to back are
// granted together; a reader that arrives after a queued writer waits for
// that writer to finish. A steady stream of readers can therefore never
// starve a writer, and a writer never waits on readers that came after it.
//
//   queue: W1 R1 R2 W2 R3      (lock held by a reader)
//   last reader leaves  -> W1
//   W1 done             -> R1 and R2 together
//   R1 and R2 done      -> W2
//   W2 done             -> R3
//
// USAGE:
// ------
//   RwLock<Config> config(LoadDefaults());
//
//   Task<void> Reader(RwLock<Config> config) {
//       auto guard = co_await config.Read();     // const Config&
//       Use(guard->endpoint);
//   }
//
//   Task<void> Writer(RwLock<Config> config) {
//       auto guard = co_await config.Write();    // Config&
//       guard->endpoint = "localhost:9000";
//   }
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
class RwLock : public detail::LockHandle<RwLock<T>, T> {
    using Base = detail::LockHandle<RwLock<T>, T>;

   public:
    RwLock()
        requires std::default_initializable<T>
        : Base(std::in_place) {}

    explicit RwLock(T value) : Base(std::in_place, std::move(value)) {}

    template <typename... Args>
    explicit RwLock(std::in_place_t, Args&&... args) : Base(std::in_place, std::forward<Args>(args)...) {}

    RwLockReadFuture<T> Read() const { return this->template Acquire<AccessMode::Shared>(); }

    RwLockWriteFuture<T> Write() const { return this->template Acquire<AccessMode::Exclusive>(); }

    // Fails with Errc::WouldBlock while a writer holds the lock or is queued.
    Result<RwLockReadGuard<T>, Error> TryRead() const { return this->template TryAcquire<AccessMode::Shared>(); }

    // Fails with Errc::WouldBlock while anyone holds the lock or is queued.
    Result<RwLockWriteGuard<T>, Error> TryWrite() const { return this->template TryAcquire<AccessMode::Exclusive>(); }
};

}  // namespace colock

// ============================================================================
// colock/sync/lock_core.hpp - Shared Acquisition/Release State Machine
// ============================================================================
//
// LockCore is the part of a lock that does not depend on the protected type:
// the occupancy (see lock_status.hpp), the FIFO WaiterQueue, and the small
// std::mutex that serializes every change to both. That mutex is held only
// for the check-and-update itself, never across a suspension and never while
// a waker runs.
//
// ORDERING:
// ---------
// Waiters are granted strictly in arrival order. When the lock frees up, the
// release path looks at the head of the queue:
//
//   head is Exclusive  -> grant it alone, stop
//   head is Shared     -> grant it and every Shared node directly behind it
//
// New requests obey the same order: they are granted on arrival only when
// nobody is queued, so a reader never overtakes a writer that queued first.
//
// GRANTING:
// ---------
// Access is handed over inside the release step (node->granted = true, status
// updated) before the waiter is woken. A woken future therefore never has to
// race for the lock again; its next poll just collects the grant.
//
// ============================================================================

#pragma once

#include "colock/core/waker.hpp"
#include "colock/sync/lock_status.hpp"
#include "colock/sync/waiter_queue.hpp"

#include <cstddef>
#include <mutex>
#include <vector>

namespace colock::detail {

class LockCore {
   public:
    LockCore() = default;

    LockCore(const LockCore&) = delete;
    LockCore& operator=(const LockCore&) = delete;

    // Grants `mode` if it is available now and nobody is queued.
    bool TryAcquire(AccessMode mode);

    // First poll of a future: grants immediately like TryAcquire, or records
    // `waker` in `node` and appends it to the queue. Returns true if granted.
    bool AcquireOrEnqueue(WaitNode& node, const Waker& waker);

    // Later polls of a queued future: true once the release path has granted
    // `node`; otherwise replaces the node's waker with `waker`.
    bool CollectGrant(WaitNode& node, const Waker& waker);

    // Gives back one unit of `mode` access and grants whoever is next.
    void Release(AccessMode mode);

    // Called when a queued future is destroyed before collecting its grant.
    // A still-queued node is removed; an already granted node has its access
    // released, so the grant is never leaked.
    void Abandon(WaitNode& node);

    LockStatus Status() const;
    size_t WaiterCount() const;

    // Unlocked with an empty queue.
    bool IsIdle() const;

   private:
    LockStatus StatusLocked() const;
    bool CanGrantNewLocked(AccessMode mode) const;
    void AcquireLocked(AccessMode mode);
    void ReleaseLocked(AccessMode mode);

    // Grants from the head of the queue as far as the ordering rule allows and
    // collects the wakers of every granted node.
    void GrantWaitersLocked(std::vector<Waker>& to_wake);

    mutable std::mutex mutex_;
    bool exclusive_ = false;
    size_t readers_ = 0;
    WaiterQueue waiters_;
};

}  // namespace colock::detail

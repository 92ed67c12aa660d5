// ============================================================================
// colock/sync/lock_core.cpp - Shared Acquisition/Release State Machine
// ============================================================================

#include "colock/sync/lock_core.hpp"

#include "colock/core/check.hpp"

#include <utility>

namespace colock::detail {

namespace {

void WakeAll(const std::vector<Waker>& to_wake) {
    for (const auto& waker : to_wake) {
        waker.Wake();
    }
}

}  // namespace

bool LockCore::TryAcquire(AccessMode mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!CanGrantNewLocked(mode)) {
        return false;
    }
    AcquireLocked(mode);
    return true;
}

bool LockCore::AcquireOrEnqueue(WaitNode& node, const Waker& waker) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (CanGrantNewLocked(node.mode)) {
        AcquireLocked(node.mode);
        return true;
    }
    node.waker = waker;
    waiters_.Push(&node);
    return false;
}

bool LockCore::CollectGrant(WaitNode& node, const Waker& waker) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (node.granted) {
        return true;
    }
    node.waker = waker;
    return false;
}

void LockCore::Release(AccessMode mode) {
    std::vector<Waker> to_wake;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ReleaseLocked(mode);
        GrantWaitersLocked(to_wake);
    }

    WakeAll(to_wake);
}

void LockCore::Abandon(WaitNode& node) {
    std::vector<Waker> to_wake;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (node.granted) {
            node.granted = false;
            ReleaseLocked(node.mode);
        } else {
            bool removed = waiters_.Remove(&node);
            COLOCK_CHECK(removed, "abandoned waiter is neither granted nor queued");
        }
        // Removing a queued writer can leave readers at the head that are
        // compatible with the current status.
        GrantWaitersLocked(to_wake);
    }

    WakeAll(to_wake);
}

LockStatus LockCore::Status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return StatusLocked();
}

LockStatus LockCore::StatusLocked() const {
    if (exclusive_) {
        return LockStatus::Exclusive();
    }
    return readers_ > 0 ? LockStatus::Shared(readers_) : LockStatus::Unlocked();
}

size_t LockCore::WaiterCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return waiters_.Size();
}

bool LockCore::IsIdle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !exclusive_ && readers_ == 0 && waiters_.Empty();
}

bool LockCore::CanGrantNewLocked(AccessMode mode) const {
    // Anyone queued goes first, including a shared request behind a writer.
    return waiters_.Empty() && StatusLocked().Permits(mode);
}

void LockCore::AcquireLocked(AccessMode mode) {
    if (mode == AccessMode::Exclusive) {
        COLOCK_CHECK(!exclusive_ && readers_ == 0, "exclusive grant while the lock is occupied");
        exclusive_ = true;
    } else {
        COLOCK_CHECK(!exclusive_, "shared grant while the lock is held exclusively");
        ++readers_;
    }
}

void LockCore::ReleaseLocked(AccessMode mode) {
    if (mode == AccessMode::Exclusive) {
        COLOCK_CHECK(exclusive_, "exclusive release of a lock that is not held exclusively");
        exclusive_ = false;
    } else {
        COLOCK_CHECK(readers_ > 0, "shared release of a lock with no readers");
        --readers_;
    }
}

void LockCore::GrantWaitersLocked(std::vector<Waker>& to_wake) {
    while (!waiters_.Empty()) {
        WaitNode* head = waiters_.Front();

        if (!StatusLocked().Permits(head->mode)) {
            return;
        }
        AcquireLocked(head->mode);

        waiters_.PopFront();
        head->granted = true;
        to_wake.push_back(std::move(head->waker));
        head->waker = Waker{};

        if (head->mode == AccessMode::Exclusive) {
            return;
        }
    }
}

}  // namespace colock::detail

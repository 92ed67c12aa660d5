// ============================================================================
// colock/sync/waiter_queue.hpp - FIFO Queue of Pending Acquisitions
// ============================================================================
//
// Every acquisition that cannot be granted on its first poll appends one
// WaitNode here. The node is owned by the AcquireFuture that created it; the
// queue only points at it. All access happens under the owning LockCore's
// mutex, which is what makes a raw pointer safe: a future removes its node
// (under that mutex) before the node dies.
//
// A node leaves the queue exactly once, either popped and granted by the
// release path or removed by its abandoned future.
//
// ============================================================================

#pragma once

#include "colock/core/waker.hpp"
#include "colock/sync/lock_status.hpp"

#include <cstddef>
#include <deque>

namespace colock::detail {

struct WaitNode {
    explicit WaitNode(AccessMode requested) noexcept : mode(requested) {}

    WaitNode(const WaitNode&) = delete;
    WaitNode& operator=(const WaitNode&) = delete;

    const AccessMode mode;

    // Latest waker supplied by a poll of the owning future.
    Waker waker;

    // Set by the release path when access has been transferred to this node.
    // The owning future then holds the lock even before it is polled again.
    bool granted = false;
};

class WaiterQueue {
   public:
    WaiterQueue() = default;

    WaiterQueue(const WaiterQueue&) = delete;
    WaiterQueue& operator=(const WaiterQueue&) = delete;

    void Push(WaitNode* node);

    // Front of the queue; the queue must not be empty.
    WaitNode* Front() const;

    WaitNode* PopFront();

    // Removes `node` wherever it is. Returns false if it was not queued.
    bool Remove(const WaitNode* node);

    bool Empty() const noexcept { return nodes_.empty(); }
    size_t Size() const noexcept { return nodes_.size(); }

   private:
    std::deque<WaitNode*> nodes_;
};

}  // namespace colock::detail

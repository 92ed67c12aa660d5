// ============================================================================
// colock/sync/waiter_queue.cpp - FIFO Queue of Pending Acquisitions
// ============================================================================

#include "colock/sync/waiter_queue.hpp"

#include "colock/core/check.hpp"

#include <algorithm>

namespace colock::detail {

void WaiterQueue::Push(WaitNode* node) {
    COLOCK_CHECK(node != nullptr, "null waiter pushed");
    nodes_.push_back(node);
}

WaitNode* WaiterQueue::Front() const {
    COLOCK_CHECK(!nodes_.empty(), "Front() on an empty waiter queue");
    return nodes_.front();
}

WaitNode* WaiterQueue::PopFront() {
    COLOCK_CHECK(!nodes_.empty(), "PopFront() on an empty waiter queue");
    WaitNode* node = nodes_.front();
    nodes_.pop_front();
    return node;
}

bool WaiterQueue::Remove(const WaitNode* node) {
    auto it = std::find(nodes_.begin(), nodes_.end(), node);
    if (it == nodes_.end()) {
        return false;
    }
    nodes_.erase(it);
    return true;
}

}  // namespace colock::detail

// ============================================================================
// colock/core/waker.cpp - Wake Handle for Suspended Acquisitions
// ============================================================================

#include "colock/core/waker.hpp"

#include <utility>

namespace colock {

Waker Waker::ForCoroutine(std::coroutine_handle<> handle, Executor* executor) noexcept {
    Waker waker;
    waker.handle_ = handle;
    waker.executor_ = executor;
    return waker;
}

Waker Waker::FromCallback(std::function<void()> callback) {
    Waker waker;
    waker.callback_ = std::move(callback);
    return waker;
}

void Waker::Wake() const {
    if (callback_) {
        callback_();
    } else if (handle_) {
        if (executor_) {
            executor_->Schedule(handle_);
        } else {
            handle_.resume();
        }
    }
}

}  // namespace colock

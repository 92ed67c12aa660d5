// ============================================================================
// colock/sync/lock_state.hpp - Shared State Behind a Lock Handle
// ============================================================================
//
// One LockState exists per logical lock. Handles, guards and pending futures
// each hold a std::shared_ptr to it, so the payload lives exactly as long as
// something can still reach it.
//
// `value` is never touched under core's mutex: the state machine guarantees
// that only live guards reach it, and only compatible guards are live at once.
//
// ============================================================================

#pragma once

#include "colock/sync/lock_core.hpp"

#include <memory>
#include <utility>

namespace colock::detail {

template <typename T>
struct LockState {
    template <typename... Args>
    explicit LockState(std::in_place_t, Args&&... args) : value(std::forward<Args>(args)...) {}

    LockState(const LockState&) = delete;
    LockState& operator=(const LockState&) = delete;

    LockCore core;
    T value;
};

template <typename T>
using LockStatePtr = std::shared_ptr<LockState<T>>;

}  // namespace colock::detail

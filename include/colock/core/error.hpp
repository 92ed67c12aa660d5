// ============================================================================
// colock/core/error.hpp - Error Codes
// ============================================================================
//
// Every recoverable failure in colock is a std::error_code in the "colock"
// category. There are deliberately few of them:
//
//   WouldBlock         TryLock/TryRead/TryWrite found the lock occupied
//   NotSoleOwner       GetMut/TryUnwrap found other references to the lock
//   NoExecutor         Spawn() without an executor on the current thread
//   ExecutorInitFailed an executor backend could not be created
//
// USAGE:
// ------
//   auto guard = mutex.TryLock();
//   if (guard.IsErr() && guard.Error() == Errc::WouldBlock) { ... }
//
// ============================================================================

#pragma once

#include <system_error>

namespace colock {

enum class Errc {
    WouldBlock = 1,
    NotSoleOwner,
    NoExecutor,
    ExecutorInitFailed,
};

const std::error_category& ColockCategory() noexcept;

std::error_code make_error_code(Errc e) noexcept;

using Error = std::error_code;

}  // namespace colock

namespace std {
template <>
struct is_error_code_enum<colock::Errc> : true_type {};
}  // namespace std

// ============================================================================
// colock/sync/lock_status.hpp - Access Modes and Lock Occupancy
// ============================================================================
//
// A lock is always in exactly one of three states:
//
//   Unlocked          no guard is live
//   Exclusive         one guard is live (mutex lock or rwlock write)
//   Shared(n), n >= 1 n read guards are live, no write guard
//
//   Unlocked --acquire Exclusive--> Exclusive --release--> Unlocked
//   Unlocked --acquire Shared-----> Shared(1)
//   Shared(n) --acquire Shared----> Shared(n + 1)
//   Shared(n) --release-----------> Shared(n - 1), or Unlocked when n == 1
//
// Exclusive and Shared never overlap. LockStatus is a plain snapshot of this
// state; the transitions themselves live in LockCore.
//
// ============================================================================

#pragma once

#include <cstddef>
#include <cstdint>

namespace colock {

enum class AccessMode : std::uint8_t {
    Exclusive,
    Shared,
};

class LockStatus {
   public:
    static constexpr LockStatus Unlocked() noexcept { return LockStatus(false, 0); }
    static constexpr LockStatus Exclusive() noexcept { return LockStatus(true, 0); }
    static constexpr LockStatus Shared(size_t readers) noexcept { return LockStatus(false, readers); }

    constexpr bool IsUnlocked() const noexcept { return !exclusive_ && readers_ == 0; }
    constexpr bool IsExclusive() const noexcept { return exclusive_; }
    constexpr bool IsShared() const noexcept { return readers_ > 0; }

    // Number of live read guards; zero unless IsShared().
    constexpr size_t SharedCount() const noexcept { return readers_; }

    // Whether a request in `mode` is compatible with the current occupancy,
    // ignoring anyone queued.
    constexpr bool Permits(AccessMode mode) const noexcept {
        return mode == AccessMode::Exclusive ? IsUnlocked() : !exclusive_;
    }

    friend constexpr bool operator==(const LockStatus&, const LockStatus&) noexcept = default;

   private:
    constexpr LockStatus(bool exclusive, size_t readers) noexcept : exclusive_(exclusive), readers_(readers) {}

    bool exclusive_;
    size_t readers_;
};

}  // namespace colock

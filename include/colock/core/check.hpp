// ============================================================================
// colock/core/check.hpp - Always-On Invariant Checks
// ============================================================================
//
// COLOCK_CHECK(cond, msg) guards the lock state machine against programming
// errors: releasing access that is not held, polling a future that already
// produced its guard, using a moved-from handle. It is never compiled out.
//
// On failure the condition, message and source location go to stderr and the
// process aborts. Recoverable conditions (a busy lock, a shared handle) are
// never checked this way; they are returned as Result errors.
//
// ============================================================================

#pragma once

#include <cstdio>
#include <cstdlib>
#include <source_location>

namespace colock::detail {

// Writes the decimal digits of value ending at buf_end; returns the first digit.
inline char* FormatLine(unsigned int value, char* buf_end) {
    char* p = buf_end;
    do {
        *--p = static_cast<char>('0' + value % 10);
        value /= 10;
    } while (value != 0);
    return p;
}

[[noreturn]] inline void CheckFail(const char* cond_str, const char* msg, const std::source_location& loc) {
    char line_buf[12];
    char* line_end = line_buf + sizeof(line_buf);
    char* line_str = FormatLine(loc.line(), line_end);

    std::fputs("COLOCK_CHECK(", stderr);
    std::fputs(cond_str, stderr);
    std::fputs(") failed: ", stderr);
    std::fputs(msg, stderr);
    std::fputs("\n  at ", stderr);
    std::fputs(loc.file_name(), stderr);
    std::fputs(":", stderr);
    std::fwrite(line_str, 1, static_cast<size_t>(line_end - line_str), stderr);
    std::fputs(" in ", stderr);
    std::fputs(loc.function_name(), stderr);
    std::fputs("\n", stderr);
    std::abort();
}

}  // namespace colock::detail

#define COLOCK_CHECK(cond, msg)                                                       \
    do {                                                                              \
        if (!(cond)) [[unlikely]] {                                                   \
            ::colock::detail::CheckFail(#cond, msg, std::source_location::current()); \
        }                                                                             \
    } while (0)

// ============================================================================
// colock/core/result.hpp - Success-or-Error Return Type
// ============================================================================
//
// Result<T, E> holds either a success value or an error. The non-suspending
// lock operations return one instead of throwing, so a busy lock is an
// ordinary value the caller inspects:
//
//   auto guard = mutex.TryLock();          // Result<MutexGuard<int>, Error>
//   if (guard.IsOk()) {
//       *guard.Value() += 1;
//   }
//
//   auto value = std::move(mutex).TryUnwrap();   // Result<int, Mutex<int>>
//   if (value.IsErr()) {
//       Mutex<int> handle = std::move(value).Error();   // retry later
//   }
//
// The value and error types may be move-only (guards are).
//
// ============================================================================

#pragma once

#include "colock/core/check.hpp"

#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace colock {

template <typename T, typename E>
class Result;

// Tag types carrying the payload until it is converted into a Result.
template <typename T>
struct OkTag {
    T value;

    template <typename U>
    explicit OkTag(U&& v) : value(std::forward<U>(v)) {}
};

template <typename E>
struct ErrTag {
    E error;

    template <typename U>
    explicit ErrTag(U&& e) : error(std::forward<U>(e)) {}
};

template <typename T>
OkTag<std::decay_t<T>> Ok(T&& value) {
    return OkTag<std::decay_t<T>>(std::forward<T>(value));
}

template <typename E>
ErrTag<std::decay_t<E>> Err(E&& error) {
    return ErrTag<std::decay_t<E>>(std::forward<E>(error));
}

struct Unit {};

inline OkTag<Unit> Ok() {
    return OkTag<Unit>(Unit{});
}

template <typename T, typename E>
class Result {
   public:
    template <typename U>
    Result(OkTag<U>&& ok) : data_(std::in_place_index<0>, std::move(ok.value)) {}

    template <typename U>
    Result(ErrTag<U>&& err) : data_(std::in_place_index<1>, std::move(err.error)) {}

    Result(const Result&) = default;
    Result(Result&&) = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) = default;

    bool IsOk() const noexcept { return data_.index() == 0; }
    bool IsErr() const noexcept { return data_.index() == 1; }

    explicit operator bool() const noexcept { return IsOk(); }

    // Accessing the wrong alternative fails a COLOCK_CHECK.
    T& Value() & {
        COLOCK_CHECK(IsOk(), "Value() on an error result");
        return std::get<0>(data_);
    }
    const T& Value() const& {
        COLOCK_CHECK(IsOk(), "Value() on an error result");
        return std::get<0>(data_);
    }
    T&& Value() && {
        COLOCK_CHECK(IsOk(), "Value() on an error result");
        return std::get<0>(std::move(data_));
    }

    E& Error() & {
        COLOCK_CHECK(IsErr(), "Error() on a success result");
        return std::get<1>(data_);
    }
    const E& Error() const& {
        COLOCK_CHECK(IsErr(), "Error() on a success result");
        return std::get<1>(data_);
    }
    E&& Error() && {
        COLOCK_CHECK(IsErr(), "Error() on a success result");
        return std::get<1>(std::move(data_));
    }

    T ValueOr(T default_value) const& {
        if (IsOk()) return std::get<0>(data_);
        return default_value;
    }

    T ValueOr(T default_value) && {
        if (IsOk()) return std::get<0>(std::move(data_));
        return default_value;
    }

    // Consumes the result; the error, if any, is dropped.
    std::optional<T> Take() && {
        if (IsOk()) return std::optional<T>(std::get<0>(std::move(data_)));
        return std::nullopt;
    }

    template <typename F>
    auto Map(F&& func) && -> Result<std::invoke_result_t<F, T&&>, E> {
        if (IsOk()) {
            return Ok(func(std::move(*this).Value()));
        }
        return Err(std::move(*this).Error());
    }

    template <typename F>
    auto MapErr(F&& func) && -> Result<T, std::invoke_result_t<F, E&&>> {
        if (IsErr()) {
            return Err(func(std::move(*this).Error()));
        }
        return Ok(std::move(*this).Value());
    }

    template <typename F>
    auto AndThen(F&& func) && -> std::invoke_result_t<F, T&&> {
        if (IsOk()) {
            return func(std::move(*this).Value());
        }
        return Err(std::move(*this).Error());
    }

    template <typename F>
    auto OrElse(F&& func) && -> std::invoke_result_t<F, E&&> {
        if (IsErr()) {
            return func(std::move(*this).Error());
        }
        return Ok(std::move(*this).Value());
    }

   private:
    std::variant<T, E> data_;
};

template <typename E>
class Result<void, E> {
   public:
    Result(OkTag<Unit>&&) : error_(std::nullopt) {}

    template <typename U>
    Result(ErrTag<U>&& err) : error_(std::move(err.error)) {}

    bool IsOk() const noexcept { return !error_.has_value(); }
    bool IsErr() const noexcept { return error_.has_value(); }

    explicit operator bool() const noexcept { return IsOk(); }

    E& Error() & {
        COLOCK_CHECK(IsErr(), "Error() on a success result");
        return *error_;
    }
    const E& Error() const& {
        COLOCK_CHECK(IsErr(), "Error() on a success result");
        return *error_;
    }
    E&& Error() && {
        COLOCK_CHECK(IsErr(), "Error() on a success result");
        return std::move(*error_);
    }

   private:
    std::optional<E> error_;
};

template <typename T, typename E>
bool operator==(const Result<T, E>& lhs, const Result<T, E>& rhs) {
    if (lhs.IsOk() != rhs.IsOk()) return false;
    if (lhs.IsOk()) return lhs.Value() == rhs.Value();
    return lhs.Error() == rhs.Error();
}

}  // namespace colock

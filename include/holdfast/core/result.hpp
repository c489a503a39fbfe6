#pragma once

/**
 * @file result.hpp
 * @brief Failures as values
 *
 * Nothing in the rate limiter, cache or sync queue throws at its callers.
 *
 * - Result<T> when the caller must branch on success (store access,
 *   enqueue, explicit mutations). The error type defaults to Error.
 * - Outcome<T> when the operation always produces a usable answer (the
 *   fail-secure or fail-empty value) and the fault is only attached to it.
 *
 * EXAMPLE:
 * auto allowed = tracker.check_limit("login:a@x.com", policies::kLogin);
 * if (!allowed.value) {
 *     if (allowed.degraded()) {
 *         // denied because storage is broken, not because of the limit
 *     }
 * }
 */

#include "holdfast/core/error.hpp"

#include <cstddef>
#include <optional>
#include <utility>
#include <variant>

namespace holdfast {

template<typename T, typename E = Error>
class Result {
public:
    static Result success(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result failure(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    bool is_ok() const noexcept { return state_.index() == 0; }
    bool is_error() const noexcept { return state_.index() == 1; }

    T& value() { return std::get<0>(state_); }
    const T& value() const { return std::get<0>(state_); }

    E& error() { return std::get<1>(state_); }
    const E& error() const { return std::get<1>(state_); }

    T value_or(T fallback) const {
        return is_ok() ? value() : std::move(fallback);
    }

private:
    template<std::size_t Index, typename V>
    Result(std::in_place_index_t<Index> which, V&& v) : state_(which, std::forward<V>(v)) {}

    // Indexed, so Result<std::string, std::string> stays unambiguous
    std::variant<T, E> state_;
};

/// Success without a value; converts to any Result<void, E>
struct Success {};

template<typename E>
class Result<void, E> {
public:
    Result() = default;
    Result(Success) {}

    static Result success() { return Result(); }
    static Result failure(E error) {
        Result result;
        result.error_ = std::move(error);
        return result;
    }

    bool is_ok() const noexcept { return !error_.has_value(); }
    bool is_error() const noexcept { return error_.has_value(); }

    const E& error() const { return *error_; }

private:
    std::optional<E> error_;
};

inline Success Ok() { return Success{}; }

template<typename T, typename E = Error>
Result<T, E> Ok(T value) { return Result<T, E>::success(std::move(value)); }

template<typename T, typename E>
Result<T, E> Err(E error) { return Result<T, E>::failure(std::move(error)); }

/**
 * @brief A value that is always usable, plus the fault that shaped it (if any)
 */
template<typename T>
struct Outcome {
    T value{};
    std::optional<Error> fault;

    [[nodiscard]] bool degraded() const noexcept { return fault.has_value(); }
};

template<typename T>
Outcome<T> clean(T value) {
    return Outcome<T>{std::move(value), std::nullopt};
}

template<typename T>
Outcome<T> degraded(T value, Error fault) {
    return Outcome<T>{std::move(value), std::move(fault)};
}

} // namespace holdfast

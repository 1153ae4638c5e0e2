#pragma once

/// @file result.hpp
/// @brief Result<T,E> used on every fallible path of the admission gateway.

#include <string>
#include <utility>
#include <variant>

namespace agw {

/// Minimal error payload for code that does not need the gateway taxonomy.
struct Error {
    int code = 0;
    std::string message;

    Error() = default;
    explicit Error(std::string msg) : code(-1), message(std::move(msg)) {}
    Error(int c, std::string msg) : code(c), message(std::move(msg)) {}
};

/// Either a value or an error, never both.
///
/// The gateway hot path does not throw: counter-store calls, rule lookups
/// and routing all report failure through a Result so that the orchestrator
/// can apply the fail-open / fail-closed policy explicitly.
///
/// @code
///   auto rule = rules.resolve(principal, "/api/forms/submit");
///   if (!rule) {
///       return deny(rule.error());
///   }
///   ledger.checkAndConsume(principal.id, rule.value(), 1, 1.0, false);
/// @endcode
template <typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }

    static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return data_.index() == 0; }

    [[nodiscard]] bool hasError() const noexcept { return data_.index() == 1; }

    explicit operator bool() const noexcept { return hasValue(); }

    /// Undefined behaviour when holding an error.
    [[nodiscard]] const T& value() const& { return std::get<0>(data_); }
    [[nodiscard]] T& value() & { return std::get<0>(data_); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(data_)); }

    /// Undefined behaviour when holding a value.
    [[nodiscard]] const E& error() const& { return std::get<1>(data_); }
    [[nodiscard]] E& error() & { return std::get<1>(data_); }

    [[nodiscard]] T valueOr(T fallback) const& {
        return hasValue() ? value() : std::move(fallback);
    }

    /// Re-wrap the error for a caller returning a different value type.
    template <typename U>
    [[nodiscard]] Result<U, E> propagate() const& {
        return Result<U, E>::err(error());
    }

private:
    template <std::size_t I, typename A>
    Result(std::in_place_index_t<I> tag, A&& arg) : data_(tag, std::forward<A>(arg)) {}

    // Indexed so that T and E may be the same type.
    std::variant<T, E> data_;
};

/// Specialization for operations that only succeed or fail.
template <typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(true); }
    static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return success_; }
    [[nodiscard]] bool hasError() const noexcept { return !success_; }
    explicit operator bool() const noexcept { return success_; }

    [[nodiscard]] const E& error() const& { return error_; }

    template <typename U>
    [[nodiscard]] Result<U, E> propagate() const& {
        return Result<U, E>::err(error_);
    }

private:
    explicit Result(bool) : success_(true) {}
    explicit Result(E error) : success_(false), error_(std::move(error)) {}

    bool success_ = false;
    E error_;
};

}  // namespace agw

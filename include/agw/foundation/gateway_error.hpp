#pragma once

/// @file gateway_error.hpp
/// @brief Gateway error type used with Result<T, GatewayError>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "agw/foundation/error_code.hpp"

namespace agw::foundation {

/// Error carrying a categorized code, a human-readable message and
/// optional type-erased context (e.g. the upstream or principal involved).
class GatewayError {
public:
    GatewayError() = default;

    explicit GatewayError(ErrorCode code)
        : code_(code) {}

    GatewayError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    GatewayError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Access typed context data (nullptr on type mismatch or when empty).
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    [[nodiscard]] bool isTransient() const noexcept {
        return ::agw::foundation::isTransient(code_);
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace agw::foundation

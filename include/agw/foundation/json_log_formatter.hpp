#pragma once

/// @file json_log_formatter.hpp
/// @brief Single-line JSON records with per-request correlation IDs.
///
/// Each admission request runs inside a CorrelationScope; every audit
/// record emitted while it is handled carries the same correlation_id.

#include "agw/foundation/gateway_logger.hpp"

#include <string>
#include <string_view>

namespace agw::foundation {

/// Generate a UUID v4 string (e.g. "550e8400-e29b-41d4-a716-446655440000").
[[nodiscard]] std::string generateCorrelationId();

/// RAII guard setting the thread's correlation ID and restoring the
/// previous one on destruction.
class CorrelationScope {
public:
    explicit CorrelationScope(std::string correlationId);

    ~CorrelationScope();

    CorrelationScope(const CorrelationScope&) = delete;
    CorrelationScope& operator=(const CorrelationScope&) = delete;

    /// The current thread's correlation ID (empty if none set).
    [[nodiscard]] static const std::string& current();

private:
    std::string previous_;
};

/// Stateless JSON formatter.
///
/// @code
///   {"timestamp":"2026-10-17T14:03:11.512Z","level":"WARNING",
///    "category":"Audit","correlation_id":"...","message":"fail_open",
///    "principal":"vendor-118","extra":{"rule":"standard:/api/*"}}
/// @endcode
class JsonLogFormatter {
public:
    [[nodiscard]] static std::string format(LogLevel level,
                                            LogCategory category,
                                            std::string_view message,
                                            const LogContext& ctx = {});
};

/// Append @p value to @p out as a quoted, escaped JSON string.
void appendJsonString(std::string& out, std::string_view value);

}  // namespace agw::foundation

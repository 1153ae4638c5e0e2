#pragma once

/// @file gateway_logger.hpp
/// @brief GatewayLogger wrapping the kcenon common_system logger interface.
///
/// Category-based filtering and structured context for the admission
/// gateway. Anomalies (fail-open, store outages, circuit transitions) are
/// logged through here so operators see them in the same stream as the
/// rest of the service.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "agw/foundation/gateway_result.hpp"

namespace agw::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Gateway log categories, one per component plus audit.
enum class LogCategory : uint8_t {
    Core      = 0, ///< Process lifecycle, HTTP front end
    Quota     = 1, ///< Quota ledger and counter store
    Health    = 2, ///< Health monitor and circuit breakers
    Priority  = 3, ///< Classifier and emergency overrides
    Routing   = 4, ///< Routing and failover
    Admission = 5, ///< Per-request orchestration
    Config    = 6, ///< Configuration loading and validation
    Audit     = 7  ///< Telemetry events as JSON lines
};

inline constexpr std::size_t kLogCategoryCount = 8;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Quota", "Health", "Priority", "Routing", "Admission", "Config", "Audit"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured context attached to a log entry.
///
/// @code
///   LogContext ctx;
///   ctx.principalId = "vendor-118";
///   ctx.upstream = "payments-primary";
///   ctx.extra["bucket"] = "29376481";
///   logger.logWithContext(LogLevel::Warning, LogCategory::Quota,
///                         "counter store unreachable, failing open", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> principalId;
    std::optional<std::string> upstream;
    std::optional<std::string> eventId;
    std::optional<std::string> traceId;
    std::unordered_map<std::string, std::string> extra;
};

/// Gateway logger forwarding to kcenon's GlobalLoggerRegistry.
///
/// Default log levels per category:
/// | Category  | Default Level |
/// |-----------|---------------|
/// | Core      | Info          |
/// | Quota     | Info          |
/// | Health    | Info          |
/// | Priority  | Info          |
/// | Routing   | Info          |
/// | Admission | Warning       |
/// | Config    | Info          |
/// | Audit     | Info          |
///
/// Admission defaults to Warning because it would otherwise log once per
/// request.
class GatewayLogger {
public:
    GatewayLogger();
    ~GatewayLogger();

    GatewayLogger(const GatewayLogger&) = delete;
    GatewayLogger& operator=(const GatewayLogger&) = delete;
    GatewayLogger(GatewayLogger&&) noexcept;
    GatewayLogger& operator=(GatewayLogger&&) noexcept;

    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Context fields are appended as `{key=val, ...}`.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    /// Forward an already formatted line (e.g. a JSON record) verbatim.
    void logRaw(LogLevel level, LogCategory cat, std::string_view line);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    GatewayResult<void> flush();

    static GatewayLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Parse "debug", "info", ... (case-insensitive). Unknown names yield nullopt.
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name);

} // namespace agw::foundation

// ---------------------------------------------------------------------------
// Convenience macros (global scope)
// ---------------------------------------------------------------------------

/// @name AGW_LOG Macros
/// AGW_MIN_LOG_LEVEL removes calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef AGW_MIN_LOG_LEVEL
    #define AGW_MIN_LOG_LEVEL 0
#endif

#define AGW_LOG(level, cat, msg)                                                     \
    do {                                                                             \
        _Pragma("GCC diagnostic push")                                               \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                          \
        if (static_cast<int>(level) >= AGW_MIN_LOG_LEVEL &&                          \
            ::agw::foundation::GatewayLogger::instance().isEnabled((level), (cat)))  \
        {                                                                            \
            ::agw::foundation::GatewayLogger::instance().log((level), (cat), (msg)); \
        }                                                                            \
        _Pragma("GCC diagnostic pop")                                                \
    } while (0)

#define AGW_LOG_DEBUG(cat, msg) \
    AGW_LOG(::agw::foundation::LogLevel::Debug, (cat), (msg))

#define AGW_LOG_INFO(cat, msg) \
    AGW_LOG(::agw::foundation::LogLevel::Info, (cat), (msg))

#define AGW_LOG_WARN(cat, msg) \
    AGW_LOG(::agw::foundation::LogLevel::Warning, (cat), (msg))

#define AGW_LOG_ERROR(cat, msg) \
    AGW_LOG(::agw::foundation::LogLevel::Error, (cat), (msg))

/// @}

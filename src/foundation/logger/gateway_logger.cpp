/// @file gateway_logger.cpp
/// @brief GatewayLogger implementation on top of kcenon common_system.

#include "agw/foundation/gateway_logger.hpp"

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <sstream>
#include <string>

namespace agw::foundation {

namespace kci = kcenon::common::interfaces;

// ---------------------------------------------------------------------------
// Level mapping: AGW -> kcenon
// ---------------------------------------------------------------------------
static kci::log_level mapLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kci::log_level::trace;
        case LogLevel::Debug:    return kci::log_level::debug;
        case LogLevel::Info:     return kci::log_level::info;
        case LogLevel::Warning:  return kci::log_level::warning;
        case LogLevel::Error:    return kci::log_level::error;
        case LogLevel::Critical: return kci::log_level::critical;
        case LogLevel::Off:      return kci::log_level::off;
    }
    return kci::log_level::info;
}

static constexpr std::array<LogLevel, kLogCategoryCount> kDefaultCategoryLevels = {
    LogLevel::Info,     // Core
    LogLevel::Info,     // Quota
    LogLevel::Info,     // Health
    LogLevel::Info,     // Priority
    LogLevel::Info,     // Routing
    LogLevel::Warning,  // Admission
    LogLevel::Info,     // Config
    LogLevel::Info      // Audit
};

static std::string formatContext(const LogContext& ctx) {
    std::ostringstream oss;
    bool first = true;

    auto append = [&](std::string_view key, std::string_view val) {
        if (!first) {
            oss << ", ";
        }
        oss << key << '=' << val;
        first = false;
    };

    if (ctx.principalId && !ctx.principalId->empty()) {
        append("principal", *ctx.principalId);
    }
    if (ctx.upstream && !ctx.upstream->empty()) {
        append("upstream", *ctx.upstream);
    }
    if (ctx.eventId && !ctx.eventId->empty()) {
        append("event", *ctx.eventId);
    }
    if (ctx.traceId && !ctx.traceId->empty()) {
        append("trace_id", *ctx.traceId);
    }
    for (const auto& [key, val] : ctx.extra) {
        append(key, val);
    }

    return oss.str();
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct GatewayLogger::Impl {
    std::array<std::atomic<LogLevel>, kLogCategoryCount> categoryLevels;

    // One named logger per category ("agw.Quota", ...); falls back to the
    // registry default when no named logger is registered.
    std::array<std::string, kLogCategoryCount> loggerNames;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            categoryLevels[i].store(kDefaultCategoryLevels[i], std::memory_order_relaxed);
            loggerNames[i] = std::string("agw.") +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    std::shared_ptr<kci::ILogger> getLogger(LogCategory cat) const {
        auto idx = static_cast<std::size_t>(cat);
        auto& registry = kci::GlobalLoggerRegistry::instance();
        if (idx >= kLogCategoryCount) {
            return kci::GlobalLoggerRegistry::null_logger();
        }
        auto logger = registry.get_logger(loggerNames[idx]);
        // An unregistered name resolves to the null logger, which reports
        // every level as disabled.
        if (!logger->is_enabled(kci::log_level::off)) {
            return registry.get_default_logger();
        }
        return logger;
    }

    void emit(LogLevel level, LogCategory cat, const std::string& line) const {
        auto logger = getLogger(cat);
        // The ILogger returns a VoidResult; a failed sink write has nowhere
        // better to be reported than the sink itself.
        (void)logger->log(mapLevel(level), line);
    }
};

GatewayLogger::GatewayLogger() : impl_(std::make_unique<Impl>()) {}

GatewayLogger::~GatewayLogger() = default;

GatewayLogger::GatewayLogger(GatewayLogger&&) noexcept = default;
GatewayLogger& GatewayLogger::operator=(GatewayLogger&&) noexcept = default;

void GatewayLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }

    // Format: [Category] message
    std::string formatted;
    formatted.reserve(msg.size() + 16);
    formatted += '[';
    formatted += logCategoryName(cat);
    formatted += "] ";
    formatted += msg;

    impl_->emit(level, cat, formatted);
}

void GatewayLogger::logWithContext(LogLevel level, LogCategory cat,
                                   std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }

    std::string ctxStr = formatContext(ctx);

    // Format: [Category] message {key=val, ...}
    std::string formatted;
    formatted.reserve(msg.size() + ctxStr.size() + 20);
    formatted += '[';
    formatted += logCategoryName(cat);
    formatted += "] ";
    formatted += msg;
    if (!ctxStr.empty()) {
        formatted += " {";
        formatted += ctxStr;
        formatted += '}';
    }

    impl_->emit(level, cat, formatted);
}

void GatewayLogger::logRaw(LogLevel level, LogCategory cat, std::string_view line) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->emit(level, cat, std::string(line));
}

void GatewayLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->categoryLevels[idx].store(minLevel, std::memory_order_release);
    }
}

LogLevel GatewayLogger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        return impl_->categoryLevels[idx].load(std::memory_order_acquire);
    }
    return LogLevel::Off;
}

bool GatewayLogger::isEnabled(LogLevel level, LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount || level == LogLevel::Off) {
        return false;
    }
    auto minLevel = impl_->categoryLevels[idx].load(std::memory_order_acquire);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

GatewayResult<void> GatewayLogger::flush() {
    auto& registry = kci::GlobalLoggerRegistry::instance();
    auto logger = registry.get_default_logger();
    auto result = logger->flush();
    if (result.is_err()) {
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return GatewayResult<void>::ok();
}

GatewayLogger& GatewayLogger::instance() {
    static GatewayLogger inst;
    return inst;
}

std::optional<LogLevel> parseLogLevel(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace") { return LogLevel::Trace; }
    if (lower == "debug") { return LogLevel::Debug; }
    if (lower == "info") { return LogLevel::Info; }
    if (lower == "warning" || lower == "warn") { return LogLevel::Warning; }
    if (lower == "error") { return LogLevel::Error; }
    if (lower == "critical") { return LogLevel::Critical; }
    if (lower == "off") { return LogLevel::Off; }
    return std::nullopt;
}

} // namespace agw::foundation

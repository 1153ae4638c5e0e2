/// @file quota_ledger.cpp
/// @brief QuotaLedger implementation.

#include "agw/service/quota_ledger.hpp"

#include "agw/foundation/gateway_logger.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <thread>

namespace agw::service {

using foundation::ErrorCode;
using foundation::GatewayError;
using foundation::GatewayLogger;
using foundation::GatewayResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

QuotaLedger::QuotaLedger(std::shared_ptr<ICounterStore> store,
                         const foundation::Clock& clock,
                         LedgerConfig config,
                         std::shared_ptr<ITelemetrySink> telemetry)
    : store_(std::move(store)),
      clock_(clock),
      config_(config),
      telemetry_(std::move(telemetry)) {}

int64_t QuotaLedger::bucketId(int64_t nowMs, std::chrono::seconds window) {
    auto windowMs = std::chrono::duration_cast<std::chrono::milliseconds>(window).count();
    auto bucket = nowMs / windowMs;
    if (nowMs % windowMs != 0 && nowMs < 0) {
        --bucket;
    }
    return bucket;
}

uint64_t QuotaLedger::effectiveLimit(uint64_t baseQuota, double multiplier) {
    if (!(multiplier > 1.0)) {
        return baseQuota;
    }
    const auto scaled = std::floor(static_cast<double>(baseQuota) * multiplier);
    // 2^64 is exactly representable; anything at or above it saturates.
    constexpr auto kCeiling = 18446744073709551616.0;
    if (!(scaled < kCeiling)) {
        return std::numeric_limits<uint64_t>::max();
    }
    return static_cast<uint64_t>(scaled);
}

std::string QuotaLedger::counterKey(std::string_view principalId,
                                    std::string_view ruleName,
                                    int64_t bucket) {
    std::string key;
    key.reserve(principalId.size() + ruleName.size() + 24);
    key += principalId;
    key += '|';
    key += ruleName;
    key += '|';
    key += std::to_string(bucket);
    return key;
}

GatewayResult<QuotaOutcome> QuotaLedger::checkAndConsume(std::string_view principalId,
                                                         const RateLimitRule& rule,
                                                         uint64_t cost,
                                                         double multiplier,
                                                         bool failOpenEligible) {
    if (rule.baseQuota == 0 || rule.window.count() <= 0 || std::isnan(multiplier)) {
        return GatewayResult<QuotaOutcome>::err(
            GatewayError(ErrorCode::InvalidRule, "rule '" + rule.name + "' is not usable"));
    }
    if (cost == 0) {
        return GatewayResult<QuotaOutcome>::err(
            GatewayError(ErrorCode::InvalidCost, "cost must be at least 1"));
    }

    const auto limit = effectiveLimit(rule.baseQuota, multiplier);
    const auto windowMs = std::chrono::duration_cast<std::chrono::milliseconds>(rule.window);

    QuotaOutcome outcome;
    outcome.limit = limit;
    std::optional<GatewayError> lastError;

    for (int attempt = 0; attempt < 2; ++attempt) {
        // Bucket is derived at the moment of this increment attempt.
        const auto nowMs = clock_.nowMillis();
        const auto bucket = bucketId(nowMs, rule.window);
        const auto resetAt = foundation::Clock::time_point{
            std::chrono::milliseconds((bucket + 1) * windowMs.count())};
        outcome.resetAt = resetAt;

        auto update = store_->tryIncrement(counterKey(principalId, rule.name, bucket),
                                           cost, limit, resetAt, config_.storeDeadline);
        if (update) {
            const auto& u = update.value();
            outcome.allowed = u.applied;
            outcome.remaining = u.count >= limit ? 0 : limit - u.count;
            if (!u.applied) {
                auto untilReset = std::chrono::ceil<std::chrono::seconds>(
                    resetAt - foundation::Clock::time_point{std::chrono::milliseconds(nowMs)});
                outcome.retryAfter = std::max(untilReset, std::chrono::seconds(1));
            }
            return GatewayResult<QuotaOutcome>::ok(outcome);
        }

        lastError = update.error();
        if (!lastError->isTransient()) {
            break;
        }
        if (attempt == 0) {
            AGW_LOG_DEBUG(LogCategory::Quota,
                          "transient counter store error, retrying: " +
                              std::string(lastError->message()));
            std::this_thread::sleep_for(config_.retryBackoff);
        }
    }

    LogContext ctx;
    ctx.principalId = std::string(principalId);
    ctx.extra["rule"] = rule.name;
    ctx.extra["error"] = std::string(lastError->message());

    if (failOpenEligible) {
        failOpen_.fetch_add(1, std::memory_order_relaxed);
        GatewayLogger::instance().logWithContext(
            LogLevel::Warning, LogCategory::Quota,
            "counter store unreachable, failing open for critical traffic", ctx);
        publish(TelemetryKind::FailOpen, principalId, rule, lastError->message());

        outcome.allowed = true;
        outcome.failedOpen = true;
        outcome.remaining = 0;
        return GatewayResult<QuotaOutcome>::ok(outcome);
    }

    failClosed_.fetch_add(1, std::memory_order_relaxed);
    GatewayLogger::instance().logWithContext(
        LogLevel::Error, LogCategory::Quota, "counter store unreachable, failing closed", ctx);
    publish(TelemetryKind::FailClosed, principalId, rule, lastError->message());

    return GatewayResult<QuotaOutcome>::err(
        GatewayError(ErrorCode::StoreUnavailable,
                     "counter store unavailable: " + std::string(lastError->message())));
}

GatewayResult<uint64_t> QuotaLedger::currentUsage(std::string_view principalId,
                                                  const RateLimitRule& rule) const {
    if (rule.window.count() <= 0) {
        return GatewayResult<uint64_t>::err(
            GatewayError(ErrorCode::InvalidRule, "rule '" + rule.name + "' has no window"));
    }
    auto bucket = bucketId(clock_.nowMillis(), rule.window);
    return store_->peek(counterKey(principalId, rule.name, bucket));
}

std::size_t QuotaLedger::purgeExpired() {
    return store_->removeExpired(clock_.now());
}

uint64_t QuotaLedger::failOpenCount() const noexcept {
    return failOpen_.load(std::memory_order_relaxed);
}

uint64_t QuotaLedger::failClosedCount() const noexcept {
    return failClosed_.load(std::memory_order_relaxed);
}

void QuotaLedger::publish(TelemetryKind kind, std::string_view principalId,
                          const RateLimitRule& rule, std::string_view detail) {
    if (!telemetry_) {
        return;
    }
    TelemetryEvent event;
    event.kind = kind;
    event.subject = std::string(principalId);
    event.newState = kind == TelemetryKind::FailOpen ? "allowed" : "denied";
    event.detail = "rule=" + rule.name + ": " + std::string(detail);
    event.timestamp = clock_.now();
    telemetry_->publish(event);
}

}  // namespace agw::service

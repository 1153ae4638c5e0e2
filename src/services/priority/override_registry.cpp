/// @file override_registry.cpp
/// @brief OverrideRegistry implementation.

#include "agw/service/override_registry.hpp"

#include "agw/foundation/gateway_logger.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>

namespace agw::service {

using foundation::ErrorCode;
using foundation::GatewayError;
using foundation::GatewayResult;
using foundation::LogCategory;
using foundation::OverrideId;

bool OverrideScope::matches(std::string_view principalId,
                            const std::optional<std::string>& eventId) const {
    switch (kind) {
        case OverrideScopeKind::Global:
            return true;
        case OverrideScopeKind::Principal:
            return target == principalId;
        case OverrideScopeKind::Event:
            return eventId.has_value() && *eventId == target;
    }
    return false;
}

OverrideRegistry::OverrideRegistry(const foundation::Clock& clock,
                                   std::shared_ptr<ITelemetrySink> telemetry,
                                   std::chrono::seconds maxLifetime)
    : clock_(clock), telemetry_(std::move(telemetry)), maxLifetime_(maxLifetime) {}

GatewayResult<EmergencyOverride> OverrideRegistry::create(OverrideRequest request) {
    auto invalid = [](std::string msg) {
        return GatewayResult<EmergencyOverride>::err(
            GatewayError(ErrorCode::InvalidOverride, std::move(msg)));
    };

    const auto now = clock_.now();
    if (request.issuedBy.empty()) {
        return invalid("override requires an issuer");
    }
    if (request.expiresAt <= now) {
        return invalid("override expiry must be in the future");
    }
    if (request.expiresAt - now > maxLifetime_) {
        return invalid("override expiry exceeds the maximum lifetime of " +
                       std::to_string(maxLifetime_.count()) + "s");
    }
    if (request.scope.kind != OverrideScopeKind::Global && request.scope.target.empty()) {
        return invalid("scoped override requires a target");
    }
    if (request.effect.kind == OverrideEffectKind::QuotaMultiplier &&
        (!std::isfinite(request.effect.multiplier) || request.effect.multiplier < 1.0 ||
         request.effect.multiplier > kMaxQuotaMultiplier)) {
        return invalid("quota multiplier must be within [1, " +
                       std::to_string(static_cast<int>(kMaxQuotaMultiplier)) + "]");
    }

    EmergencyOverride record;
    record.id = OverrideId(nextId_.fetch_add(1, std::memory_order_relaxed));
    record.scope = std::move(request.scope);
    record.effect = request.effect;
    record.issuedAt = now;
    record.expiresAt = request.expiresAt;
    record.issuedBy = std::move(request.issuedBy);

    {
        std::unique_lock lock(mutex_);
        overrides_.emplace(record.id, record);
    }

    AGW_LOG_INFO(LogCategory::Priority,
                 "override " + std::to_string(record.id.value()) + " created by " +
                     record.issuedBy + ": " +
                     std::string(overrideEffectName(record.effect.kind)) + " on " +
                     std::string(overrideScopeName(record.scope.kind)) +
                     (record.scope.target.empty() ? "" : ":" + record.scope.target));
    publish(TelemetryKind::OverrideCreated, record, "issued_by=" + record.issuedBy);
    return GatewayResult<EmergencyOverride>::ok(std::move(record));
}

GatewayResult<void> OverrideRegistry::expire(OverrideId id, std::string_view by) {
    const auto now = clock_.now();
    EmergencyOverride snapshot;
    {
        std::unique_lock lock(mutex_);
        auto it = overrides_.find(id);
        if (it == overrides_.end()) {
            return GatewayResult<void>::err(
                GatewayError(ErrorCode::OverrideNotFound,
                             "override " + std::to_string(id.value()) + " not found"));
        }
        if (!it->second.isActive(now)) {
            return GatewayResult<void>::ok();
        }
        it->second.expiresAt = now;
        it->second.expiredBy = std::string(by);
        snapshot = it->second;
    }

    AGW_LOG_INFO(LogCategory::Priority,
                 "override " + std::to_string(id.value()) + " expired by " + std::string(by));
    publish(TelemetryKind::OverrideExpired, snapshot, "expired_by=" + std::string(by));
    return GatewayResult<void>::ok();
}

std::vector<EmergencyOverride> OverrideRegistry::activeFor(
    std::string_view principalId, const std::optional<std::string>& eventId) const {
    const auto now = clock_.now();
    std::vector<EmergencyOverride> out;

    std::shared_lock lock(mutex_);
    for (const auto& [_, record] : overrides_) {
        if (record.isActive(now) && record.scope.matches(principalId, eventId)) {
            out.push_back(record);
        }
    }
    // Stable order for deterministic classification.
    std::sort(out.begin(), out.end(),
              [](const auto& a, const auto& b) { return a.id < b.id; });
    return out;
}

std::optional<EmergencyOverride> OverrideRegistry::find(OverrideId id) const {
    std::shared_lock lock(mutex_);
    auto it = overrides_.find(id);
    if (it == overrides_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<EmergencyOverride> OverrideRegistry::list() const {
    std::vector<EmergencyOverride> out;
    {
        std::shared_lock lock(mutex_);
        out.reserve(overrides_.size());
        for (const auto& [_, record] : overrides_) {
            out.push_back(record);
        }
    }
    std::sort(out.begin(), out.end(),
              [](const auto& a, const auto& b) { return a.id < b.id; });
    return out;
}

std::size_t OverrideRegistry::purgeExpired() {
    const auto now = clock_.now();
    std::vector<EmergencyOverride> lapsed;
    std::size_t removed = 0;
    {
        std::unique_lock lock(mutex_);
        for (auto it = overrides_.begin(); it != overrides_.end();) {
            if (it->second.isActive(now)) {
                ++it;
                continue;
            }
            if (!it->second.expiredBy) {
                lapsed.push_back(it->second);
            }
            it = overrides_.erase(it);
            ++removed;
        }
    }
    for (const auto& record : lapsed) {
        publish(TelemetryKind::OverrideExpired, record, "lapsed");
    }
    return removed;
}

void OverrideRegistry::publish(TelemetryKind kind, const EmergencyOverride& record,
                               std::string detail) {
    if (!telemetry_) {
        return;
    }
    TelemetryEvent event;
    event.kind = kind;
    event.subject = "override:" + std::to_string(record.id.value());
    event.oldState = kind == TelemetryKind::OverrideCreated ? "" : "active";
    event.newState = kind == TelemetryKind::OverrideCreated ? "active" : "expired";
    event.detail = std::move(detail);
    event.timestamp = clock_.now();
    telemetry_->publish(event);
}

}  // namespace agw::service

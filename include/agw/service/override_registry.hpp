#pragma once

/// @file override_registry.hpp
/// @brief Time-bounded emergency overrides issued by operators.
///
/// An override always carries a finite expiry and becomes inert on its
/// own once that passes. Extending one means issuing a new record; the
/// registry has no renew operation.

#include "agw/foundation/clock.hpp"
#include "agw/foundation/gateway_result.hpp"
#include "agw/foundation/types.hpp"
#include "agw/service/admission_types.hpp"
#include "agw/service/telemetry.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace agw::service {

enum class OverrideScopeKind : uint8_t { Global, Principal, Event };

constexpr std::string_view overrideScopeName(OverrideScopeKind kind) {
    switch (kind) {
        case OverrideScopeKind::Global:    return "global";
        case OverrideScopeKind::Principal: return "principal";
        case OverrideScopeKind::Event:     return "event";
    }
    return "unknown";
}

/// Which requests an override applies to.
struct OverrideScope {
    OverrideScopeKind kind = OverrideScopeKind::Global;

    /// Principal ID or event ID; empty for Global.
    std::string target;

    static OverrideScope global() { return {}; }
    static OverrideScope principal(std::string id) {
        return {OverrideScopeKind::Principal, std::move(id)};
    }
    static OverrideScope event(std::string id) {
        return {OverrideScopeKind::Event, std::move(id)};
    }

    [[nodiscard]] bool matches(std::string_view principalId,
                               const std::optional<std::string>& eventId) const;
};

enum class OverrideEffectKind : uint8_t { QuotaMultiplier, PriorityFloor, PriorityCeiling };

constexpr std::string_view overrideEffectName(OverrideEffectKind kind) {
    switch (kind) {
        case OverrideEffectKind::QuotaMultiplier: return "quota_multiplier";
        case OverrideEffectKind::PriorityFloor:   return "priority_floor";
        case OverrideEffectKind::PriorityCeiling: return "priority_ceiling";
    }
    return "unknown";
}

/// What an override does.
struct OverrideEffect {
    OverrideEffectKind kind = OverrideEffectKind::QuotaMultiplier;

    /// QuotaMultiplier only; must be >= 1.
    double multiplier = 1.0;

    /// PriorityFloor / PriorityCeiling only.
    PriorityClass priority = PriorityClass::Normal;

    static OverrideEffect quotaMultiplier(double n) {
        return {OverrideEffectKind::QuotaMultiplier, n, PriorityClass::Normal};
    }
    static OverrideEffect priorityFloor(PriorityClass cls) {
        return {OverrideEffectKind::PriorityFloor, 1.0, cls};
    }
    static OverrideEffect priorityCeiling(PriorityClass cls) {
        return {OverrideEffectKind::PriorityCeiling, 1.0, cls};
    }
};

struct EmergencyOverride {
    foundation::OverrideId id;
    OverrideScope scope;
    OverrideEffect effect;
    std::chrono::system_clock::time_point issuedAt{};
    std::chrono::system_clock::time_point expiresAt{};
    std::string issuedBy;

    /// Set when an operator expired the record explicitly.
    std::optional<std::string> expiredBy;

    [[nodiscard]] bool isActive(std::chrono::system_clock::time_point now) const {
        return now < expiresAt;
    }
};

/// Administrative request to create an override.
struct OverrideRequest {
    OverrideScope scope;
    OverrideEffect effect;
    std::chrono::system_clock::time_point expiresAt{};
    std::string issuedBy;
};

/// Override store.
///
/// Written only by the administrative path; the request path takes a
/// shared lock to read the active set.
class OverrideRegistry {
public:
    static constexpr std::chrono::hours kDefaultMaxLifetime{24 * 7};

    explicit OverrideRegistry(const foundation::Clock& clock,
                              std::shared_ptr<ITelemetrySink> telemetry = nullptr,
                              std::chrono::seconds maxLifetime = kDefaultMaxLifetime);

    /// Validate and store a new override.
    ///
    /// @return The stored record, or InvalidOverride when the issuer is
    ///         empty, the expiry is not in the future or too far out, or
    ///         the effect is malformed.
    foundation::GatewayResult<EmergencyOverride> create(OverrideRequest request);

    /// Make an override inert immediately.
    /// @return OverrideNotFound for an unknown ID; expiring an already
    ///         inactive override is a no-op success.
    foundation::GatewayResult<void> expire(foundation::OverrideId id, std::string_view by);

    /// Active overrides whose scope matches the request.
    [[nodiscard]] std::vector<EmergencyOverride> activeFor(
        std::string_view principalId, const std::optional<std::string>& eventId) const;

    [[nodiscard]] std::optional<EmergencyOverride> find(foundation::OverrideId id) const;

    [[nodiscard]] std::chrono::seconds maxLifetime() const noexcept { return maxLifetime_; }

    /// Every stored record, active or not.
    [[nodiscard]] std::vector<EmergencyOverride> list() const;

    /// Drop inactive records, publishing OverrideExpired for those that
    /// lapsed without an explicit expire().
    std::size_t purgeExpired();

private:
    void publish(TelemetryKind kind, const EmergencyOverride& record, std::string detail);

    const foundation::Clock& clock_;
    std::shared_ptr<ITelemetrySink> telemetry_;
    std::chrono::seconds maxLifetime_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<foundation::OverrideId, EmergencyOverride> overrides_;
    std::atomic<uint64_t> nextId_{1};
};

}  // namespace agw::service

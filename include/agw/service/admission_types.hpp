#pragma once

/// @file admission_types.hpp
/// @brief Core type definitions shared by the admission gateway components.
///
/// Defines principals, rate-limit rules, request context, upstream
/// descriptions, and the AdmissionDecision returned per request.

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agw::service {

class UpstreamLease;

// -- Tiers and priority -------------------------------------------------------

/// Ordered principal tier.
enum class Tier : uint8_t {
    Free,
    Standard,
    Premium,
    Enterprise
};

inline constexpr std::size_t kTierCount = 4;

constexpr std::string_view tierName(Tier tier) {
    switch (tier) {
        case Tier::Free:       return "free";
        case Tier::Standard:   return "standard";
        case Tier::Premium:    return "premium";
        case Tier::Enterprise: return "enterprise";
    }
    return "unknown";
}

[[nodiscard]] std::optional<Tier> parseTier(std::string_view name);

/// Ordered scheduling preference attached at classification time.
enum class PriorityClass : uint8_t {
    Low,
    Normal,
    High,
    Critical
};

constexpr std::string_view priorityClassName(PriorityClass cls) {
    switch (cls) {
        case PriorityClass::Low:      return "low";
        case PriorityClass::Normal:   return "normal";
        case PriorityClass::High:     return "high";
        case PriorityClass::Critical: return "critical";
    }
    return "unknown";
}

[[nodiscard]] std::optional<PriorityClass> parsePriorityClass(std::string_view name);

// -- Circuit state ------------------------------------------------------------

/// Per-upstream breaker state, owned by the HealthMonitor.
enum class CircuitState : uint8_t {
    Closed,   ///< Healthy; all traffic flows.
    Open,     ///< Unhealthy; rejected, or trickled for critical-path upstreams.
    HalfOpen  ///< Probing recovery with a limited number of trial requests.
};

constexpr std::string_view circuitStateName(CircuitState state) {
    switch (state) {
        case CircuitState::Closed:   return "closed";
        case CircuitState::Open:     return "open";
        case CircuitState::HalfOpen: return "half_open";
    }
    return "unknown";
}

// -- Deny reasons -------------------------------------------------------------

/// Structured rejection reason. Names are part of the response contract.
enum class DenyReason : uint8_t {
    QuotaExceeded,
    UpstreamUnavailable,
    UpstreamSaturated,
    ConfigurationMissing,
    StoreUnavailable,
    UnknownPrincipal,
    InvalidRequest,
    InternalError
};

constexpr std::string_view denyReasonName(DenyReason reason) {
    switch (reason) {
        case DenyReason::QuotaExceeded:        return "QuotaExceeded";
        case DenyReason::UpstreamUnavailable:  return "UpstreamUnavailable";
        case DenyReason::UpstreamSaturated:    return "UpstreamSaturated";
        case DenyReason::ConfigurationMissing: return "ConfigurationMissing";
        case DenyReason::StoreUnavailable:     return "StoreUnavailable";
        case DenyReason::UnknownPrincipal:     return "UnknownPrincipal";
        case DenyReason::InvalidRequest:       return "InvalidRequest";
        case DenyReason::InternalError:        return "InternalError";
    }
    return "InternalError";
}

// -- Principals and rules -----------------------------------------------------

/// Upper bound for rule and override quota multipliers.
inline constexpr double kMaxQuotaMultiplier = 1000.0;

/// Quota rule for one resource pattern.
struct RateLimitRule {
    /// Stable name used in counter keys (e.g. "standard:/api/forms/*").
    std::string name;

    /// Exact resource or trailing-`*` prefix pattern.
    std::string resourcePattern;

    /// Units allowed per window. Must be > 0.
    uint64_t baseQuota = 0;

    std::chrono::seconds window{60};

    /// Quota scale while the event-day boost is active. Must be in [1, kMaxQuotaMultiplier].
    double priorityMultiplier = 1.0;

    /// Event-bound traffic under this rule fails open on store outage.
    bool criticalPath = false;
};

/// Authenticated caller.
struct Principal {
    std::string id;

    Tier tier = Tier::Free;

    /// Principal-specific rules; checked before the tier template.
    std::vector<RateLimitRule> rules;

    /// Event IDs the principal may claim. Empty means unrestricted.
    std::vector<std::string> eventBindings;
};

/// Declared request context.
struct RequestContext {
    std::optional<std::string> eventId;

    /// ISO calendar date, `YYYY-MM-DD`.
    std::optional<std::string> eventDate;

    /// "low" | "normal" | "high" | "critical".
    std::optional<std::string> declaredUrgency;
};

/// Inbound admission request.
struct AdmissionRequest {
    std::string principalId;
    std::string resource;
    RequestContext context;
    uint64_t cost = 1;
};

// -- Upstreams ----------------------------------------------------------------

/// A named backend dependency.
struct UpstreamService {
    std::string id;

    /// Failure ratio in (0, 1] above which the circuit opens.
    double failureThreshold = 0.5;

    std::chrono::seconds recoveryTimeout{30};

    /// Never fully blocked; trickled and marked degraded while open.
    bool criticalPath = false;

    /// Concurrent leases the gateway hands out for this upstream.
    uint32_t maxConcurrency = 64;

    /// Trial requests admitted while half-open.
    uint32_t halfOpenProbes = 3;

    /// Concurrent requests admitted to a critical-path upstream while open.
    uint32_t criticalTrickle = 1;
};

// -- Decision -----------------------------------------------------------------

/// Result of one admission call. Ephemeral.
struct AdmissionDecision {
    bool allowed = false;

    PriorityClass priority = PriorityClass::Normal;

    std::optional<std::string> upstreamTarget;

    /// Served by a fallback, a trickled open circuit, or a failure path.
    bool degraded = false;

    /// Quota was not checked because the counter store was unreachable.
    bool failedOpen = false;

    std::optional<DenyReason> reason;

    /// Human-readable detail, e.g. "no_healthy_upstream".
    std::string detail;

    std::optional<int64_t> retryAfterSeconds;

    /// Effective quota for the resolved rule (0 when no rule resolved).
    uint64_t limit = 0;

    uint64_t remaining = 0;

    /// End of the current quota bucket.
    std::optional<std::chrono::system_clock::time_point> resetAt;

    /// Correlation ID shared with the audit records of this request.
    std::string requestId;

    /// Concurrency slot held on the target; released on drop.
    std::shared_ptr<UpstreamLease> lease;
};

}  // namespace agw::service

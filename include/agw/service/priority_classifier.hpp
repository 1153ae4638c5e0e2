#pragma once

/// @file priority_classifier.hpp
/// @brief Pure priority classification from tier, event context and overrides.

#include "agw/foundation/clock.hpp"
#include "agw/service/admission_types.hpp"
#include "agw/service/override_registry.hpp"

#include <array>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agw::service {

/// Proleptic Gregorian calendar date.
struct CivilDate {
    int year = 1970;
    unsigned month = 1;
    unsigned day = 1;

    constexpr auto operator<=>(const CivilDate&) const = default;
};

/// Strict `YYYY-MM-DD` parser. Rejects out-of-range months and days,
/// including Feb 29 outside leap years.
[[nodiscard]] std::optional<CivilDate> parseIsoDate(std::string_view text);

struct ClassifierConfig {
    /// Base class per tier, indexed by Tier.
    std::array<PriorityClass, kTierCount> tierBaseClass{
        PriorityClass::Low,     // free
        PriorityClass::Normal,  // standard
        PriorityClass::Normal,  // premium
        PriorityClass::High     // enterprise
    };

    /// Offset applied to the clock before taking the civil date of "today".
    std::chrono::minutes utcOffset{0};
};

/// Classification result with the facts the orchestrator needs downstream.
struct Classification {
    PriorityClass priority = PriorityClass::Normal;

    PriorityClass baseClass = PriorityClass::Normal;

    /// The request proved membership in an event dated today.
    bool eventDay = false;

    /// Something in the request context was malformed or not permitted.
    bool invalidContext = false;
    std::string invalidReason;

    /// Largest QuotaMultiplier among applied overrides (1 when none).
    double overrideQuotaMultiplier = 1.0;

    std::vector<foundation::OverrideId> appliedOverrides;
};

/// Priority classifier.
///
/// classify() is deterministic and side-effect free: the same inputs
/// always yield the same class. Evaluation order:
///   1. tier base class
///   2. event-day floor (>= high), `critical` when urgency says so
///   3. override floors, taking the maximum
///   4. override ceilings, taking the minimum
/// A malformed or missing event date never earns the event-day floor.
class PriorityClassifier {
public:
    explicit PriorityClassifier(ClassifierConfig config = {});

    [[nodiscard]] Classification classify(const Principal& principal,
                                          const RequestContext& context,
                                          const std::vector<EmergencyOverride>& overrides,
                                          std::chrono::system_clock::time_point now) const;

    /// Civil date of @p now after the configured UTC offset.
    [[nodiscard]] CivilDate today(std::chrono::system_clock::time_point now) const;

    [[nodiscard]] PriorityClass baseClassFor(Tier tier) const;

    [[nodiscard]] const ClassifierConfig& config() const noexcept { return config_; }

private:
    ClassifierConfig config_;
};

/// Quota multiplier for a classified request under @p rule:
/// `max(1, rule multiplier when event-day, override multiplier)`.
[[nodiscard]] double effectiveMultiplier(const Classification& classification,
                                         const RateLimitRule& rule);

}  // namespace agw::service

#pragma once

/// @file rule_registry.hpp
/// @brief Tier rule templates and per-principal rule resolution.

#include "agw/foundation/gateway_result.hpp"
#include "agw/service/admission_types.hpp"

#include <array>
#include <shared_mutex>
#include <string_view>
#include <vector>

namespace agw::service {

/// Resolves the RateLimitRule that governs a (principal, resource) pair.
///
/// Principal-bound rules are searched first; the tier template is only
/// consulted when none of them matches. Within one list the most
/// specific pattern wins. There is no implicit "unlimited" default.
///
/// @code
///   RuleRegistry rules;
///   rules.setTierRules(Tier::Standard, {RateLimitRule{
///       .name = "standard:/api/*", .resourcePattern = "/api/*",
///       .baseQuota = 100, .window = std::chrono::seconds(60)}});
///   auto rule = rules.resolve(principal, "/api/forms/submit");
/// @endcode
class RuleRegistry {
public:
    /// Replace the template for @p tier. Every rule is validated first.
    foundation::GatewayResult<void> setTierRules(Tier tier, std::vector<RateLimitRule> rules);

    [[nodiscard]] std::vector<RateLimitRule> tierRules(Tier tier) const;

    /// @return The governing rule, or ConfigurationMissing.
    [[nodiscard]] foundation::GatewayResult<RateLimitRule> resolve(const Principal& principal,
                                                                   std::string_view resource) const;

    /// Check rule invariants: name and valid pattern present, quota > 0,
    /// window > 0, multiplier >= 1.
    [[nodiscard]] static foundation::GatewayResult<void> validate(const RateLimitRule& rule);

    /// Most specific match in @p rules, or nullptr.
    [[nodiscard]] static const RateLimitRule* bestMatch(const std::vector<RateLimitRule>& rules,
                                                        std::string_view resource);

private:
    mutable std::shared_mutex mutex_;
    std::array<std::vector<RateLimitRule>, kTierCount> tierRules_;
};

}  // namespace agw::service

/// @file rule_registry.cpp
/// @brief RuleRegistry implementation.

#include "agw/service/rule_registry.hpp"

#include "agw/service/resource_pattern.hpp"

#include <cmath>
#include <mutex>

namespace agw::service {

using foundation::ErrorCode;
using foundation::GatewayError;
using foundation::GatewayResult;

GatewayResult<void> RuleRegistry::validate(const RateLimitRule& rule) {
    auto invalid = [&](std::string_view what) {
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::InvalidRule,
                         "rule '" + rule.name + "' (" + rule.resourcePattern + "): " +
                             std::string(what)));
    };

    if (rule.name.empty()) {
        return invalid("name must not be empty");
    }
    if (!isValidPattern(rule.resourcePattern)) {
        return invalid("resource pattern must be non-empty with '*' only at the end");
    }
    if (rule.baseQuota == 0) {
        return invalid("base quota must be positive");
    }
    if (rule.window.count() <= 0) {
        return invalid("window must be positive");
    }
    if (!std::isfinite(rule.priorityMultiplier) || rule.priorityMultiplier < 1.0 ||
        rule.priorityMultiplier > kMaxQuotaMultiplier) {
        return invalid("priority multiplier must be within [1, " +
                       std::to_string(static_cast<int>(kMaxQuotaMultiplier)) + "]");
    }
    return GatewayResult<void>::ok();
}

const RateLimitRule* RuleRegistry::bestMatch(const std::vector<RateLimitRule>& rules,
                                             std::string_view resource) {
    const RateLimitRule* best = nullptr;
    std::size_t bestScore = 0;
    for (const auto& rule : rules) {
        if (!matchesPattern(rule.resourcePattern, resource)) {
            continue;
        }
        auto score = patternSpecificity(rule.resourcePattern);
        // First declared wins on equal specificity.
        if (best == nullptr || score > bestScore) {
            best = &rule;
            bestScore = score;
        }
    }
    return best;
}

GatewayResult<void> RuleRegistry::setTierRules(Tier tier, std::vector<RateLimitRule> rules) {
    for (const auto& rule : rules) {
        auto check = validate(rule);
        if (!check) {
            return check;
        }
    }
    std::unique_lock lock(mutex_);
    tierRules_[static_cast<std::size_t>(tier)] = std::move(rules);
    return GatewayResult<void>::ok();
}

std::vector<RateLimitRule> RuleRegistry::tierRules(Tier tier) const {
    std::shared_lock lock(mutex_);
    return tierRules_[static_cast<std::size_t>(tier)];
}

GatewayResult<RateLimitRule> RuleRegistry::resolve(const Principal& principal,
                                                   std::string_view resource) const {
    if (const auto* own = bestMatch(principal.rules, resource)) {
        return GatewayResult<RateLimitRule>::ok(*own);
    }

    std::shared_lock lock(mutex_);
    const auto& templ = tierRules_[static_cast<std::size_t>(principal.tier)];
    if (const auto* rule = bestMatch(templ, resource)) {
        return GatewayResult<RateLimitRule>::ok(*rule);
    }

    return GatewayResult<RateLimitRule>::err(
        GatewayError(ErrorCode::ConfigurationMissing,
                     "no rate-limit rule for resource '" + std::string(resource) +
                         "' (principal " + principal.id + ", tier " +
                         std::string(tierName(principal.tier)) + ")"));
}

}  // namespace agw::service

/// @file priority_classifier.cpp
/// @brief PriorityClassifier implementation.

#include "agw/service/priority_classifier.hpp"

#include <algorithm>
#include <cctype>

namespace agw::service {

namespace {

bool parseDigits(std::string_view text, int& out) {
    int value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

bool isKnownUrgency(std::string_view urgency) {
    return parsePriorityClass(urgency).has_value();
}

}  // namespace

std::optional<CivilDate> parseIsoDate(std::string_view text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    int y = 0;
    int m = 0;
    int d = 0;
    if (!parseDigits(text.substr(0, 4), y) || !parseDigits(text.substr(5, 2), m) ||
        !parseDigits(text.substr(8, 2), d)) {
        return std::nullopt;
    }
    if (y == 0) {
        return std::nullopt;
    }

    std::chrono::year_month_day ymd{std::chrono::year{y},
                                    std::chrono::month{static_cast<unsigned>(m)},
                                    std::chrono::day{static_cast<unsigned>(d)}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    return CivilDate{y, static_cast<unsigned>(m), static_cast<unsigned>(d)};
}

PriorityClassifier::PriorityClassifier(ClassifierConfig config) : config_(config) {}

CivilDate PriorityClassifier::today(std::chrono::system_clock::time_point now) const {
    auto shifted = now + config_.utcOffset;
    std::chrono::year_month_day ymd{std::chrono::floor<std::chrono::days>(shifted)};
    return CivilDate{static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                     static_cast<unsigned>(ymd.day())};
}

PriorityClass PriorityClassifier::baseClassFor(Tier tier) const {
    return config_.tierBaseClass[static_cast<std::size_t>(tier)];
}

Classification PriorityClassifier::classify(const Principal& principal,
                                            const RequestContext& context,
                                            const std::vector<EmergencyOverride>& overrides,
                                            std::chrono::system_clock::time_point now) const {
    Classification out;
    out.baseClass = baseClassFor(principal.tier);
    out.priority = out.baseClass;

    auto markInvalid = [&out](std::string reason) {
        if (!out.invalidContext) {
            out.invalidContext = true;
            out.invalidReason = std::move(reason);
        }
    };

    // -- Event context --------------------------------------------------------

    bool eventClaimAllowed = true;
    if (context.eventId && !principal.eventBindings.empty()) {
        const auto& bindings = principal.eventBindings;
        eventClaimAllowed =
            std::find(bindings.begin(), bindings.end(), *context.eventId) != bindings.end();
        if (!eventClaimAllowed) {
            markInvalid("event '" + *context.eventId + "' is not bound to principal");
        }
    } else if (!context.eventId && context.eventDate && !principal.eventBindings.empty()) {
        eventClaimAllowed = false;
        markInvalid("event date given without an event id");
    }

    if (context.eventDate) {
        auto date = parseIsoDate(*context.eventDate);
        if (!date) {
            markInvalid("malformed event date '" + *context.eventDate + "'");
        } else if (eventClaimAllowed && *date == today(now)) {
            out.eventDay = true;
        }
    }

    if (context.declaredUrgency && !isKnownUrgency(*context.declaredUrgency)) {
        markInvalid("unknown urgency '" + *context.declaredUrgency + "'");
    }

    if (out.eventDay) {
        out.priority = std::max(out.priority, PriorityClass::High);
        if (context.declaredUrgency &&
            *context.declaredUrgency == priorityClassName(PriorityClass::Critical)) {
            out.priority = PriorityClass::Critical;
        }
    }

    // -- Overrides ------------------------------------------------------------

    std::optional<PriorityClass> ceiling;
    for (const auto& record : overrides) {
        if (!record.isActive(now) || !record.scope.matches(principal.id, context.eventId)) {
            continue;
        }
        switch (record.effect.kind) {
            case OverrideEffectKind::QuotaMultiplier:
                out.overrideQuotaMultiplier =
                    std::max(out.overrideQuotaMultiplier, record.effect.multiplier);
                break;
            case OverrideEffectKind::PriorityFloor:
                out.priority = std::max(out.priority, record.effect.priority);
                break;
            case OverrideEffectKind::PriorityCeiling:
                ceiling = ceiling ? std::min(*ceiling, record.effect.priority)
                                  : record.effect.priority;
                break;
        }
        out.appliedOverrides.push_back(record.id);
    }

    // Ceilings after every floor.
    if (ceiling) {
        out.priority = std::min(out.priority, *ceiling);
    }

    return out;
}

double effectiveMultiplier(const Classification& classification, const RateLimitRule& rule) {
    double multiplier = 1.0;
    if (classification.eventDay) {
        multiplier = std::max(multiplier, rule.priorityMultiplier);
    }
    return std::max(multiplier, classification.overrideQuotaMultiplier);
}

}  // namespace agw::service

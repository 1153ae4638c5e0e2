/// @file admission_types.cpp
/// @brief Name parsing for tiers and priority classes.

#include "agw/service/admission_types.hpp"

namespace agw::service {

std::optional<Tier> parseTier(std::string_view name) {
    for (auto tier : {Tier::Free, Tier::Standard, Tier::Premium, Tier::Enterprise}) {
        if (tierName(tier) == name) {
            return tier;
        }
    }
    return std::nullopt;
}

std::optional<PriorityClass> parsePriorityClass(std::string_view name) {
    for (auto cls : {PriorityClass::Low, PriorityClass::Normal,
                     PriorityClass::High, PriorityClass::Critical}) {
        if (priorityClassName(cls) == name) {
            return cls;
        }
    }
    return std::nullopt;
}

}  // namespace agw::service

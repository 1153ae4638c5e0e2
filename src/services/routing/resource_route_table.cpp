/// @file resource_route_table.cpp
/// @brief ResourceRouteTable implementation.

#include "agw/service/resource_route_table.hpp"

#include "agw/service/resource_pattern.hpp"

#include <algorithm>

namespace agw::service {

void ResourceRouteTable::addRoute(ResourceRoute route) {
    std::lock_guard<std::mutex> lock(mutex_);
    routes_.push_back(std::move(route));
}

std::optional<ResourceRoute> ResourceRouteTable::resolve(std::string_view resource) const {
    std::lock_guard<std::mutex> lock(mutex_);

    const ResourceRoute* best = nullptr;
    std::size_t bestScore = 0;
    for (const auto& route : routes_) {
        if (!matchesPattern(route.resourcePattern, resource)) {
            continue;
        }
        auto score = patternSpecificity(route.resourcePattern);
        if (best == nullptr || score > bestScore) {
            best = &route;
            bestScore = score;
        }
    }
    if (best == nullptr) {
        return std::nullopt;
    }
    return *best;
}

std::vector<ResourceRoute> ResourceRouteTable::routes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return routes_;
}

void ResourceRouteTable::removeUpstream(std::string_view upstream) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& route : routes_) {
        auto& c = route.candidates;
        c.erase(std::remove(c.begin(), c.end(), upstream), c.end());
        if (route.fallback && *route.fallback == upstream) {
            route.fallback.reset();
        }
    }
}

void ResourceRouteTable::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    routes_.clear();
}

}  // namespace agw::service

#pragma once

/// @file resource_route_table.hpp
/// @brief Resource-pattern routing to candidate upstreams.
///
/// Maps incoming resources to the upstream services able to serve them,
/// plus an optional fallback used when none of the candidates is usable.

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agw::service {

/// One routing entry.
struct ResourceRoute {
    /// Exact resource or trailing-`*` prefix pattern.
    std::string resourcePattern;

    /// Upstream IDs in configuration order.
    std::vector<std::string> candidates;

    /// Served (degraded) when no candidate survives.
    std::optional<std::string> fallback;
};

/// Resource routing table.
///
/// Example:
/// @code
///   ResourceRouteTable routes;
///   routes.addRoute({"/api/payments/*", {"payments-primary", "payments-secondary"},
///                    "payments-queue"});
///
///   auto route = routes.resolve("/api/payments/charge");
///   // route->candidates.front() == "payments-primary"
/// @endcode
class ResourceRouteTable {
public:
    void addRoute(ResourceRoute route);

    /// Most specific matching route, if any.
    [[nodiscard]] std::optional<ResourceRoute> resolve(std::string_view resource) const;

    /// Snapshot of all registered routes.
    [[nodiscard]] std::vector<ResourceRoute> routes() const;

    /// Remove @p upstream from every candidate list and fallback.
    void removeUpstream(std::string_view upstream);

    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<ResourceRoute> routes_;
};

}  // namespace agw::service

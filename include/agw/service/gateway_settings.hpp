#pragma once

/// @file gateway_settings.hpp
/// @brief Validated, typed gateway configuration.
///
/// loadGatewaySettings() turns a loaded ConfigManager into a
/// GatewaySettings record. Every required key is checked at load time;
/// a bad value fails with ConfigInvalid naming the key, so the daemon
/// never starts with a half-understood configuration.

#include "agw/foundation/config_manager.hpp"
#include "agw/foundation/gateway_result.hpp"
#include "agw/service/admission_types.hpp"
#include "agw/service/health_monitor.hpp"
#include "agw/service/priority_classifier.hpp"
#include "agw/service/quota_ledger.hpp"
#include "agw/service/resource_route_table.hpp"
#include "agw/service/routing_engine.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace agw::service {

/// Upstream definition plus the address its active probe connects to.
struct UpstreamSettings {
    UpstreamService service;

    /// "host:port" for a TCP connect probe; no active probing when absent.
    std::optional<std::string> probeAddress;
};

struct GatewaySettings {
    // gateway.*
    uint16_t httpPort = 8080;
    std::string serviceName = "agw";
    std::chrono::seconds leaseTimeout{30};
    std::chrono::milliseconds readTimeout{2000};

    // ledger.*
    LedgerConfig ledger;
    std::size_t storeShards = 16;

    ClassifierConfig classifier;
    RoutingConfig routing;
    HealthMonitorConfig health;

    /// Rule templates indexed by Tier.
    std::array<std::vector<RateLimitRule>, kTierCount> tierRules;

    std::vector<UpstreamSettings> upstreams;
    std::vector<ResourceRoute> routes;
    std::vector<Principal> principals;
};

/// Read and validate the full gateway configuration.
/// @return ConfigInvalid naming the offending key on any malformed entry.
[[nodiscard]] foundation::GatewayResult<GatewaySettings>
loadGatewaySettings(const foundation::ConfigManager& config);

}  // namespace agw::service

#pragma once

/// @file gateway_runtime.hpp
/// @brief Owns and wires every gateway component from GatewaySettings.

#include "agw/foundation/clock.hpp"
#include "agw/foundation/gateway_metrics.hpp"
#include "agw/foundation/gateway_result.hpp"
#include "agw/service/admission_gateway.hpp"
#include "agw/service/counter_store.hpp"
#include "agw/service/gateway_settings.hpp"
#include "agw/service/health_monitor.hpp"
#include "agw/service/health_probe.hpp"
#include "agw/service/override_registry.hpp"
#include "agw/service/principal_directory.hpp"
#include "agw/service/priority_classifier.hpp"
#include "agw/service/quota_ledger.hpp"
#include "agw/service/resource_route_table.hpp"
#include "agw/service/routing_engine.hpp"
#include "agw/service/rule_registry.hpp"
#include "agw/service/telemetry.hpp"

#include <functional>
#include <memory>

namespace agw::service {

/// Builds the active probe for an upstream (empty for passive-only).
using ProbeFactory = std::function<HealthProbe(const UpstreamSettings&)>;

/// TCP connect probe on `probe_address`, timing out at half the probe interval.
[[nodiscard]] ProbeFactory tcpProbeFactory(std::chrono::milliseconds probeInterval);

/// Component graph of one gateway process.
///
/// Members are declared in dependency order so that leases and the
/// orchestrator are torn down before the monitor they point into.
///
/// @code
///   auto runtime = GatewayRuntime::create(settings, clock, GatewayMetrics::instance());
///   if (!runtime) { ... }
///   runtime.value()->start();
///   auto decision = runtime.value()->gateway().admit("vendor-118", "/api/forms/submit", {});
/// @endcode
class GatewayRuntime {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    /// Use create(); the tag keeps construction inside this class.
    GatewayRuntime(PrivateTag, GatewaySettings settings, const foundation::Clock& clock);

    [[nodiscard]] static foundation::GatewayResult<std::unique_ptr<GatewayRuntime>>
    create(const GatewaySettings& settings, const foundation::Clock& clock,
           foundation::GatewayMetrics& metrics, ProbeFactory probes = {});

    ~GatewayRuntime();

    GatewayRuntime(const GatewayRuntime&) = delete;
    GatewayRuntime& operator=(const GatewayRuntime&) = delete;

    /// Start the health monitor threads.
    foundation::GatewayResult<void> start();

    void stop();

    /// Drop expired quota buckets and lapsed overrides.
    void purgeExpired();

    [[nodiscard]] AdmissionGateway& gateway() noexcept { return *gateway_; }
    [[nodiscard]] HealthMonitor& monitor() noexcept { return *monitor_; }
    [[nodiscard]] RoutingEngine& routing() noexcept { return *routing_; }
    [[nodiscard]] OverrideRegistry& overrides() noexcept { return *overrides_; }
    [[nodiscard]] QuotaLedger& ledger() noexcept { return *ledger_; }
    [[nodiscard]] RuleRegistry& rules() noexcept { return rules_; }
    [[nodiscard]] ResourceRouteTable& routes() noexcept { return routes_; }
    [[nodiscard]] InMemoryPrincipalDirectory& principals() noexcept { return principals_; }
    [[nodiscard]] FanoutTelemetrySink& telemetry() noexcept { return *telemetry_; }
    [[nodiscard]] const GatewaySettings& settings() const noexcept { return settings_; }
    [[nodiscard]] const foundation::Clock& clock() const noexcept { return clock_; }

private:
    GatewaySettings settings_;
    const foundation::Clock& clock_;

    std::shared_ptr<FanoutTelemetrySink> telemetry_;
    std::shared_ptr<InMemoryCounterStore> store_;
    std::unique_ptr<QuotaLedger> ledger_;
    RuleRegistry rules_;
    InMemoryPrincipalDirectory principals_;
    ResourceRouteTable routes_;
    std::unique_ptr<OverrideRegistry> overrides_;
    std::unique_ptr<PriorityClassifier> classifier_;
    std::unique_ptr<HealthMonitor> monitor_;
    std::unique_ptr<RoutingEngine> routing_;
    std::unique_ptr<AdmissionGateway> gateway_;
};

}  // namespace agw::service

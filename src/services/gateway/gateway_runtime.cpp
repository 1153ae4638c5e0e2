/// @file gateway_runtime.cpp
/// @brief Component assembly from GatewaySettings.

#include "agw/service/gateway_runtime.hpp"

#include "agw/foundation/gateway_logger.hpp"

#include <algorithm>

namespace agw::service {

using foundation::GatewayResult;
using foundation::LogCategory;

ProbeFactory tcpProbeFactory(std::chrono::milliseconds probeInterval) {
    const auto timeout = std::max(probeInterval / 2, std::chrono::milliseconds(1));
    return [timeout](const UpstreamSettings& upstream) -> HealthProbe {
        if (!upstream.probeAddress) {
            return {};
        }
        auto address = ProbeAddress::parse(*upstream.probeAddress);
        if (!address) {
            return {};
        }
        return TcpConnectProbe(std::move(address).value(), timeout);
    };
}

GatewayRuntime::GatewayRuntime(PrivateTag, GatewaySettings settings, const foundation::Clock& clock)
    : settings_(std::move(settings)), clock_(clock) {}

GatewayRuntime::~GatewayRuntime() {
    stop();
}

GatewayResult<std::unique_ptr<GatewayRuntime>>
GatewayRuntime::create(const GatewaySettings& settings, const foundation::Clock& clock,
                       foundation::GatewayMetrics& metrics, ProbeFactory probes) {
    using Created = GatewayResult<std::unique_ptr<GatewayRuntime>>;

    auto rt = std::make_unique<GatewayRuntime>(PrivateTag{}, settings, clock);
    const auto& s = rt->settings_;

    rt->telemetry_ = std::make_shared<FanoutTelemetrySink>();
    rt->telemetry_->addSink(std::make_shared<LoggingTelemetrySink>());
    rt->telemetry_->addSink(std::make_shared<MetricsTelemetrySink>(metrics));

    // ── Quota ──
    rt->store_ = std::make_shared<InMemoryCounterStore>(s.storeShards);
    rt->ledger_ = std::make_unique<QuotaLedger>(rt->store_, clock, s.ledger, rt->telemetry_);

    for (std::size_t i = 0; i < kTierCount; ++i) {
        if (s.tierRules[i].empty()) {
            continue;
        }
        auto set = rt->rules_.setTierRules(static_cast<Tier>(i), s.tierRules[i]);
        if (!set) {
            return set.propagate<std::unique_ptr<GatewayRuntime>>();
        }
    }
    for (const auto& principal : s.principals) {
        rt->principals_.upsert(principal);
    }

    // ── Priority ──
    rt->overrides_ = std::make_unique<OverrideRegistry>(clock, rt->telemetry_);
    rt->classifier_ = std::make_unique<PriorityClassifier>(s.classifier);

    // ── Health and routing ──
    rt->monitor_ = std::make_unique<HealthMonitor>(s.health, clock, rt->telemetry_);
    rt->routing_ = std::make_unique<RoutingEngine>(*rt->monitor_, s.routing);

    if (!probes) {
        probes = tcpProbeFactory(s.health.probeInterval);
    }
    for (const auto& upstream : s.upstreams) {
        auto registered = rt->monitor_->registerUpstream(upstream.service, probes(upstream));
        if (!registered) {
            return registered.propagate<std::unique_ptr<GatewayRuntime>>();
        }
        auto tracked = rt->routing_->addUpstream(upstream.service);
        if (!tracked) {
            return tracked.propagate<std::unique_ptr<GatewayRuntime>>();
        }
        metrics.setGauge(foundation::labeled("agw_circuit_state", "upstream", upstream.service.id),
                         0.0);
    }
    for (const auto& route : s.routes) {
        rt->routes_.addRoute(route);
    }

    rt->gateway_ = std::make_unique<AdmissionGateway>(GatewayComponents{
        .clock = clock,
        .principals = rt->principals_,
        .rules = rt->rules_,
        .routes = rt->routes_,
        .classifier = *rt->classifier_,
        .overrides = *rt->overrides_,
        .ledger = *rt->ledger_,
        .routing = *rt->routing_,
        .metrics = metrics,
    });

    AGW_LOG_INFO(LogCategory::Core,
                 "gateway assembled: " + std::to_string(s.upstreams.size()) + " upstreams, " +
                     std::to_string(s.routes.size()) + " routes, " +
                     std::to_string(s.principals.size()) + " principals");
    return Created::ok(std::move(rt));
}

GatewayResult<void> GatewayRuntime::start() {
    return monitor_->start();
}

void GatewayRuntime::stop() {
    if (monitor_ && monitor_->isRunning()) {
        monitor_->stop();
    }
}

void GatewayRuntime::purgeExpired() {
    auto buckets = ledger_->purgeExpired();
    auto lapsed = overrides_->purgeExpired();
    if (buckets > 0 || lapsed > 0) {
        AGW_LOG_DEBUG(LogCategory::Core, "purged " + std::to_string(buckets) +
                                             " quota buckets, " + std::to_string(lapsed) +
                                             " overrides");
    }
}

}  // namespace agw::service

#pragma once

/// @file health_monitor.hpp
/// @brief Upstream health sampling and per-upstream circuit state.
///
/// Two producers feed one consumer:
///   - the periodic sampler runs each upstream's probe on the TaskScheduler
///   - recordOutcome() turns every completed request into a passive sample
/// Both push into a SampleQueue; the aggregator drains it into the
/// circuit breakers and the latency averages. Nothing but the aggregator
/// writes breaker windows.

#include "agw/foundation/clock.hpp"
#include "agw/foundation/gateway_result.hpp"
#include "agw/service/admission_types.hpp"
#include "agw/service/circuit_breaker.hpp"
#include "agw/service/health_probe.hpp"
#include "agw/service/telemetry.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agw::service {

struct HealthMonitorConfig {
    /// Period of the active sampler and upper bound on aggregator latency.
    std::chrono::milliseconds probeInterval{1000};

    std::chrono::seconds rollingWindow{30};

    uint32_t minimumSamples = 5;

    std::size_t probeThreads = 2;

    /// Capacity of the sample channel.
    std::size_t queueCapacity = 4096;
};

enum class SampleSource : uint8_t { Probe, Passive };

/// One observation of an upstream.
struct HealthSample {
    std::string upstream;
    bool success = false;
    std::chrono::milliseconds latency{0};
    std::chrono::system_clock::time_point at{};
    SampleSource source = SampleSource::Passive;

    /// Outcome of a half-open trial request.
    bool trial = false;
};

/// Read-only view used by routing and the HTTP front end.
struct UpstreamSnapshot {
    UpstreamService service;
    CircuitState state = CircuitState::Closed;

    /// EWMA of sample latency; nullopt until the first sample.
    std::optional<double> latencyMs;

    double failureRatio = 0.0;
    std::size_t samples = 0;

    /// Seconds until an open circuit probes again (0 when not open).
    std::chrono::seconds retryAfter{0};
};

/// Health monitor.
///
/// @code
///   HealthMonitor monitor(HealthMonitorConfig{}, clock, telemetry);
///   monitor.registerUpstream(UpstreamService{.id = "email", .failureThreshold = 0.5});
///   monitor.start();
///   monitor.recordOutcome("email", false, std::chrono::milliseconds(120));
/// @endcode
///
/// Thread-safe. Upstreams are registered at start-up; lookups afterwards
/// take a shared lock.
class HealthMonitor {
public:
    /// EWMA smoothing factor for latency.
    static constexpr double kLatencyAlpha = 0.2;

    HealthMonitor(HealthMonitorConfig config,
                  const foundation::Clock& clock,
                  std::shared_ptr<ITelemetrySink> telemetry = nullptr);
    ~HealthMonitor();

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    /// @return UpstreamAlreadyRegistered or InvalidArgument on bad config.
    foundation::GatewayResult<void> registerUpstream(UpstreamService service,
                                                     HealthProbe probe = {});

    // ── Producers ────────────────────────────────────────────────────────

    /// Passive sample from a completed request. Never blocks.
    ///
    /// @p trial marks a request admitted on a half-open trial permit; only
    /// those (and active probes) move a half-open circuit.
    void recordOutcome(std::string_view upstream, bool success,
                       std::chrono::milliseconds latency, bool trial = false);

    /// Run every registered probe once on the scheduler and wait for them,
    /// bounded by the probe interval. A probe that misses the deadline
    /// counts as a failure.
    /// @return Number of samples enqueued.
    foundation::GatewayResult<std::size_t> runProbeCycle();

    // ── Consumer ─────────────────────────────────────────────────────────

    /// Apply queued samples and time-driven transitions.
    /// @return Number of samples applied.
    std::size_t drain();

    /// Start the sampler and aggregator threads.
    /// @return MonitorAlreadyRunning if already started.
    foundation::GatewayResult<void> start();

    /// Stop both threads; remaining samples are applied first.
    void stop();

    [[nodiscard]] bool isRunning() const;

    // ── Routing access ───────────────────────────────────────────────────

    [[nodiscard]] std::optional<UpstreamSnapshot> snapshot(std::string_view upstream) const;

    [[nodiscard]] std::vector<UpstreamSnapshot> snapshots() const;

    /// @return UpstreamNotFound for unknown IDs.
    [[nodiscard]] foundation::GatewayResult<CircuitState> state(std::string_view upstream) const;

    [[nodiscard]] bool tryAcquireTrial(std::string_view upstream);

    void releaseTrial(std::string_view upstream);

    /// Operator override of a circuit.
    foundation::GatewayResult<void> forceState(std::string_view upstream, CircuitState state);

    /// Samples waiting for the aggregator.
    [[nodiscard]] std::size_t pendingSamples() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace agw::service

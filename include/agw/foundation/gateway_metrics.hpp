#pragma once

/// @file gateway_metrics.hpp
/// @brief In-memory counters, gauges, histograms and component health with
///        Prometheus text export.

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace agw::foundation {

/// Well-known metric names.
namespace metric {
inline constexpr std::string_view kAdmissions = "agw_admissions_total";
inline constexpr std::string_view kDenials = "agw_denials_total";
inline constexpr std::string_view kDegraded = "agw_degraded_total";
inline constexpr std::string_view kFailOpen = "agw_fail_open_total";
inline constexpr std::string_view kFailClosed = "agw_fail_closed_total";
inline constexpr std::string_view kCircuitTransitions = "agw_circuit_transitions_total";
inline constexpr std::string_view kAdmitLatency = "agw_admit_latency_ms";
} // namespace metric

/// Upper bounds of histogram buckets ("le").
struct HistogramBuckets {
    /// {0.05,0.1,0.25,0.5,1,2.5,5,10,25} ms: admission is expected to be sub-millisecond.
    static HistogramBuckets admissionLatency();

    std::vector<double> boundaries;
};

enum class HealthStatus : uint8_t {
    Healthy,
    Degraded,
    Unhealthy
};

[[nodiscard]] constexpr std::string_view healthStatusName(HealthStatus status) {
    switch (status) {
        case HealthStatus::Healthy:   return "healthy";
        case HealthStatus::Degraded:  return "degraded";
        case HealthStatus::Unhealthy: return "unhealthy";
    }
    return "unknown";
}

/// Aggregated health of the gateway and its upstream view.
struct HealthCheckResult {
    HealthStatus status{HealthStatus::Healthy};
    std::string serviceName;
    std::unordered_map<std::string, HealthStatus> components;
    std::chrono::system_clock::time_point timestamp{};
};

/// Metrics registry.
///
/// Names may carry Prometheus labels inline, e.g.
/// `agw_denials_total{reason="QuotaExceeded"}`; series sharing a base name
/// are exported under one TYPE line.
///
/// Thread-safe: counters and gauges are atomics behind a map mutex,
/// histograms and health are mutex-protected.
class GatewayMetrics {
public:
    GatewayMetrics();
    ~GatewayMetrics();

    GatewayMetrics(const GatewayMetrics&) = delete;
    GatewayMetrics& operator=(const GatewayMetrics&) = delete;
    GatewayMetrics(GatewayMetrics&&) noexcept;
    GatewayMetrics& operator=(GatewayMetrics&&) noexcept;

    void incrementCounter(std::string_view name, uint64_t value = 1);

    /// 0 if the counter does not exist.
    [[nodiscard]] uint64_t counterValue(std::string_view name) const;

    void setGauge(std::string_view name, double value);

    void incrementGauge(std::string_view name, double delta = 1.0);

    void decrementGauge(std::string_view name, double delta = 1.0);

    /// 0.0 if the gauge does not exist.
    [[nodiscard]] double gaugeValue(std::string_view name) const;

    /// Must be called before recordHistogram() for the same name.
    void registerHistogram(std::string_view name, HistogramBuckets buckets);

    /// No-op for unregistered histograms.
    void recordHistogram(std::string_view name, double value);

    void setComponentHealth(std::string_view component, HealthStatus status);

    void setServiceName(std::string name);

    /// Overall status is the worst component status.
    [[nodiscard]] HealthCheckResult healthCheck() const;

    /// Prometheus text exposition format.
    [[nodiscard]] std::string scrape() const;

    /// Clear everything. Intended for tests.
    void reset();

    static GatewayMetrics& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Build `base{key="value"}`.
[[nodiscard]] std::string labeled(std::string_view base, std::string_view key,
                                  std::string_view value);

} // namespace agw::foundation

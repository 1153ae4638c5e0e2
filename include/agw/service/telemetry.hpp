#pragma once

/// @file telemetry.hpp
/// @brief Health and policy events produced for the observability pipeline.
///
/// One event is published per circuit transition, per fail-open or
/// fail-closed quota decision, and per override lifecycle change.

#include "agw/foundation/gateway_logger.hpp"
#include "agw/foundation/gateway_metrics.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace agw::service {

enum class TelemetryKind : uint8_t {
    CircuitTransition,
    FailOpen,
    FailClosed,
    OverrideCreated,
    OverrideExpired
};

constexpr std::string_view telemetryKindName(TelemetryKind kind) {
    switch (kind) {
        case TelemetryKind::CircuitTransition: return "circuit_transition";
        case TelemetryKind::FailOpen:          return "fail_open";
        case TelemetryKind::FailClosed:        return "fail_closed";
        case TelemetryKind::OverrideCreated:   return "override_created";
        case TelemetryKind::OverrideExpired:   return "override_expired";
    }
    return "unknown";
}

struct TelemetryEvent {
    TelemetryKind kind = TelemetryKind::CircuitTransition;

    /// Affected upstream ID, principal ID, or override ID.
    std::string subject;

    std::string oldState;
    std::string newState;
    std::string detail;

    std::chrono::system_clock::time_point timestamp{};
};

/// Receiver of telemetry events. Implementations must be thread-safe.
class ITelemetrySink {
public:
    virtual ~ITelemetrySink() = default;

    virtual void publish(const TelemetryEvent& event) = 0;
};

/// Writes each event as one JSON line to the Audit log category.
///
/// Fail-open, fail-closed and open-circuit transitions are logged at
/// Warning; everything else at Info.
class LoggingTelemetrySink : public ITelemetrySink {
public:
    void publish(const TelemetryEvent& event) override;

    /// The JSON line publish() would write.
    [[nodiscard]] static std::string render(const TelemetryEvent& event);

    [[nodiscard]] static foundation::LogLevel levelFor(const TelemetryEvent& event);
};

/// Maintains fail-open/fail-closed/transition counters and a per-upstream
/// `agw_circuit_state` gauge (0 closed, 1 half_open, 2 open).
class MetricsTelemetrySink : public ITelemetrySink {
public:
    explicit MetricsTelemetrySink(foundation::GatewayMetrics& metrics);

    void publish(const TelemetryEvent& event) override;

private:
    foundation::GatewayMetrics& metrics_;
};

/// Forwards every event to each registered sink in registration order.
class FanoutTelemetrySink : public ITelemetrySink {
public:
    void addSink(std::shared_ptr<ITelemetrySink> sink);

    void publish(const TelemetryEvent& event) override;

    [[nodiscard]] std::size_t sinkCount() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<ITelemetrySink>> sinks_;
};

}  // namespace agw::service

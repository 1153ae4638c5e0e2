/// @file telemetry.cpp
/// @brief Telemetry sinks.

#include "agw/service/telemetry.hpp"

#include "agw/foundation/json_log_formatter.hpp"
#include "agw/service/admission_types.hpp"

namespace agw::service {

using foundation::LogLevel;

// ── LoggingTelemetrySink ────────────────────────────────────────────────────

LogLevel LoggingTelemetrySink::levelFor(const TelemetryEvent& event) {
    switch (event.kind) {
        case TelemetryKind::FailOpen:
        case TelemetryKind::FailClosed:
            return LogLevel::Warning;
        case TelemetryKind::CircuitTransition:
            return event.newState == circuitStateName(CircuitState::Open) ? LogLevel::Warning
                                                                          : LogLevel::Info;
        case TelemetryKind::OverrideCreated:
        case TelemetryKind::OverrideExpired:
            return LogLevel::Info;
    }
    return LogLevel::Info;
}

std::string LoggingTelemetrySink::render(const TelemetryEvent& event) {
    foundation::LogContext ctx;
    ctx.extra["subject"] = event.subject;
    if (!event.oldState.empty()) {
        ctx.extra["old_state"] = event.oldState;
    }
    if (!event.newState.empty()) {
        ctx.extra["new_state"] = event.newState;
    }
    if (!event.detail.empty()) {
        ctx.extra["detail"] = event.detail;
    }
    ctx.extra["at_ms"] = std::to_string(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            event.timestamp.time_since_epoch())
            .count());

    return foundation::JsonLogFormatter::format(levelFor(event),
                                                foundation::LogCategory::Audit,
                                                telemetryKindName(event.kind), ctx);
}

void LoggingTelemetrySink::publish(const TelemetryEvent& event) {
    auto level = levelFor(event);
    auto& logger = foundation::GatewayLogger::instance();
    if (!logger.isEnabled(level, foundation::LogCategory::Audit)) {
        return;
    }
    logger.logRaw(level, foundation::LogCategory::Audit, render(event));
}

// ── MetricsTelemetrySink ────────────────────────────────────────────────────

MetricsTelemetrySink::MetricsTelemetrySink(foundation::GatewayMetrics& metrics)
    : metrics_(metrics) {}

void MetricsTelemetrySink::publish(const TelemetryEvent& event) {
    namespace metric = foundation::metric;

    switch (event.kind) {
        case TelemetryKind::FailOpen:
            metrics_.incrementCounter(metric::kFailOpen);
            break;
        case TelemetryKind::FailClosed:
            metrics_.incrementCounter(metric::kFailClosed);
            break;
        case TelemetryKind::CircuitTransition: {
            metrics_.incrementCounter(
                foundation::labeled(metric::kCircuitTransitions, "to", event.newState));
            double encoded = 0.0;
            if (event.newState == circuitStateName(CircuitState::HalfOpen)) {
                encoded = 1.0;
            } else if (event.newState == circuitStateName(CircuitState::Open)) {
                encoded = 2.0;
            }
            metrics_.setGauge(foundation::labeled("agw_circuit_state", "upstream", event.subject),
                              encoded);
            // An open upstream degrades the gateway; it never makes it unhealthy.
            metrics_.setComponentHealth("upstream." + event.subject,
                                        encoded == 0.0 ? foundation::HealthStatus::Healthy
                                                       : foundation::HealthStatus::Degraded);
            break;
        }
        case TelemetryKind::OverrideCreated:
            metrics_.incrementGauge("agw_overrides_active");
            break;
        case TelemetryKind::OverrideExpired:
            metrics_.decrementGauge("agw_overrides_active");
            break;
    }
}

// ── FanoutTelemetrySink ─────────────────────────────────────────────────────

void FanoutTelemetrySink::addSink(std::shared_ptr<ITelemetrySink> sink) {
    if (!sink) {
        return;
    }
    std::lock_guard lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void FanoutTelemetrySink::publish(const TelemetryEvent& event) {
    std::vector<std::shared_ptr<ITelemetrySink>> sinks;
    {
        std::lock_guard lock(mutex_);
        sinks = sinks_;
    }
    for (const auto& sink : sinks) {
        sink->publish(event);
    }
}

std::size_t FanoutTelemetrySink::sinkCount() const {
    std::lock_guard lock(mutex_);
    return sinks_.size();
}

}  // namespace agw::service

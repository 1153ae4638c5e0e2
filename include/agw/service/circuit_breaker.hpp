#pragma once

/// @file circuit_breaker.hpp
/// @brief Failure-ratio circuit breaker over a rolling time window.
///
/// Implements the circuit breaker pattern (Closed -> Open -> HalfOpen)
/// for one upstream. Samples are fed by the HealthMonitor aggregator;
/// routing only reads state and takes half-open trial permits.

#include "agw/foundation/clock.hpp"
#include "agw/service/admission_types.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace agw::service {

/// Configuration for a CircuitBreaker instance.
struct CircuitBreakerConfig {
    /// Failure ratio in (0, 1] that must be exceeded to open the circuit.
    double failureThreshold = 0.5;

    /// Duration the circuit stays open before transitioning to half-open.
    std::chrono::seconds recoveryTimeout{30};

    /// Age beyond which samples no longer count toward the ratio.
    std::chrono::seconds rollingWindow{30};

    /// Samples required in the window before the ratio is trusted.
    uint32_t minimumSamples = 5;

    /// Trial requests allowed in half-open; that many successes close it.
    uint32_t halfOpenProbes = 3;

    /// Upstream ID, for logging and telemetry.
    std::string name = "default";
};

/// Circuit breaker state machine.
///
/// Usage:
/// @code
///   CircuitBreaker cb(CircuitBreakerConfig{.failureThreshold = 0.5, .name = "email"}, clock);
///   cb.onTransition([](std::string_view name, CircuitState from, CircuitState to) {
///       // publish telemetry
///   });
///   cb.record(false, clock.now());
///   cb.evaluate();  // open -> half_open once the recovery timeout elapsed
/// @endcode
///
/// Thread-safe. Transition callbacks run after the internal lock is
/// released, in the order the transitions happened.
class CircuitBreaker {
public:
    using TransitionCallback =
        std::function<void(std::string_view name, CircuitState from, CircuitState to)>;

    CircuitBreaker(CircuitBreakerConfig config, const foundation::Clock& clock);

    void onTransition(TransitionCallback callback);

    /// Feed one outcome observed at @p at.
    ///
    /// Closed: trims the window and opens when the failure ratio exceeds
    /// the threshold. HalfOpen: only @p trial outcomes count; any failure
    /// re-opens and `halfOpenProbes` successes close. Open: ignored.
    void record(bool success, std::chrono::system_clock::time_point at, bool trial = false);

    /// Apply time-driven transitions (open -> half_open).
    /// @return true if the state changed.
    bool evaluate();

    /// Take a half-open trial permit. Always false outside HalfOpen.
    [[nodiscard]] bool tryAcquireTrial();

    /// Return a trial permit whose request ended without an outcome.
    void releaseTrial();

    /// Force the circuit into a specific state (operator or test action).
    void forceState(CircuitState newState);

    /// Reset all counters and return to Closed.
    void reset();

    // ── Queries ──────────────────────────────────────────────────────────

    [[nodiscard]] CircuitState state() const;

    /// Failure ratio over the current window (0 when empty).
    [[nodiscard]] double failureRatio() const;

    [[nodiscard]] std::size_t sampleCount() const;

    /// Consecutive successes observed in HalfOpen.
    [[nodiscard]] uint32_t halfOpenSuccessCount() const;

    /// Time until an open circuit may probe again, at least 1s; 0 otherwise.
    [[nodiscard]] std::chrono::seconds retryAfter() const;

    [[nodiscard]] std::string_view name() const;

    [[nodiscard]] const CircuitBreakerConfig& config() const noexcept { return config_; }

private:
    struct Transition {
        CircuitState from;
        CircuitState to;
    };

    void transitionTo(CircuitState newState, std::vector<Transition>& fired);
    void trim(std::chrono::system_clock::time_point now);
    void notify(const std::vector<Transition>& fired);

    CircuitBreakerConfig config_;
    const foundation::Clock& clock_;

    mutable std::mutex mutex_;
    CircuitState state_{CircuitState::Closed};
    std::deque<std::pair<std::chrono::system_clock::time_point, bool>> window_;
    std::size_t windowFailures_{0};
    uint32_t halfOpenSuccesses_{0};
    uint32_t trialsInFlight_{0};
    std::chrono::system_clock::time_point openedAt_{};

    std::mutex callbackMutex_;
    std::vector<TransitionCallback> callbacks_;
};

}  // namespace agw::service

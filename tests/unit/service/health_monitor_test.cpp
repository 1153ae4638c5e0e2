/// @file health_monitor_test.cpp
/// @brief Unit tests for CircuitBreaker, HealthMonitor and probes.

#include <gtest/gtest.h>

#include "agw/foundation/clock.hpp"
#include "agw/service/circuit_breaker.hpp"
#include "agw/service/health_monitor.hpp"
#include "agw/service/health_probe.hpp"
#include "agw/service/telemetry.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace agw::service;
using agw::foundation::ErrorCode;
using agw::foundation::ManualClock;

namespace {

class RecordingSink : public ITelemetrySink {
public:
    void publish(const TelemetryEvent& event) override {
        std::lock_guard lock(mutex_);
        events_.push_back(event);
    }

    std::vector<TelemetryEvent> events() const {
        std::lock_guard lock(mutex_);
        return events_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<TelemetryEvent> events_;
};

}  // namespace

// ============================================================================
// CircuitBreaker
// ============================================================================

class CircuitBreakerTest : public ::testing::Test {
protected:
    CircuitBreakerConfig config_{
        .failureThreshold = 0.5,
        .recoveryTimeout = std::chrono::seconds(30),
        .rollingWindow = std::chrono::seconds(30),
        .minimumSamples = 4,
        .halfOpenProbes = 2,
        .name = "messaging",
    };
    ManualClock clock_;

    void feed(CircuitBreaker& cb, int successes, int failures, bool trial = false) {
        for (int i = 0; i < successes; ++i) {
            cb.record(true, clock_.now(), trial);
        }
        for (int i = 0; i < failures; ++i) {
            cb.record(false, clock_.now(), trial);
        }
    }
};

TEST_F(CircuitBreakerTest, StartsClosed) {
    CircuitBreaker cb(config_, clock_);
    EXPECT_EQ(cb.state(), CircuitState::Closed);
    EXPECT_EQ(cb.name(), "messaging");
    EXPECT_DOUBLE_EQ(cb.failureRatio(), 0.0);
    EXPECT_EQ(cb.retryAfter(), std::chrono::seconds(0));
}

TEST_F(CircuitBreakerTest, StaysClosedBelowMinimumSamples) {
    CircuitBreaker cb(config_, clock_);
    feed(cb, 0, 3);
    EXPECT_EQ(cb.state(), CircuitState::Closed);
    EXPECT_DOUBLE_EQ(cb.failureRatio(), 1.0);
}

TEST_F(CircuitBreakerTest, RatioAtThresholdDoesNotOpen) {
    CircuitBreaker cb(config_, clock_);
    feed(cb, 2, 2);
    EXPECT_EQ(cb.state(), CircuitState::Closed);
    EXPECT_DOUBLE_EQ(cb.failureRatio(), 0.5);
}

TEST_F(CircuitBreakerTest, RatioAboveThresholdOpens) {
    CircuitBreaker cb(config_, clock_);
    feed(cb, 1, 3);
    EXPECT_EQ(cb.state(), CircuitState::Open);
    EXPECT_EQ(cb.retryAfter(), std::chrono::seconds(30));
    // A fresh window starts with the new state.
    EXPECT_EQ(cb.sampleCount(), 0u);
}

TEST_F(CircuitBreakerTest, OldSamplesAgeOut) {
    CircuitBreaker cb(config_, clock_);
    feed(cb, 0, 3);
    clock_.advance(std::chrono::seconds(31));
    feed(cb, 1, 0);
    EXPECT_EQ(cb.sampleCount(), 1u);
    EXPECT_EQ(cb.state(), CircuitState::Closed);
}

TEST_F(CircuitBreakerTest, SampleOlderThanWindowIgnored) {
    CircuitBreaker cb(config_, clock_);
    cb.record(false, clock_.now() - std::chrono::seconds(45));
    EXPECT_EQ(cb.sampleCount(), 0u);
}

TEST_F(CircuitBreakerTest, OpenIgnoresSamplesAndRecoversAfterTimeout) {
    CircuitBreaker cb(config_, clock_);
    feed(cb, 0, 4);
    ASSERT_EQ(cb.state(), CircuitState::Open);

    feed(cb, 10, 0);
    EXPECT_EQ(cb.state(), CircuitState::Open);

    clock_.advance(std::chrono::seconds(20));
    EXPECT_FALSE(cb.evaluate());
    EXPECT_EQ(cb.retryAfter(), std::chrono::seconds(10));

    clock_.advance(std::chrono::seconds(10));
    EXPECT_TRUE(cb.evaluate());
    EXPECT_EQ(cb.state(), CircuitState::HalfOpen);
    EXPECT_EQ(cb.retryAfter(), std::chrono::seconds(1));
}

TEST_F(CircuitBreakerTest, HalfOpenClosesAfterProbeSuccesses) {
    CircuitBreaker cb(config_, clock_);
    cb.forceState(CircuitState::HalfOpen);

    feed(cb, 1, 0, true);
    EXPECT_EQ(cb.state(), CircuitState::HalfOpen);
    EXPECT_EQ(cb.halfOpenSuccessCount(), 1u);

    feed(cb, 1, 0, true);
    EXPECT_EQ(cb.state(), CircuitState::Closed);
}

TEST_F(CircuitBreakerTest, HalfOpenIgnoresNonTrialOutcomes) {
    CircuitBreaker cb(config_, clock_);
    feed(cb, 0, 4);
    clock_.advance(std::chrono::seconds(30));
    ASSERT_TRUE(cb.evaluate());
    ASSERT_EQ(cb.state(), CircuitState::HalfOpen);

    // Late outcomes of requests admitted before the trip.
    feed(cb, 3, 0);
    EXPECT_EQ(cb.state(), CircuitState::HalfOpen);
    EXPECT_EQ(cb.halfOpenSuccessCount(), 0u);
    feed(cb, 0, 1);
    EXPECT_EQ(cb.state(), CircuitState::HalfOpen);

    feed(cb, 0, 1, true);
    EXPECT_EQ(cb.state(), CircuitState::Open);
}

TEST_F(CircuitBreakerTest, HalfOpenFailureReopens) {
    CircuitBreaker cb(config_, clock_);
    cb.forceState(CircuitState::HalfOpen);
    feed(cb, 1, 1, true);
    EXPECT_EQ(cb.state(), CircuitState::Open);
    EXPECT_EQ(cb.retryAfter(), std::chrono::seconds(30));
}

TEST_F(CircuitBreakerTest, TrialPermitsBoundedByProbes) {
    CircuitBreaker cb(config_, clock_);
    EXPECT_FALSE(cb.tryAcquireTrial());

    cb.forceState(CircuitState::HalfOpen);
    EXPECT_TRUE(cb.tryAcquireTrial());
    EXPECT_TRUE(cb.tryAcquireTrial());
    EXPECT_FALSE(cb.tryAcquireTrial());

    cb.releaseTrial();
    EXPECT_TRUE(cb.tryAcquireTrial());
}

TEST_F(CircuitBreakerTest, TransitionCallbacksInOrder) {
    CircuitBreaker cb(config_, clock_);
    std::vector<std::pair<CircuitState, CircuitState>> seen;
    cb.onTransition([&](std::string_view name, CircuitState from, CircuitState to) {
        EXPECT_EQ(name, "messaging");
        seen.emplace_back(from, to);
    });

    feed(cb, 0, 4);
    clock_.advance(std::chrono::seconds(30));
    cb.evaluate();
    feed(cb, 2, 0, true);

    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0], std::make_pair(CircuitState::Closed, CircuitState::Open));
    EXPECT_EQ(seen[1], std::make_pair(CircuitState::Open, CircuitState::HalfOpen));
    EXPECT_EQ(seen[2], std::make_pair(CircuitState::HalfOpen, CircuitState::Closed));
}

TEST_F(CircuitBreakerTest, ResetReturnsToClosed) {
    CircuitBreaker cb(config_, clock_);
    feed(cb, 0, 4);
    cb.reset();
    EXPECT_EQ(cb.state(), CircuitState::Closed);
    EXPECT_EQ(cb.sampleCount(), 0u);
}

// ============================================================================
// HealthMonitor
// ============================================================================

class HealthMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        sink_ = std::make_shared<RecordingSink>();
        monitor_ = std::make_unique<HealthMonitor>(config_, clock_, sink_);
    }

    HealthMonitorConfig config_{
        .probeInterval = std::chrono::milliseconds(200),
        .rollingWindow = std::chrono::seconds(30),
        .minimumSamples = 4,
        .probeThreads = 2,
    };
    ManualClock clock_;
    std::shared_ptr<RecordingSink> sink_;
    std::unique_ptr<HealthMonitor> monitor_;

    UpstreamService upstream(std::string id, bool critical = false) {
        UpstreamService service;
        service.id = std::move(id);
        service.failureThreshold = 0.5;
        service.recoveryTimeout = std::chrono::seconds(30);
        service.criticalPath = critical;
        service.halfOpenProbes = 2;
        return service;
    }
};

TEST_F(HealthMonitorTest, RegisterValidatesConfig) {
    EXPECT_TRUE(monitor_->registerUpstream(upstream("payments")).hasValue());

    auto dup = monitor_->registerUpstream(upstream("payments"));
    ASSERT_TRUE(dup.hasError());
    EXPECT_EQ(dup.error().code(), ErrorCode::UpstreamAlreadyRegistered);

    EXPECT_EQ(monitor_->registerUpstream(upstream("")).error().code(),
              ErrorCode::InvalidArgument);

    auto badThreshold = upstream("a");
    badThreshold.failureThreshold = 0.0;
    EXPECT_EQ(monitor_->registerUpstream(badThreshold).error().code(),
              ErrorCode::InvalidArgument);
    badThreshold.failureThreshold = 1.5;
    EXPECT_EQ(monitor_->registerUpstream(badThreshold).error().code(),
              ErrorCode::InvalidArgument);

    auto noSlots = upstream("b");
    noSlots.maxConcurrency = 0;
    EXPECT_EQ(monitor_->registerUpstream(noSlots).error().code(), ErrorCode::InvalidArgument);

    auto noRecovery = upstream("c");
    noRecovery.recoveryTimeout = std::chrono::seconds(0);
    EXPECT_EQ(monitor_->registerUpstream(noRecovery).error().code(),
              ErrorCode::InvalidArgument);
}

TEST_F(HealthMonitorTest, UnknownUpstream) {
    EXPECT_EQ(monitor_->state("ghost").error().code(), ErrorCode::UpstreamNotFound);
    EXPECT_FALSE(monitor_->snapshot("ghost").has_value());
    EXPECT_EQ(monitor_->forceState("ghost", CircuitState::Open).error().code(),
              ErrorCode::UpstreamNotFound);

    monitor_->recordOutcome("ghost", false, std::chrono::milliseconds(5));
    EXPECT_EQ(monitor_->pendingSamples(), 0u);
}

TEST_F(HealthMonitorTest, PassiveSamplesAreQueuedUntilDrained) {
    ASSERT_TRUE(monitor_->registerUpstream(upstream("messaging")).hasValue());

    for (int i = 0; i < 4; ++i) {
        monitor_->recordOutcome("messaging", false, std::chrono::milliseconds(100));
    }
    EXPECT_EQ(monitor_->pendingSamples(), 4u);
    // Nothing is applied on the request path.
    EXPECT_EQ(monitor_->state("messaging").value(), CircuitState::Closed);

    EXPECT_EQ(monitor_->drain(), 4u);
    EXPECT_EQ(monitor_->state("messaging").value(), CircuitState::Open);
}

TEST_F(HealthMonitorTest, TransitionsArePublished) {
    ASSERT_TRUE(monitor_->registerUpstream(upstream("payments", true)).hasValue());

    for (int i = 0; i < 4; ++i) {
        monitor_->recordOutcome("payments", false, std::chrono::milliseconds(100));
    }
    monitor_->drain();

    auto events = sink_->events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind, TelemetryKind::CircuitTransition);
    EXPECT_EQ(events[0].subject, "payments");
    EXPECT_EQ(events[0].oldState, "closed");
    EXPECT_EQ(events[0].newState, "open");
    EXPECT_NE(events[0].detail.find("critical_path"), std::string::npos);
}

TEST_F(HealthMonitorTest, DrainDrivesRecoveryTimer) {
    ASSERT_TRUE(monitor_->registerUpstream(upstream("messaging")).hasValue());
    ASSERT_TRUE(monitor_->forceState("messaging", CircuitState::Open).hasValue());

    clock_.advance(std::chrono::seconds(29));
    monitor_->drain();
    EXPECT_EQ(monitor_->state("messaging").value(), CircuitState::Open);
    EXPECT_EQ(monitor_->snapshot("messaging")->retryAfter, std::chrono::seconds(1));

    clock_.advance(std::chrono::seconds(1));
    monitor_->drain();
    EXPECT_EQ(monitor_->state("messaging").value(), CircuitState::HalfOpen);

    EXPECT_TRUE(monitor_->tryAcquireTrial("messaging"));
    EXPECT_TRUE(monitor_->tryAcquireTrial("messaging"));
    EXPECT_FALSE(monitor_->tryAcquireTrial("messaging"));
    monitor_->releaseTrial("messaging");

    // Ordinary passive outcomes do not count as trials.
    monitor_->recordOutcome("messaging", true, std::chrono::milliseconds(10));
    monitor_->recordOutcome("messaging", true, std::chrono::milliseconds(10));
    monitor_->drain();
    EXPECT_EQ(monitor_->state("messaging").value(), CircuitState::HalfOpen);

    monitor_->recordOutcome("messaging", true, std::chrono::milliseconds(10), true);
    monitor_->recordOutcome("messaging", true, std::chrono::milliseconds(10), true);
    monitor_->drain();
    EXPECT_EQ(monitor_->state("messaging").value(), CircuitState::Closed);
}

TEST_F(HealthMonitorTest, LatencyEwmaUsesSuccessfulSamples) {
    ASSERT_TRUE(monitor_->registerUpstream(upstream("payments")).hasValue());
    EXPECT_FALSE(monitor_->snapshot("payments")->latencyMs.has_value());

    monitor_->recordOutcome("payments", true, std::chrono::milliseconds(100));
    monitor_->drain();
    EXPECT_DOUBLE_EQ(*monitor_->snapshot("payments")->latencyMs, 100.0);

    monitor_->recordOutcome("payments", true, std::chrono::milliseconds(200));
    monitor_->recordOutcome("payments", false, std::chrono::milliseconds(5000));
    monitor_->drain();

    auto snap = monitor_->snapshot("payments");
    ASSERT_TRUE(snap.has_value());
    EXPECT_DOUBLE_EQ(*snap->latencyMs, 0.2 * 200.0 + 0.8 * 100.0);
    EXPECT_EQ(snap->samples, 3u);
    EXPECT_NEAR(snap->failureRatio, 1.0 / 3.0, 1e-9);
}

TEST_F(HealthMonitorTest, SnapshotsAreSortedById) {
    ASSERT_TRUE(monitor_->registerUpstream(upstream("storage")).hasValue());
    ASSERT_TRUE(monitor_->registerUpstream(upstream("email")).hasValue());
    ASSERT_TRUE(monitor_->registerUpstream(upstream("payments")).hasValue());

    auto all = monitor_->snapshots();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].service.id, "email");
    EXPECT_EQ(all[1].service.id, "payments");
    EXPECT_EQ(all[2].service.id, "storage");
}

TEST_F(HealthMonitorTest, ProbeCycleFeedsSamples) {
    std::atomic<int> calls{0};
    ASSERT_TRUE(monitor_->registerUpstream(upstream("email"), [&calls] {
        calls.fetch_add(1);
        return ProbeResult{true, std::chrono::milliseconds(7)};
    }).hasValue());
    ASSERT_TRUE(monitor_->registerUpstream(upstream("storage"), [] {
        throw std::runtime_error("dns failure");
        return ProbeResult{};
    }).hasValue());
    // No probe: passive samples only.
    ASSERT_TRUE(monitor_->registerUpstream(upstream("payments")).hasValue());

    auto cycle = monitor_->runProbeCycle();
    ASSERT_TRUE(cycle.hasValue());
    EXPECT_EQ(cycle.value(), 2u);
    EXPECT_EQ(calls.load(), 1);

    EXPECT_EQ(monitor_->drain(), 2u);
    EXPECT_DOUBLE_EQ(*monitor_->snapshot("email")->latencyMs, 7.0);
    EXPECT_DOUBLE_EQ(monitor_->snapshot("storage")->failureRatio, 1.0);
}

TEST_F(HealthMonitorTest, SlowProbeCountsAsFailure) {
    std::atomic<bool> release{false};
    ASSERT_TRUE(monitor_->registerUpstream(upstream("storage"), [&release] {
        while (!release.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return ProbeResult{true, std::chrono::milliseconds(1)};
    }).hasValue());

    auto cycle = monitor_->runProbeCycle();
    ASSERT_TRUE(cycle.hasValue());
    release.store(true);

    EXPECT_EQ(monitor_->drain(), 1u);
    EXPECT_DOUBLE_EQ(monitor_->snapshot("storage")->failureRatio, 1.0);

    // The late result is discarded rather than counted twice.
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(monitor_->drain(), 0u);
}

TEST_F(HealthMonitorTest, StartStop) {
    ASSERT_TRUE(monitor_->registerUpstream(upstream("email")).hasValue());
    ASSERT_TRUE(monitor_->start().hasValue());
    EXPECT_TRUE(monitor_->isRunning());

    auto again = monitor_->start();
    ASSERT_TRUE(again.hasError());
    EXPECT_EQ(again.error().code(), ErrorCode::MonitorAlreadyRunning);

    monitor_->recordOutcome("email", true, std::chrono::milliseconds(3));
    monitor_->stop();
    EXPECT_FALSE(monitor_->isRunning());
    // Remaining samples are applied on stop.
    EXPECT_EQ(monitor_->pendingSamples(), 0u);
    EXPECT_EQ(monitor_->snapshot("email")->samples, 1u);

    // Idempotent.
    monitor_->stop();
}

// ============================================================================
// Probes
// ============================================================================

TEST(ProbeAddressTest, ParsesHostAndPort) {
    auto v4 = ProbeAddress::parse("payments.internal:8443");
    ASSERT_TRUE(v4.hasValue());
    EXPECT_EQ(v4.value().host, "payments.internal");
    EXPECT_EQ(v4.value().port, 8443);

    auto v6 = ProbeAddress::parse("[::1]:9000");
    ASSERT_TRUE(v6.hasValue());
    EXPECT_EQ(v6.value().host, "::1");
    EXPECT_EQ(v6.value().port, 9000);
}

TEST(ProbeAddressTest, RejectsMalformedAddresses) {
    EXPECT_TRUE(ProbeAddress::parse("no-port").hasError());
    EXPECT_TRUE(ProbeAddress::parse(":80").hasError());
    EXPECT_TRUE(ProbeAddress::parse("host:0").hasError());
    EXPECT_TRUE(ProbeAddress::parse("host:70000").hasError());
    EXPECT_TRUE(ProbeAddress::parse("host:80x").hasError());
    EXPECT_TRUE(ProbeAddress::parse("[::1]9000").hasError());
}

TEST(TcpConnectProbeTest, RefusedConnectionFails) {
    TcpConnectProbe probe(ProbeAddress{"127.0.0.1", 1}, std::chrono::milliseconds(100));
    auto result = probe();
    EXPECT_FALSE(result.success);
}

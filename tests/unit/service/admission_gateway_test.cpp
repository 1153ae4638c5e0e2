/// @file admission_gateway_test.cpp
/// @brief Unit tests for the AdmissionGateway orchestrator.

#include <gtest/gtest.h>

#include "agw/foundation/clock.hpp"
#include "agw/foundation/gateway_metrics.hpp"
#include "agw/service/admission_gateway.hpp"
#include "agw/service/counter_store.hpp"
#include "agw/service/health_monitor.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

using namespace agw::service;
using namespace std::chrono_literals;
using agw::foundation::ErrorCode;
using agw::foundation::GatewayError;
using agw::foundation::GatewayMetrics;
using agw::foundation::GatewayResult;
using agw::foundation::ManualClock;
using agw::foundation::labeled;
namespace metric = agw::foundation::metric;

namespace {

constexpr auto kWeddingNoon =
    std::chrono::sys_days{std::chrono::year{2026} / 10 / 17} + std::chrono::hours(12);

enum class StoreMode { Up, Down, Throwing };

/// In-memory store that can be switched into an outage.
class SwitchableCounterStore : public ICounterStore {
public:
    GatewayResult<CounterUpdate> tryIncrement(
        std::string_view key, uint64_t cost, uint64_t limit,
        std::chrono::system_clock::time_point expiresAt,
        std::chrono::milliseconds deadline) override {
        switch (mode.load()) {
            case StoreMode::Down:
                return GatewayResult<CounterUpdate>::err(
                    GatewayError(ErrorCode::StoreUnavailable, "connection refused"));
            case StoreMode::Throwing:
                throw std::runtime_error("counter store driver crashed");
            case StoreMode::Up:
                break;
        }
        return inner_.tryIncrement(key, cost, limit, expiresAt, deadline);
    }

    GatewayResult<uint64_t> peek(std::string_view key) const override {
        return inner_.peek(key);
    }

    std::size_t removeExpired(std::chrono::system_clock::time_point now) override {
        return inner_.removeExpired(now);
    }

    std::atomic<StoreMode> mode{StoreMode::Up};

private:
    InMemoryCounterStore inner_;
};

class ThrowingDirectory : public IPrincipalDirectory {
public:
    std::optional<Principal> find(std::string_view /*principalId*/) const override {
        throw std::runtime_error("directory offline");
    }
    void upsert(Principal /*principal*/) override {}
    bool remove(std::string_view /*principalId*/) override { return false; }
};

RateLimitRule rule(std::string name, std::string pattern, uint64_t quota,
                   double multiplier = 1.0, bool critical = false) {
    RateLimitRule r;
    r.name = std::move(name);
    r.resourcePattern = std::move(pattern);
    r.baseQuota = quota;
    r.window = std::chrono::seconds(60);
    r.priorityMultiplier = multiplier;
    r.criticalPath = critical;
    return r;
}

RequestContext weddingContext(std::optional<std::string> urgency = std::nullopt) {
    RequestContext ctx;
    ctx.eventId = "w-2291";
    ctx.eventDate = "2026-10-17";
    ctx.declaredUrgency = std::move(urgency);
    return ctx;
}

}  // namespace

// ============================================================================
// Fixture
// ============================================================================

class AdmissionGatewayTest : public ::testing::Test {
protected:
    void SetUp() override {
        Principal vendor;
        vendor.id = "vendor-118";
        vendor.tier = Tier::Standard;
        vendor.eventBindings = {"w-2291"};
        directory_.upsert(vendor);

        Principal trial;
        trial.id = "vendor-free";
        trial.tier = Tier::Free;
        directory_.upsert(trial);

        ASSERT_TRUE(rules_
                        .setTierRules(Tier::Standard,
                                      {rule("standard:/api/payments/*", "/api/payments/*", 100,
                                            1.5, true),
                                       rule("standard:/api/forms/*", "/api/forms/*", 5),
                                       rule("standard:/api/reports/*", "/api/reports/*", 5)})
                        .hasValue());
        ASSERT_TRUE(rules_.setTierRules(Tier::Free, {rule("free:/api/forms/*", "/api/forms/*", 2)})
                        .hasValue());

        routes_.addRoute({"/api/payments/*", {"payments-primary", "payments-secondary"},
                          "payments-queue"});
        routes_.addRoute({"/api/forms/*", {"forms"}, std::nullopt});

        for (const char* id :
             {"payments-primary", "payments-secondary", "payments-queue", "forms"}) {
            UpstreamService service;
            service.id = id;
            service.maxConcurrency = 64;
            service.recoveryTimeout = std::chrono::seconds(30);
            ASSERT_TRUE(monitor_.registerUpstream(service).hasValue());
            ASSERT_TRUE(routing_.addUpstream(service).hasValue());
        }
    }

    GatewayComponents components(IPrincipalDirectory& directory) {
        return GatewayComponents{clock_,       directory, rules_,   routes_,  classifier_,
                                 overrides_,   ledger_,   routing_, metrics_};
    }

    ManualClock clock_{kWeddingNoon};
    InMemoryPrincipalDirectory directory_;
    RuleRegistry rules_;
    ResourceRouteTable routes_;
    PriorityClassifier classifier_;
    OverrideRegistry overrides_{clock_};
    std::shared_ptr<SwitchableCounterStore> store_ =
        std::make_shared<SwitchableCounterStore>();
    QuotaLedger ledger_{store_, clock_, LedgerConfig{.storeDeadline = 50ms, .retryBackoff = 0ms}};
    HealthMonitor monitor_{HealthMonitorConfig{.minimumSamples = 4}, clock_};
    RoutingEngine routing_{monitor_};
    GatewayMetrics metrics_;
    AdmissionGateway gateway_{components(directory_)};
};

// ============================================================================
// Happy path
// ============================================================================

TEST_F(AdmissionGatewayTest, AdmitsAndRoutes) {
    auto d = gateway_.admit("vendor-118", "/api/forms/submit", {});

    ASSERT_TRUE(d.allowed);
    EXPECT_EQ(d.priority, PriorityClass::Normal);
    EXPECT_EQ(d.upstreamTarget, "forms");
    EXPECT_FALSE(d.degraded);
    EXPECT_FALSE(d.failedOpen);
    EXPECT_FALSE(d.reason.has_value());
    EXPECT_EQ(d.limit, 5u);
    EXPECT_EQ(d.remaining, 4u);
    ASSERT_TRUE(d.resetAt.has_value());
    EXPECT_EQ(*d.resetAt, kWeddingNoon + std::chrono::seconds(60));
    ASSERT_NE(d.lease, nullptr);
    EXPECT_EQ(d.requestId.size(), 36u);

    EXPECT_EQ(metrics_.counterValue(labeled(metric::kAdmissions, "priority", "normal")), 1u);
}

TEST_F(AdmissionGatewayTest, ReportOutcomeReleasesLease) {
    auto d = gateway_.admit("vendor-118", "/api/forms/submit", {});
    ASSERT_TRUE(d.allowed);
    EXPECT_EQ(routing_.inFlight("forms"), 1u);

    gateway_.reportOutcome(d, true, 25ms);
    EXPECT_EQ(d.lease, nullptr);
    EXPECT_EQ(routing_.inFlight("forms"), 0u);
    EXPECT_EQ(monitor_.pendingSamples(), 1u);

    // Reporting twice is harmless.
    gateway_.reportOutcome(d, false, 25ms);
    EXPECT_EQ(monitor_.pendingSamples(), 1u);
}

// ============================================================================
// Request validation
// ============================================================================

TEST_F(AdmissionGatewayTest, RejectsIncompleteRequests) {
    auto noPrincipal = gateway_.admit("", "/api/forms/submit", {});
    EXPECT_FALSE(noPrincipal.allowed);
    EXPECT_EQ(noPrincipal.reason, DenyReason::InvalidRequest);

    AdmissionRequest zeroCost;
    zeroCost.principalId = "vendor-118";
    zeroCost.resource = "/api/forms/submit";
    zeroCost.cost = 0;
    EXPECT_EQ(gateway_.admit(zeroCost).reason, DenyReason::InvalidRequest);

    EXPECT_EQ(metrics_.counterValue(labeled(metric::kDenials, "reason", "InvalidRequest")), 2u);
}

TEST_F(AdmissionGatewayTest, UnknownPrincipalDenied) {
    auto d = gateway_.admit("vendor-404", "/api/forms/submit", {});
    EXPECT_FALSE(d.allowed);
    EXPECT_EQ(d.reason, DenyReason::UnknownPrincipal);
    EXPECT_EQ(d.lease, nullptr);
}

TEST_F(AdmissionGatewayTest, MissingRuleOrRouteIsConfigurationMissing) {
    auto noRule = gateway_.admit("vendor-118", "/api/unknown", {});
    EXPECT_FALSE(noRule.allowed);
    EXPECT_EQ(noRule.reason, DenyReason::ConfigurationMissing);

    // Free tier has no payments rule; there is no implicit unlimited default.
    auto freeTier = gateway_.admit("vendor-free", "/api/payments/charge", {});
    EXPECT_EQ(freeTier.reason, DenyReason::ConfigurationMissing);

    auto noRoute = gateway_.admit("vendor-118", "/api/reports/daily", {});
    EXPECT_EQ(noRoute.reason, DenyReason::ConfigurationMissing);
    EXPECT_NE(noRoute.detail.find("/api/reports/daily"), std::string::npos);
}

// ============================================================================
// Quota
// ============================================================================

TEST_F(AdmissionGatewayTest, QuotaExhaustionDeniesWithRetryHint) {
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(gateway_.admit("vendor-118", "/api/forms/submit", {}).allowed) << i;
    }

    clock_.advance(std::chrono::seconds(15));
    auto d = gateway_.admit("vendor-118", "/api/forms/submit", {});
    EXPECT_FALSE(d.allowed);
    EXPECT_EQ(d.reason, DenyReason::QuotaExceeded);
    EXPECT_EQ(d.retryAfterSeconds, 45);
    EXPECT_EQ(d.limit, 5u);
    EXPECT_EQ(d.remaining, 0u);
    EXPECT_FALSE(d.upstreamTarget.has_value());
    EXPECT_EQ(d.lease, nullptr);

    // The next window starts fresh.
    clock_.advance(std::chrono::seconds(45));
    EXPECT_TRUE(gateway_.admit("vendor-118", "/api/forms/submit", {}).allowed);
}

TEST_F(AdmissionGatewayTest, PrincipalsHaveIndependentQuotas) {
    ASSERT_TRUE(gateway_.admit("vendor-free", "/api/forms/a", {}).allowed);
    ASSERT_TRUE(gateway_.admit("vendor-free", "/api/forms/b", {}).allowed);
    EXPECT_EQ(gateway_.admit("vendor-free", "/api/forms/c", {}).reason,
              DenyReason::QuotaExceeded);

    EXPECT_TRUE(gateway_.admit("vendor-118", "/api/forms/a", {}).allowed);
}

// ============================================================================
// Priority
// ============================================================================

TEST_F(AdmissionGatewayTest, EventDayBoostsPriorityAndQuota) {
    auto d = gateway_.admit("vendor-118", "/api/payments/charge", weddingContext());
    ASSERT_TRUE(d.allowed);
    EXPECT_EQ(d.priority, PriorityClass::High);
    EXPECT_EQ(d.limit, 150u);

    auto critical = gateway_.admit("vendor-118", "/api/payments/charge",
                                   weddingContext("critical"));
    ASSERT_TRUE(critical.allowed);
    EXPECT_EQ(critical.priority, PriorityClass::Critical);

    auto plain = gateway_.admit("vendor-118", "/api/payments/charge", {});
    EXPECT_EQ(plain.priority, PriorityClass::Normal);
    EXPECT_EQ(plain.limit, 100u);
}

TEST_F(AdmissionGatewayTest, UnboundEventGetsNoBoost) {
    RequestContext ctx;
    ctx.eventId = "w-9999";
    ctx.eventDate = "2026-10-17";

    auto d = gateway_.admit("vendor-118", "/api/payments/charge", ctx);
    ASSERT_TRUE(d.allowed);
    EXPECT_EQ(d.priority, PriorityClass::Normal);
    EXPECT_EQ(d.limit, 100u);
}

TEST_F(AdmissionGatewayTest, OverrideRaisesQuotaUntilExpired) {
    OverrideRequest request;
    request.scope = OverrideScope::principal("vendor-118");
    request.effect = OverrideEffect::quotaMultiplier(2.0);
    request.expiresAt = kWeddingNoon + std::chrono::hours(2);
    request.issuedBy = "ops@example.com";

    auto created = gateway_.createOverride(request);
    ASSERT_TRUE(created.hasValue());

    auto boosted = gateway_.admit("vendor-118", "/api/forms/submit", {});
    ASSERT_TRUE(boosted.allowed);
    EXPECT_EQ(boosted.limit, 10u);

    ASSERT_TRUE(gateway_.expireOverride(created.value().id, "ops@example.com").hasValue());
    auto normal = gateway_.admit("vendor-118", "/api/forms/submit", {});
    EXPECT_EQ(normal.limit, 5u);

    auto missing = gateway_.expireOverride(agw::foundation::OverrideId(77), "ops");
    ASSERT_TRUE(missing.hasError());
    EXPECT_EQ(missing.error().code(), ErrorCode::OverrideNotFound);
}

TEST_F(AdmissionGatewayTest, PriorityFloorOverride) {
    OverrideRequest request;
    request.scope = OverrideScope::event("w-2291");
    request.effect = OverrideEffect::priorityFloor(PriorityClass::Critical);
    request.expiresAt = kWeddingNoon + std::chrono::hours(1);
    request.issuedBy = "ops";
    ASSERT_TRUE(gateway_.createOverride(request).hasValue());

    EXPECT_EQ(gateway_.admit("vendor-118", "/api/payments/charge", weddingContext()).priority,
              PriorityClass::Critical);
    EXPECT_EQ(gateway_.admit("vendor-118", "/api/payments/charge", {}).priority,
              PriorityClass::Normal);
}

// ============================================================================
// Routing
// ============================================================================

TEST_F(AdmissionGatewayTest, FailsOverToSecondaryThenFallback) {
    ASSERT_TRUE(monitor_.forceState("payments-primary", CircuitState::Open).hasValue());

    auto secondary = gateway_.admit("vendor-118", "/api/payments/charge", {});
    ASSERT_TRUE(secondary.allowed);
    EXPECT_EQ(secondary.upstreamTarget, "payments-secondary");
    EXPECT_FALSE(secondary.degraded);

    ASSERT_TRUE(monitor_.forceState("payments-secondary", CircuitState::Open).hasValue());
    auto fallback = gateway_.admit("vendor-118", "/api/payments/charge", {});
    ASSERT_TRUE(fallback.allowed);
    EXPECT_EQ(fallback.upstreamTarget, "payments-queue");
    EXPECT_TRUE(fallback.degraded);
    EXPECT_EQ(metrics_.counterValue(metric::kDegraded), 1u);
}

TEST_F(AdmissionGatewayTest, NoHealthyUpstreamStillConsumesQuota) {
    ASSERT_TRUE(monitor_.forceState("forms", CircuitState::Open).hasValue());

    auto d = gateway_.admit("vendor-118", "/api/forms/submit", {});
    EXPECT_FALSE(d.allowed);
    EXPECT_EQ(d.reason, DenyReason::UpstreamUnavailable);
    EXPECT_EQ(d.detail, "no_healthy_upstream");
    EXPECT_EQ(d.retryAfterSeconds, 30);
    EXPECT_EQ(d.remaining, 4u);
    EXPECT_EQ(d.lease, nullptr);
}

// ============================================================================
// Failure paths
// ============================================================================

TEST_F(AdmissionGatewayTest, StoreOutageFailsClosedForOrdinaryTraffic) {
    store_->mode = StoreMode::Down;

    auto d = gateway_.admit("vendor-118", "/api/forms/submit", {});
    EXPECT_FALSE(d.allowed);
    EXPECT_EQ(d.reason, DenyReason::StoreUnavailable);
    EXPECT_EQ(d.retryAfterSeconds, 1);
    EXPECT_EQ(ledger_.failClosedCount(), 1u);
}

TEST_F(AdmissionGatewayTest, StoreOutageNeverFailsClosedForCriticalPriority) {
    OverrideRequest request;
    request.scope = OverrideScope::principal("vendor-118");
    request.effect = OverrideEffect::priorityFloor(PriorityClass::Critical);
    request.expiresAt = kWeddingNoon + std::chrono::hours(1);
    request.issuedBy = "ops";
    ASSERT_TRUE(gateway_.createOverride(request).hasValue());
    store_->mode = StoreMode::Down;

    // Ordinary rule, no event context: only the override makes it critical.
    auto d = gateway_.admit("vendor-118", "/api/forms/submit", {});
    ASSERT_TRUE(d.allowed);
    EXPECT_EQ(d.priority, PriorityClass::Critical);
    EXPECT_TRUE(d.failedOpen);
    EXPECT_EQ(d.upstreamTarget, "forms");
    EXPECT_EQ(ledger_.failOpenCount(), 1u);
    EXPECT_EQ(ledger_.failClosedCount(), 0u);

    // Other principals still fail closed.
    auto other = gateway_.admit("vendor-free", "/api/forms/submit", {});
    EXPECT_EQ(other.reason, DenyReason::StoreUnavailable);
}

TEST_F(AdmissionGatewayTest, StoreOutageFailsOpenForEventDayCriticalPath) {
    store_->mode = StoreMode::Down;

    auto d = gateway_.admit("vendor-118", "/api/payments/charge", weddingContext());
    ASSERT_TRUE(d.allowed);
    EXPECT_TRUE(d.failedOpen);
    EXPECT_FALSE(d.degraded);
    EXPECT_TRUE(d.upstreamTarget.has_value());

    // Same rule without the event binding fails closed.
    auto plain = gateway_.admit("vendor-118", "/api/payments/charge", {});
    EXPECT_EQ(plain.reason, DenyReason::StoreUnavailable);
}

TEST_F(AdmissionGatewayTest, UnexpectedErrorDeniesNormalTraffic) {
    store_->mode = StoreMode::Throwing;

    auto d = gateway_.admit("vendor-118", "/api/forms/submit", {});
    EXPECT_FALSE(d.allowed);
    EXPECT_EQ(d.reason, DenyReason::InternalError);
    EXPECT_EQ(d.retryAfterSeconds, 1);
}

TEST_F(AdmissionGatewayTest, UnexpectedErrorDegradesCriticalTraffic) {
    store_->mode = StoreMode::Throwing;

    auto d = gateway_.admit("vendor-118", "/api/payments/charge", weddingContext("critical"));
    ASSERT_TRUE(d.allowed);
    EXPECT_EQ(d.priority, PriorityClass::Critical);
    EXPECT_TRUE(d.degraded);
    EXPECT_EQ(d.upstreamTarget, "payments-queue");
    EXPECT_EQ(d.lease, nullptr);
    EXPECT_NE(d.detail.find("counter store driver crashed"), std::string::npos);
}

TEST_F(AdmissionGatewayTest, DirectoryFailureBeforeClassificationDenies) {
    ThrowingDirectory broken;
    AdmissionGateway gateway(components(broken));

    auto d = gateway.admit("vendor-118", "/api/payments/charge", weddingContext("critical"));
    EXPECT_FALSE(d.allowed);
    EXPECT_EQ(d.reason, DenyReason::InternalError);
}

// ============================================================================
// Helpers
// ============================================================================

TEST(DenyReasonMappingTest, ComponentErrorsMapToPublicReasons) {
    EXPECT_EQ(denyReasonFor(ErrorCode::QuotaExceeded), DenyReason::QuotaExceeded);
    EXPECT_EQ(denyReasonFor(ErrorCode::UpstreamUnavailable), DenyReason::UpstreamUnavailable);
    EXPECT_EQ(denyReasonFor(ErrorCode::UpstreamSaturated), DenyReason::UpstreamSaturated);
    EXPECT_EQ(denyReasonFor(ErrorCode::NoRouteForResource), DenyReason::ConfigurationMissing);
    EXPECT_EQ(denyReasonFor(ErrorCode::StoreTimeout), DenyReason::StoreUnavailable);
    EXPECT_EQ(denyReasonFor(ErrorCode::UnknownPrincipal), DenyReason::UnknownPrincipal);
    EXPECT_EQ(denyReasonFor(ErrorCode::InvalidCost), DenyReason::InvalidRequest);
    EXPECT_EQ(denyReasonFor(ErrorCode::ThreadError), DenyReason::InternalError);
}

TEST(DenyReasonMappingTest, MakeDenialFillsFields) {
    auto d = makeDenial(DenyReason::UpstreamSaturated, "upstream_saturated",
                        PriorityClass::High, 1);
    EXPECT_FALSE(d.allowed);
    EXPECT_EQ(d.reason, DenyReason::UpstreamSaturated);
    EXPECT_EQ(d.detail, "upstream_saturated");
    EXPECT_EQ(d.priority, PriorityClass::High);
    EXPECT_EQ(d.retryAfterSeconds, 1);
}

#pragma once

/// @file admission_gateway.hpp
/// @brief Per-request admission orchestrator.
///
/// admit() runs, in order: principal lookup -> classify -> resolve rule
/// and route -> quota check-and-consume -> routing. A quota denial
/// returns immediately; routing is never attempted for it.

#include "agw/foundation/clock.hpp"
#include "agw/foundation/gateway_metrics.hpp"
#include "agw/foundation/gateway_result.hpp"
#include "agw/service/admission_types.hpp"
#include "agw/service/override_registry.hpp"
#include "agw/service/principal_directory.hpp"
#include "agw/service/priority_classifier.hpp"
#include "agw/service/quota_ledger.hpp"
#include "agw/service/resource_route_table.hpp"
#include "agw/service/routing_engine.hpp"
#include "agw/service/rule_registry.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace agw::service {

/// Collaborators of the orchestrator. All references must outlive it.
struct GatewayComponents {
    const foundation::Clock& clock;
    IPrincipalDirectory& principals;
    RuleRegistry& rules;
    ResourceRouteTable& routes;
    PriorityClassifier& classifier;
    OverrideRegistry& overrides;
    QuotaLedger& ledger;
    RoutingEngine& routing;
    foundation::GatewayMetrics& metrics;
};

/// Gateway orchestrator.
///
/// Holds no per-request state; concurrent admit() calls are safe as
/// long as the collaborators are. Unexpected exceptions from a
/// collaborator deny normal traffic (InternalError) and degrade
/// `critical` traffic onto the fallback instead of denying it.
///
/// @code
///   auto decision = gateway.admit({.principalId = "vendor-118",
///                                  .resource = "/api/payments/charge",
///                                  .context = {.eventId = "w-2291",
///                                              .eventDate = "2026-10-17"}});
///   if (decision.allowed) {
///       auto result = forward(*decision.upstreamTarget);
///       gateway.reportOutcome(decision, result.ok, result.latency);
///   }
/// @endcode
class AdmissionGateway {
public:
    explicit AdmissionGateway(GatewayComponents components);

    AdmissionGateway(const AdmissionGateway&) = delete;
    AdmissionGateway& operator=(const AdmissionGateway&) = delete;

    [[nodiscard]] AdmissionDecision admit(const AdmissionRequest& request);

    [[nodiscard]] AdmissionDecision admit(std::string_view principalId,
                                          std::string_view resource,
                                          const RequestContext& context);

    /// Release the decision's lease and record the upstream outcome.
    void reportOutcome(AdmissionDecision& decision, bool success,
                       std::chrono::milliseconds latency);

    // ── Override administration ──────────────────────────────────────────

    foundation::GatewayResult<EmergencyOverride> createOverride(OverrideRequest request);

    foundation::GatewayResult<void> expireOverride(foundation::OverrideId id,
                                                   std::string_view by);

private:
    AdmissionDecision evaluate(const AdmissionRequest& request, PriorityClass& priority,
                               bool& classified);

    AdmissionDecision failDegraded(const AdmissionRequest& request, PriorityClass priority,
                                   std::string_view what);

    void recordMetrics(const AdmissionDecision& decision,
                       std::chrono::steady_clock::time_point start);

    GatewayComponents c_;
};

/// Decision shortcut used for every rejection path.
[[nodiscard]] AdmissionDecision makeDenial(DenyReason reason, std::string detail,
                                           PriorityClass priority,
                                           std::optional<int64_t> retryAfterSeconds = std::nullopt);

/// Map a component error code onto the public deny reason.
[[nodiscard]] DenyReason denyReasonFor(foundation::ErrorCode code);

}  // namespace agw::service

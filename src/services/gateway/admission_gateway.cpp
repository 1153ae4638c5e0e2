/// @file admission_gateway.cpp
/// @brief AdmissionGateway orchestration.

#include "agw/service/admission_gateway.hpp"

#include "agw/foundation/gateway_logger.hpp"
#include "agw/foundation/json_log_formatter.hpp"

#include <exception>

namespace agw::service {

using foundation::ErrorCode;
using foundation::GatewayLogger;
using foundation::GatewayResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace metric = foundation::metric;

AdmissionDecision makeDenial(DenyReason reason, std::string detail, PriorityClass priority,
                             std::optional<int64_t> retryAfterSeconds) {
    AdmissionDecision d;
    d.allowed = false;
    d.priority = priority;
    d.reason = reason;
    d.detail = std::move(detail);
    d.retryAfterSeconds = retryAfterSeconds;
    return d;
}

DenyReason denyReasonFor(ErrorCode code) {
    switch (code) {
        case ErrorCode::QuotaExceeded:
            return DenyReason::QuotaExceeded;
        case ErrorCode::UpstreamUnavailable:
        case ErrorCode::UpstreamNotFound:
            return DenyReason::UpstreamUnavailable;
        case ErrorCode::UpstreamSaturated:
            return DenyReason::UpstreamSaturated;
        case ErrorCode::ConfigurationMissing:
        case ErrorCode::NoRouteForResource:
        case ErrorCode::InvalidRule:
            return DenyReason::ConfigurationMissing;
        case ErrorCode::StoreUnavailable:
        case ErrorCode::StoreTimeout:
            return DenyReason::StoreUnavailable;
        case ErrorCode::UnknownPrincipal:
            return DenyReason::UnknownPrincipal;
        case ErrorCode::InvalidRequest:
        case ErrorCode::InvalidCost:
        case ErrorCode::InvalidArgument:
            return DenyReason::InvalidRequest;
        default:
            return DenyReason::InternalError;
    }
}

AdmissionGateway::AdmissionGateway(GatewayComponents components) : c_(components) {
    c_.metrics.registerHistogram(metric::kAdmitLatency,
                                 foundation::HistogramBuckets::admissionLatency());
}

AdmissionDecision AdmissionGateway::admit(std::string_view principalId,
                                          std::string_view resource,
                                          const RequestContext& context) {
    AdmissionRequest request;
    request.principalId = std::string(principalId);
    request.resource = std::string(resource);
    request.context = context;
    return admit(request);
}

AdmissionDecision AdmissionGateway::admit(const AdmissionRequest& request) {
    const auto start = std::chrono::steady_clock::now();
    foundation::CorrelationScope scope(foundation::generateCorrelationId());

    PriorityClass priority = PriorityClass::Normal;
    bool classified = false;
    AdmissionDecision decision;
    try {
        decision = evaluate(request, priority, classified);
    } catch (const std::exception& e) {
        LogContext ctx;
        ctx.principalId = request.principalId;
        ctx.extra["resource"] = request.resource;
        GatewayLogger::instance().logWithContext(
            LogLevel::Error, LogCategory::Admission,
            std::string("unexpected error during admission: ") + e.what(), ctx);

        if (classified && priority == PriorityClass::Critical) {
            decision = failDegraded(request, priority, e.what());
        } else {
            decision = makeDenial(DenyReason::InternalError, "internal_error", priority, 1);
        }
    }

    decision.requestId = foundation::CorrelationScope::current();
    recordMetrics(decision, start);
    return decision;
}

AdmissionDecision AdmissionGateway::evaluate(const AdmissionRequest& request,
                                             PriorityClass& priority, bool& classified) {
    if (request.principalId.empty() || request.resource.empty() || request.cost == 0) {
        return makeDenial(DenyReason::InvalidRequest,
                          "principal, resource and a positive cost are required", priority);
    }

    // -- Principal --------------------------------------------------------------
    auto principal = c_.principals.find(request.principalId);
    if (!principal) {
        AGW_LOG_WARN(LogCategory::Admission, "unknown principal " + request.principalId);
        return makeDenial(DenyReason::UnknownPrincipal, "unknown principal", priority);
    }

    // -- Classification ---------------------------------------------------------
    const auto& ctx = request.context;
    auto overrides = c_.overrides.activeFor(principal->id, ctx.eventId);
    auto cls = c_.classifier.classify(*principal, ctx, overrides, c_.clock.now());
    priority = cls.priority;
    classified = true;

    if (cls.invalidContext) {
        LogContext logCtx;
        logCtx.principalId = principal->id;
        logCtx.eventId = ctx.eventId;
        logCtx.extra["reason"] = cls.invalidReason;
        GatewayLogger::instance().logWithContext(LogLevel::Warning, LogCategory::Priority,
                                                 "invalid request context, no boost applied",
                                                 logCtx);
    }

    // -- Rule and route ---------------------------------------------------------
    auto rule = c_.rules.resolve(*principal, request.resource);
    if (!rule) {
        AGW_LOG_ERROR(LogCategory::Config, std::string(rule.error().message()));
        return makeDenial(DenyReason::ConfigurationMissing, std::string(rule.error().message()),
                          priority);
    }

    auto route = c_.routes.resolve(request.resource);
    if (!route) {
        AGW_LOG_ERROR(LogCategory::Config, "no route for resource " + request.resource);
        return makeDenial(DenyReason::ConfigurationMissing,
                          "no route for resource '" + request.resource + "'", priority);
    }

    // -- Quota ------------------------------------------------------------------
    const auto& governing = rule.value();
    const auto multiplier = effectiveMultiplier(cls, governing);
    // Critical requests never fail closed.
    const bool failOpenEligible =
        (governing.criticalPath && cls.eventDay) || priority == PriorityClass::Critical;

    auto quota = c_.ledger.checkAndConsume(principal->id, governing, request.cost, multiplier,
                                           failOpenEligible);
    if (!quota) {
        auto reason = denyReasonFor(quota.error().code());
        std::optional<int64_t> retry;
        if (reason == DenyReason::StoreUnavailable) {
            retry = 1;
        }
        return makeDenial(reason, std::string(quota.error().message()), priority, retry);
    }

    const auto& q = quota.value();
    if (!q.allowed) {
        auto d = makeDenial(DenyReason::QuotaExceeded, "quota_exceeded", priority,
                            q.retryAfter.count());
        d.limit = q.limit;
        d.remaining = q.remaining;
        d.resetAt = q.resetAt;
        return d;
    }

    // -- Routing ----------------------------------------------------------------
    auto routed = c_.routing.route(priority, *route);

    AdmissionDecision d;
    d.priority = priority;
    d.limit = q.limit;
    d.remaining = q.remaining;
    d.resetAt = q.resetAt;
    d.failedOpen = q.failedOpen;

    if (!routed) {
        const auto& err = routed.error();
        d.allowed = false;
        d.reason = denyReasonFor(err.code());
        d.detail = std::string(err.message());
        const auto* hint = err.context<std::chrono::seconds>();
        d.retryAfterSeconds = hint ? hint->count() : 1;
        return d;
    }

    auto& outcome = routed.value();
    d.allowed = true;
    d.upstreamTarget = outcome.target;
    d.degraded = outcome.degraded;
    d.lease = std::move(outcome.lease);
    return d;
}

AdmissionDecision AdmissionGateway::failDegraded(const AdmissionRequest& request,
                                                 PriorityClass priority,
                                                 std::string_view what) {
    auto route = c_.routes.resolve(request.resource);
    std::optional<std::string> target;
    if (route) {
        if (route->fallback) {
            target = route->fallback;
        } else if (!route->candidates.empty()) {
            target = route->candidates.front();
        }
    }
    if (!target) {
        return makeDenial(DenyReason::InternalError, "internal_error", priority, 1);
    }

    LogContext ctx;
    ctx.principalId = request.principalId;
    ctx.upstream = target;
    GatewayLogger::instance().logWithContext(LogLevel::Warning, LogCategory::Admission,
                                             "critical request admitted degraded after error",
                                             ctx);

    AdmissionDecision d;
    d.allowed = true;
    d.priority = priority;
    d.upstreamTarget = std::move(target);
    d.degraded = true;
    d.detail = "fail_degraded: " + std::string(what);
    return d;
}

void AdmissionGateway::recordMetrics(const AdmissionDecision& decision,
                                     std::chrono::steady_clock::time_point start) {
    auto elapsed = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start);
    c_.metrics.recordHistogram(metric::kAdmitLatency, elapsed.count());

    if (decision.allowed) {
        c_.metrics.incrementCounter(
            foundation::labeled(metric::kAdmissions, "priority",
                                priorityClassName(decision.priority)));
        if (decision.degraded) {
            c_.metrics.incrementCounter(metric::kDegraded);
        }
    } else {
        auto reason = decision.reason.value_or(DenyReason::InternalError);
        c_.metrics.incrementCounter(
            foundation::labeled(metric::kDenials, "reason", denyReasonName(reason)));
    }

    auto& logger = GatewayLogger::instance();
    if (logger.isEnabled(LogLevel::Debug, LogCategory::Admission)) {
        LogContext ctx;
        ctx.upstream = decision.upstreamTarget;
        ctx.extra["allowed"] = decision.allowed ? "true" : "false";
        ctx.extra["priority"] = std::string(priorityClassName(decision.priority));
        if (decision.reason) {
            ctx.extra["reason"] = std::string(denyReasonName(*decision.reason));
        }
        logger.logWithContext(LogLevel::Debug, LogCategory::Admission, "decision", ctx);
    }
}

void AdmissionGateway::reportOutcome(AdmissionDecision& decision, bool success,
                                     std::chrono::milliseconds latency) {
    if (decision.lease) {
        decision.lease->complete(success, latency);
        decision.lease.reset();
    }
}

GatewayResult<EmergencyOverride> AdmissionGateway::createOverride(OverrideRequest request) {
    return c_.overrides.create(std::move(request));
}

GatewayResult<void> AdmissionGateway::expireOverride(foundation::OverrideId id,
                                                     std::string_view by) {
    return c_.overrides.expire(id, by);
}

}  // namespace agw::service

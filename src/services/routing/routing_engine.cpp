/// @file routing_engine.cpp
/// @brief RoutingEngine and UpstreamLease implementation.

#include "agw/service/routing_engine.hpp"

#include "agw/foundation/gateway_logger.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>
#include <vector>

namespace agw::service {

using foundation::ErrorCode;
using foundation::GatewayError;
using foundation::GatewayResult;
using foundation::LogCategory;

namespace detail {

struct UpstreamSlots {
    UpstreamService service;
    uint32_t reserved = 0;
    std::atomic<uint32_t> inFlight{0};
};

}  // namespace detail

namespace {

// CAS loop: never exceeds limit under concurrent callers.
bool acquireSlot(detail::UpstreamSlots& slots, uint32_t limit) {
    auto current = slots.inFlight.load(std::memory_order_acquire);
    while (current < limit) {
        if (slots.inFlight.compare_exchange_weak(current, current + 1,
                                                 std::memory_order_acq_rel,
                                                 std::memory_order_acquire)) {
            return true;
        }
    }
    return false;
}

void releaseSlot(detail::UpstreamSlots& slots) {
    auto current = slots.inFlight.load(std::memory_order_acquire);
    while (current > 0 &&
           !slots.inFlight.compare_exchange_weak(current, current - 1,
                                                 std::memory_order_acq_rel,
                                                 std::memory_order_acquire)) {
    }
}

}  // namespace

// ── UpstreamLease ───────────────────────────────────────────────────────────

UpstreamLease::UpstreamLease(PrivateTag, foundation::LeaseId id,
                             std::shared_ptr<detail::UpstreamSlots> slots,
                             HealthMonitor* monitor, bool degraded, bool trial)
    : id_(id), slots_(std::move(slots)), monitor_(monitor), degraded_(degraded), trial_(trial) {}

UpstreamLease::~UpstreamLease() {
    release();
}

const std::string& UpstreamLease::upstream() const noexcept {
    return slots_->service.id;
}

bool UpstreamLease::claimRelease() {
    bool expected = false;
    if (!released_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return false;
    }
    releaseSlot(*slots_);
    if (trial_ && monitor_ != nullptr) {
        monitor_->releaseTrial(slots_->service.id);
    }
    return true;
}

void UpstreamLease::complete(bool success, std::chrono::milliseconds latency) {
    if (claimRelease() && monitor_ != nullptr) {
        monitor_->recordOutcome(slots_->service.id, success, latency, trial_);
    }
}

void UpstreamLease::release() {
    claimRelease();
}

// ── RoutingEngine ───────────────────────────────────────────────────────────

RoutingEngine::RoutingEngine(HealthMonitor& monitor, RoutingConfig config)
    : monitor_(monitor), config_(config) {}

RoutingEngine::~RoutingEngine() = default;

uint32_t RoutingEngine::reservedFor(uint32_t capacity, double fraction) {
    if (!(fraction > 0.0) || capacity <= 1) {
        return 0;
    }
    auto reserved = static_cast<uint32_t>(std::floor(static_cast<double>(capacity) * fraction));
    reserved = std::max<uint32_t>(reserved, 1);
    return std::min(reserved, capacity - 1);
}

GatewayResult<void> RoutingEngine::addUpstream(const UpstreamService& service) {
    auto slots = std::make_shared<detail::UpstreamSlots>();
    slots->service = service;
    slots->reserved = reservedFor(service.maxConcurrency, config_.reservedFraction);

    std::unique_lock lock(mutex_);
    auto [_, inserted] = slots_.try_emplace(service.id, std::move(slots));
    if (!inserted) {
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::UpstreamAlreadyRegistered,
                         "upstream " + service.id + " already tracked by routing"));
    }
    return GatewayResult<void>::ok();
}

std::shared_ptr<detail::UpstreamSlots> RoutingEngine::slotsFor(std::string_view id) const {
    std::shared_lock lock(mutex_);
    auto it = slots_.find(std::string(id));
    return it == slots_.end() ? nullptr : it->second;
}

uint32_t RoutingEngine::inFlight(std::string_view upstream) const {
    auto slots = slotsFor(upstream);
    return slots ? slots->inFlight.load(std::memory_order_acquire) : 0;
}

uint32_t RoutingEngine::reservedSlots(std::string_view upstream) const {
    auto slots = slotsFor(upstream);
    return slots ? slots->reserved : 0;
}

RoutingEngine::Attempt RoutingEngine::tryUpstream(PriorityClass priority, const std::string& id,
                                                  bool forceDegraded, RoutingOutcome& out,
                                                  std::chrono::seconds& retryAfter) {
    auto slots = slotsFor(id);
    auto snap = monitor_.snapshot(id);
    if (!slots || !snap) {
        AGW_LOG_WARN(LogCategory::Routing, "route references unknown upstream " + id);
        return Attempt::Unavailable;
    }

    const auto& svc = slots->service;
    const uint32_t classLimit =
        priority >= config_.reservedFloor ? svc.maxConcurrency
                                          : svc.maxConcurrency - slots->reserved;

    auto grant = [&](bool degraded, bool trial) {
        auto leaseId = foundation::LeaseId(nextLeaseId_.fetch_add(1, std::memory_order_relaxed));
        out.target = id;
        out.degraded = degraded;
        out.lease = std::make_shared<UpstreamLease>(UpstreamLease::PrivateTag{}, leaseId, slots,
                                                    &monitor_, degraded, trial);
        return Attempt::Acquired;
    };

    switch (snap->state) {
        case CircuitState::Closed:
            if (acquireSlot(*slots, classLimit)) {
                return grant(forceDegraded, false);
            }
            return Attempt::Saturated;

        case CircuitState::HalfOpen:
            if (!monitor_.tryAcquireTrial(id)) {
                retryAfter = std::min(retryAfter, std::chrono::seconds(1));
                return Attempt::Unavailable;
            }
            if (acquireSlot(*slots, classLimit)) {
                return grant(forceDegraded, true);
            }
            monitor_.releaseTrial(id);
            return Attempt::Saturated;

        case CircuitState::Open: {
            retryAfter = std::min(retryAfter, snap->retryAfter);
            if (!svc.criticalPath) {
                return Attempt::Unavailable;
            }
            auto trickle = std::min(svc.criticalTrickle, svc.maxConcurrency);
            if (acquireSlot(*slots, trickle)) {
                return grant(true, false);
            }
            return Attempt::Unavailable;
        }
    }
    return Attempt::Unavailable;
}

GatewayResult<RoutingOutcome> RoutingEngine::route(PriorityClass priority,
                                                   const ResourceRoute& route) {
    struct Ranked {
        const std::string* id;
        int64_t latencyBucket;
    };

    auto retryAfter = std::chrono::seconds::max();
    std::vector<Ranked> healthy;
    std::vector<const std::string*> trickle;
    for (const auto& id : route.candidates) {
        auto snap = monitor_.snapshot(id);
        if (!snap) {
            AGW_LOG_WARN(LogCategory::Routing, "route references unknown upstream " + id);
            continue;
        }
        if (snap->state == CircuitState::Open) {
            if (snap->service.criticalPath) {
                trickle.push_back(&id);
            } else {
                retryAfter = std::min(retryAfter, snap->retryAfter);
            }
            continue;
        }
        // Unknown latency ranks as 0 so new upstreams get traffic.
        auto bucket = snap->latencyMs ? static_cast<int64_t>(std::floor(*snap->latencyMs)) : 0;
        healthy.push_back(Ranked{&id, bucket});
    }

    std::stable_sort(healthy.begin(), healthy.end(),
                     [](const Ranked& a, const Ranked& b) {
                         return a.latencyBucket < b.latencyBucket;
                     });

    // Rotate each run of equal latency by a shared cursor.
    const auto turn = cursor_.fetch_add(1, std::memory_order_relaxed);
    for (auto first = healthy.begin(); first != healthy.end();) {
        auto last = std::find_if(first, healthy.end(), [&](const Ranked& r) {
            return r.latencyBucket != first->latencyBucket;
        });
        auto n = static_cast<uint64_t>(std::distance(first, last));
        if (n > 1) {
            std::rotate(first, first + static_cast<std::ptrdiff_t>(turn % n), last);
        }
        first = last;
    }

    RoutingOutcome out;
    bool sawSaturated = false;

    for (const auto& r : healthy) {
        auto attempt = tryUpstream(priority, *r.id, false, out, retryAfter);
        if (attempt == Attempt::Acquired) {
            return GatewayResult<RoutingOutcome>::ok(std::move(out));
        }
        sawSaturated = sawSaturated || attempt == Attempt::Saturated;
    }

    for (const auto* id : trickle) {
        if (tryUpstream(priority, *id, true, out, retryAfter) == Attempt::Acquired) {
            return GatewayResult<RoutingOutcome>::ok(std::move(out));
        }
    }

    if (route.fallback) {
        auto attempt = tryUpstream(priority, *route.fallback, true, out, retryAfter);
        if (attempt == Attempt::Acquired) {
            AGW_LOG_INFO(LogCategory::Routing,
                         "routing " + route.resourcePattern + " to fallback " + *route.fallback);
            return GatewayResult<RoutingOutcome>::ok(std::move(out));
        }
        sawSaturated = sawSaturated || attempt == Attempt::Saturated;
    }

    if (sawSaturated) {
        return GatewayResult<RoutingOutcome>::err(
            GatewayError(ErrorCode::UpstreamSaturated, "upstream_saturated",
                         std::chrono::seconds(1)));
    }

    if (retryAfter == std::chrono::seconds::max()) {
        retryAfter = std::chrono::seconds(1);
    }
    AGW_LOG_WARN(LogCategory::Routing,
                 "no healthy upstream for " + route.resourcePattern + " at priority " +
                     std::string(priorityClassName(priority)));
    return GatewayResult<RoutingOutcome>::err(
        GatewayError(ErrorCode::UpstreamUnavailable, "no_healthy_upstream",
                     std::max(retryAfter, std::chrono::seconds(1))));
}

}  // namespace agw::service

#pragma once

/// @file routing_engine.hpp
/// @brief Upstream selection with circuit filtering, latency preference,
///        reserved concurrency and fallback.

#include "agw/foundation/gateway_result.hpp"
#include "agw/foundation/types.hpp"
#include "agw/service/admission_types.hpp"
#include "agw/service/health_monitor.hpp"
#include "agw/service/resource_route_table.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace agw::service {

struct RoutingConfig {
    /// Share of each upstream's capacity kept for classes >= reservedFloor.
    double reservedFraction = 0.1;

    PriorityClass reservedFloor = PriorityClass::High;
};

namespace detail {
struct UpstreamSlots;
}  // namespace detail

/// One concurrency slot on an upstream.
///
/// Released exactly once: by complete(), release(), or destruction.
/// complete() also feeds the outcome to the HealthMonitor as a passive
/// sample. A lease must not outlive the HealthMonitor it came from.
class UpstreamLease {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    /// Only RoutingEngine can name the tag.
    UpstreamLease(PrivateTag, foundation::LeaseId id,
                  std::shared_ptr<detail::UpstreamSlots> slots, HealthMonitor* monitor,
                  bool degraded, bool trial);
    ~UpstreamLease();

    UpstreamLease(const UpstreamLease&) = delete;
    UpstreamLease& operator=(const UpstreamLease&) = delete;

    [[nodiscard]] foundation::LeaseId id() const noexcept { return id_; }
    [[nodiscard]] const std::string& upstream() const noexcept;
    [[nodiscard]] bool degraded() const noexcept { return degraded_; }
    [[nodiscard]] bool isTrial() const noexcept { return trial_; }

    /// Record the request outcome and release the slot. Later calls are no-ops.
    void complete(bool success, std::chrono::milliseconds latency);

    /// Release the slot without recording a health sample.
    void release();

    [[nodiscard]] bool released() const noexcept {
        return released_.load(std::memory_order_acquire);
    }

private:
    friend class RoutingEngine;

    bool claimRelease();

    foundation::LeaseId id_;
    std::shared_ptr<detail::UpstreamSlots> slots_;
    HealthMonitor* monitor_;
    bool degraded_;
    bool trial_;
    std::atomic<bool> released_{false};
};

/// Routing result for an admitted request.
struct RoutingOutcome {
    std::string target;
    bool degraded = false;
    std::shared_ptr<UpstreamLease> lease;
};

/// Routing and failover engine.
///
/// Selection order for route(cls, route):
///   1. closed or half-open candidates (half-open needs a trial permit),
///      ranked by latency EWMA, equal latencies rotated round-robin
///   2. open critical-path candidates within their trickle, degraded
///   3. the route's fallback under the same rules, always degraded
/// Classes below `reservedFloor` may hold at most
/// `capacity - reserved` slots of any upstream.
///
/// Errors carry the retry hint as `std::chrono::seconds` context:
/// UpstreamUnavailable ("no_healthy_upstream") or UpstreamSaturated.
class RoutingEngine {
public:
    RoutingEngine(HealthMonitor& monitor, RoutingConfig config = {});
    ~RoutingEngine();

    RoutingEngine(const RoutingEngine&) = delete;
    RoutingEngine& operator=(const RoutingEngine&) = delete;

    /// Track concurrency for @p service. Must match a HealthMonitor upstream.
    foundation::GatewayResult<void> addUpstream(const UpstreamService& service);

    foundation::GatewayResult<RoutingOutcome> route(PriorityClass priority,
                                                    const ResourceRoute& route);

    [[nodiscard]] uint32_t inFlight(std::string_view upstream) const;

    [[nodiscard]] uint32_t reservedSlots(std::string_view upstream) const;

    /// `max(1, floor(capacity * fraction))` when fraction > 0, kept below capacity.
    [[nodiscard]] static uint32_t reservedFor(uint32_t capacity, double fraction);

    [[nodiscard]] const RoutingConfig& config() const noexcept { return config_; }

private:
    enum class Attempt : uint8_t { Acquired, Saturated, Unavailable };

    Attempt tryUpstream(PriorityClass priority, const std::string& id, bool forceDegraded,
                        RoutingOutcome& out, std::chrono::seconds& retryAfter);

    std::shared_ptr<detail::UpstreamSlots> slotsFor(std::string_view id) const;

    HealthMonitor& monitor_;
    RoutingConfig config_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<detail::UpstreamSlots>> slots_;

    std::atomic<uint64_t> cursor_{0};
    std::atomic<uint64_t> nextLeaseId_{1};
};

}  // namespace agw::service

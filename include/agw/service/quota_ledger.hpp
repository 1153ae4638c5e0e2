#pragma once

/// @file quota_ledger.hpp
/// @brief Fixed-window quota accounting over an injected counter store.
///
/// Each (principal, rule) pair owns one counter per time bucket. The
/// bucket is `floor(now / window)` at the moment of the increment, so a
/// request on a boundary lands in exactly one bucket.

#include "agw/foundation/clock.hpp"
#include "agw/foundation/gateway_result.hpp"
#include "agw/service/admission_types.hpp"
#include "agw/service/counter_store.hpp"
#include "agw/service/telemetry.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace agw::service {

/// Ledger tuning.
struct LedgerConfig {
    /// Deadline passed to every counter-store call.
    std::chrono::milliseconds storeDeadline{50};

    /// Pause before the single retry of a transient store error.
    std::chrono::milliseconds retryBackoff{10};
};

/// Result of one check-and-consume.
struct QuotaOutcome {
    bool allowed = false;

    /// Effective limit, `floor(baseQuota * multiplier)`.
    uint64_t limit = 0;

    uint64_t remaining = 0;

    /// End of the bucket the request was charged to.
    std::chrono::system_clock::time_point resetAt{};

    /// Seconds until resetAt, at least 1. Only meaningful when denied.
    std::chrono::seconds retryAfter{0};

    /// Allowed without accounting because the store was unreachable.
    bool failedOpen = false;
};

/// Quota ledger.
///
/// @code
///   QuotaLedger ledger(std::make_shared<InMemoryCounterStore>(), clock);
///   auto outcome = ledger.checkAndConsume("vendor-118", rule, 1, 1.0, false);
///   if (outcome && !outcome.value().allowed) {
///       // deny with retryAfter
///   }
/// @endcode
///
/// Thread-safe; atomicity comes from ICounterStore::tryIncrement.
class QuotaLedger {
public:
    QuotaLedger(std::shared_ptr<ICounterStore> store,
                const foundation::Clock& clock,
                LedgerConfig config = {},
                std::shared_ptr<ITelemetrySink> telemetry = nullptr);

    /// Charge @p cost units against @p rule for @p principalId.
    ///
    /// Transient store errors are retried once after the backoff. If the
    /// store is still unreachable the request fails open when
    /// @p failOpenEligible (critical priority, or a critical-path rule with
    /// an event-bound request) and fails closed with StoreUnavailable
    /// otherwise. Both are published as telemetry.
    ///
    /// @return The outcome, or InvalidRule / InvalidCost / StoreUnavailable.
    foundation::GatewayResult<QuotaOutcome> checkAndConsume(std::string_view principalId,
                                                            const RateLimitRule& rule,
                                                            uint64_t cost,
                                                            double multiplier,
                                                            bool failOpenEligible);

    /// Units consumed in the current bucket.
    foundation::GatewayResult<uint64_t> currentUsage(std::string_view principalId,
                                                     const RateLimitRule& rule) const;

    /// Drop counters of closed buckets.
    std::size_t purgeExpired();

    /// `floor(nowMs / windowMs)`.
    [[nodiscard]] static int64_t bucketId(int64_t nowMs, std::chrono::seconds window);

    /// `floor(baseQuota * max(1, multiplier))`.
    [[nodiscard]] static uint64_t effectiveLimit(uint64_t baseQuota, double multiplier);

    [[nodiscard]] static std::string counterKey(std::string_view principalId,
                                                std::string_view ruleName,
                                                int64_t bucket);

    [[nodiscard]] uint64_t failOpenCount() const noexcept;
    [[nodiscard]] uint64_t failClosedCount() const noexcept;

private:
    void publish(TelemetryKind kind, std::string_view principalId,
                 const RateLimitRule& rule, std::string_view detail);

    std::shared_ptr<ICounterStore> store_;
    const foundation::Clock& clock_;
    LedgerConfig config_;
    std::shared_ptr<ITelemetrySink> telemetry_;

    std::atomic<uint64_t> failOpen_{0};
    std::atomic<uint64_t> failClosed_{0};
};

}  // namespace agw::service

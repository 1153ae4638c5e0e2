#pragma once

/// @file counter_store.hpp
/// @brief Atomic counter store interface and sharded in-memory implementation.
///
/// The Quota Ledger never touches shared counters directly; it goes
/// through an injected ICounterStore whose only mutating primitive is a
/// bounded check-and-increment. A Redis or memcached backend implements
/// the same interface with INCRBY/CAS.

#include "agw/foundation/gateway_result.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace agw::service {

/// Outcome of a bounded increment.
struct CounterUpdate {
    /// Whether the cost was added (count + cost <= limit).
    bool applied = false;

    /// Count after the operation (unchanged when not applied).
    uint64_t count = 0;
};

/// Abstract counter store.
///
/// Implementations must be thread-safe. Errors are StoreUnavailable or
/// StoreTimeout; both are treated as transient by the ledger.
class ICounterStore {
public:
    virtual ~ICounterStore() = default;

    /// Atomically add @p cost to @p key if the result stays within @p limit.
    ///
    /// A missing key starts at zero and is kept until @p expiresAt.
    /// The call must give up after @p deadline instead of blocking.
    virtual foundation::GatewayResult<CounterUpdate> tryIncrement(
        std::string_view key, uint64_t cost, uint64_t limit,
        std::chrono::system_clock::time_point expiresAt,
        std::chrono::milliseconds deadline) = 0;

    /// Current count for @p key (0 if absent).
    virtual foundation::GatewayResult<uint64_t> peek(std::string_view key) const = 0;

    /// Drop counters whose expiry is at or before @p now.
    /// @return Number of counters removed.
    virtual std::size_t removeExpired(std::chrono::system_clock::time_point now) = 0;
};

/// In-process counter store, sharded by key hash.
///
/// Each shard is guarded by a timed mutex so that a stalled holder turns
/// into StoreTimeout for other callers rather than an unbounded wait.
class InMemoryCounterStore : public ICounterStore {
public:
    explicit InMemoryCounterStore(std::size_t shardCount = 16);

    foundation::GatewayResult<CounterUpdate> tryIncrement(
        std::string_view key, uint64_t cost, uint64_t limit,
        std::chrono::system_clock::time_point expiresAt,
        std::chrono::milliseconds deadline) override;

    foundation::GatewayResult<uint64_t> peek(std::string_view key) const override;

    std::size_t removeExpired(std::chrono::system_clock::time_point now) override;

    /// Total live counters across all shards.
    [[nodiscard]] std::size_t size() const;

private:
    struct Entry {
        uint64_t count = 0;
        std::chrono::system_clock::time_point expiresAt{};
    };

    struct Shard {
        mutable std::timed_mutex mutex;
        std::unordered_map<std::string, Entry> entries;
    };

    Shard& shardFor(std::string_view key) const;

    std::vector<std::unique_ptr<Shard>> shards_;
};

}  // namespace agw::service

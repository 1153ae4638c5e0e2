/// @file counter_store.cpp
/// @brief InMemoryCounterStore implementation.

#include "agw/service/counter_store.hpp"

#include <algorithm>
#include <functional>

namespace agw::service {

using foundation::ErrorCode;
using foundation::GatewayError;
using foundation::GatewayResult;

InMemoryCounterStore::InMemoryCounterStore(std::size_t shardCount) {
    auto count = std::max<std::size_t>(shardCount, 1);
    shards_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

InMemoryCounterStore::Shard& InMemoryCounterStore::shardFor(std::string_view key) const {
    auto idx = std::hash<std::string_view>{}(key) % shards_.size();
    return *shards_[idx];
}

GatewayResult<CounterUpdate> InMemoryCounterStore::tryIncrement(
    std::string_view key, uint64_t cost, uint64_t limit,
    std::chrono::system_clock::time_point expiresAt,
    std::chrono::milliseconds deadline) {
    auto& shard = shardFor(key);

    std::unique_lock lock(shard.mutex, std::defer_lock);
    if (!lock.try_lock_for(deadline)) {
        return GatewayResult<CounterUpdate>::err(
            GatewayError(ErrorCode::StoreTimeout,
                         "counter shard busy past deadline for key " + std::string(key)));
    }

    auto [it, inserted] = shard.entries.try_emplace(std::string(key));
    auto& entry = it->second;
    if (inserted) {
        entry.expiresAt = expiresAt;
    }

    // Check and add under the same lock; never read-then-write across calls.
    if (cost > limit || entry.count > limit - cost) {
        return GatewayResult<CounterUpdate>::ok(CounterUpdate{false, entry.count});
    }

    entry.count += cost;
    return GatewayResult<CounterUpdate>::ok(CounterUpdate{true, entry.count});
}

GatewayResult<uint64_t> InMemoryCounterStore::peek(std::string_view key) const {
    auto& shard = shardFor(key);
    std::lock_guard lock(shard.mutex);
    auto it = shard.entries.find(std::string(key));
    return GatewayResult<uint64_t>::ok(it == shard.entries.end() ? 0 : it->second.count);
}

std::size_t InMemoryCounterStore::removeExpired(std::chrono::system_clock::time_point now) {
    std::size_t removed = 0;
    for (auto& shard : shards_) {
        std::lock_guard lock(shard->mutex);
        removed += std::erase_if(shard->entries, [now](const auto& kv) {
            return kv.second.expiresAt <= now;
        });
    }
    return removed;
}

std::size_t InMemoryCounterStore::size() const {
    std::size_t total = 0;
    for (const auto& shard : shards_) {
        std::lock_guard lock(shard->mutex);
        total += shard->entries.size();
    }
    return total;
}

}  // namespace agw::service

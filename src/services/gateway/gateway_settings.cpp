/// @file gateway_settings.cpp
/// @brief YAML to GatewaySettings with load-time validation.

#include "agw/service/gateway_settings.hpp"

#include "agw/service/health_probe.hpp"
#include "agw/service/resource_pattern.hpp"
#include "agw/service/rule_registry.hpp"

#include <algorithm>
#include <unordered_set>

namespace agw::service {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::GatewayError;
using foundation::GatewayResult;

namespace {

GatewayError invalid(std::string_view key, std::string_view what) {
    return GatewayError(ErrorCode::ConfigInvalid,
                        "invalid config '" + std::string(key) + "': " + std::string(what));
}

// ── Entry fields (inside sequences) ─────────────────────────────────────────

template <typename T>
GatewayResult<std::optional<T>> field(const YAML::Node& entry, const char* name,
                                      const std::string& where) {
    const YAML::Node child = entry[name];
    if (!child.IsDefined() || child.IsNull()) {
        return GatewayResult<std::optional<T>>::ok(std::nullopt);
    }
    try {
        return GatewayResult<std::optional<T>>::ok(child.as<T>());
    } catch (const YAML::Exception&) {
        return GatewayResult<std::optional<T>>::err(
            invalid(where + "." + name, "wrong type"));
    }
}

template <typename T>
GatewayResult<T> required(const YAML::Node& entry, const char* name, const std::string& where) {
    auto value = field<T>(entry, name, where);
    if (!value) {
        return value.template propagate<T>();
    }
    if (!value.value()) {
        return GatewayResult<T>::err(invalid(where + "." + name, "is required"));
    }
    return GatewayResult<T>::ok(std::move(*value.value()));
}

template <typename T>
GatewayResult<T> fieldOr(const YAML::Node& entry, const char* name, const std::string& where,
                          T fallback) {
    auto value = field<T>(entry, name, where);
    if (!value) {
        return value.template propagate<T>();
    }
    return GatewayResult<T>::ok(value.value() ? std::move(*value.value()) : std::move(fallback));
}

GatewayResult<std::vector<std::string>> stringList(const YAML::Node& entry, const char* name,
                                                   const std::string& where) {
    std::vector<std::string> out;
    const YAML::Node child = entry[name];
    if (!child.IsDefined() || child.IsNull()) {
        return GatewayResult<std::vector<std::string>>::ok(std::move(out));
    }
    if (!child.IsSequence()) {
        return GatewayResult<std::vector<std::string>>::err(
            invalid(where + "." + name, "expected a list"));
    }
    try {
        for (const auto& item : child) {
            out.push_back(item.as<std::string>());
        }
    } catch (const YAML::Exception&) {
        return GatewayResult<std::vector<std::string>>::err(
            invalid(where + "." + name, "expected a list of strings"));
    }
    return GatewayResult<std::vector<std::string>>::ok(std::move(out));
}

// ── Top-level scalars ───────────────────────────────────────────────────────

template <typename T>
GatewayResult<T> setting(const ConfigManager& config, std::string_view key, T fallback) {
    auto value = config.getOr<T>(key, std::move(fallback));
    if (!value) {
        return GatewayResult<T>::err(invalid(key, value.error().message()));
    }
    return value;
}

GatewayResult<int64_t> positive(const ConfigManager& config, std::string_view key,
                                int64_t fallback) {
    auto value = setting<int64_t>(config, key, fallback);
    if (value && value.value() <= 0) {
        return GatewayResult<int64_t>::err(invalid(key, "must be > 0"));
    }
    return value;
}

// ── Sections ────────────────────────────────────────────────────────────────

GatewayResult<void> readGateway(const ConfigManager& config, GatewaySettings& out) {
    auto port = setting<int64_t>(config, "gateway.http_port", out.httpPort);
    if (!port) {
        return port.propagate<void>();
    }
    if (port.value() <= 0 || port.value() > 65535) {
        return GatewayResult<void>::err(invalid("gateway.http_port", "must be in 1..65535"));
    }
    out.httpPort = static_cast<uint16_t>(port.value());

    auto name = setting<std::string>(config, "gateway.service_name", out.serviceName);
    if (!name) {
        return name.propagate<void>();
    }
    out.serviceName = std::move(name).value();

    auto lease = positive(config, "gateway.lease_timeout_seconds", out.leaseTimeout.count());
    if (!lease) {
        return lease.propagate<void>();
    }
    out.leaseTimeout = std::chrono::seconds(lease.value());

    auto read = positive(config, "gateway.read_timeout_ms", out.readTimeout.count());
    if (!read) {
        return read.propagate<void>();
    }
    out.readTimeout = std::chrono::milliseconds(read.value());
    return GatewayResult<void>::ok();
}

GatewayResult<void> readLedger(const ConfigManager& config, GatewaySettings& out) {
    auto deadline = positive(config, "ledger.store_deadline_ms", out.ledger.storeDeadline.count());
    if (!deadline) {
        return deadline.propagate<void>();
    }
    out.ledger.storeDeadline = std::chrono::milliseconds(deadline.value());

    auto backoff = setting<int64_t>(config, "ledger.retry_backoff_ms",
                                    out.ledger.retryBackoff.count());
    if (!backoff) {
        return backoff.propagate<void>();
    }
    if (backoff.value() < 0) {
        return GatewayResult<void>::err(invalid("ledger.retry_backoff_ms", "must be >= 0"));
    }
    out.ledger.retryBackoff = std::chrono::milliseconds(backoff.value());

    auto shards = positive(config, "ledger.store_shards", static_cast<int64_t>(out.storeShards));
    if (!shards) {
        return shards.propagate<void>();
    }
    out.storeShards = static_cast<std::size_t>(shards.value());
    return GatewayResult<void>::ok();
}

GatewayResult<void> readClassifier(const ConfigManager& config, GatewaySettings& out) {
    auto offset = setting<int64_t>(config, "classifier.utc_offset_minutes", 0);
    if (!offset) {
        return offset.propagate<void>();
    }
    if (offset.value() < -24 * 60 || offset.value() > 24 * 60) {
        return GatewayResult<void>::err(
            invalid("classifier.utc_offset_minutes", "must be within one day"));
    }
    out.classifier.utcOffset = std::chrono::minutes(offset.value());

    for (const auto& tierKey : config.childKeys("classifier.tier_base_class")) {
        const auto key = "classifier.tier_base_class." + tierKey;
        auto tier = parseTier(tierKey);
        if (!tier) {
            return GatewayResult<void>::err(invalid(key, "unknown tier"));
        }
        auto name = config.get<std::string>(key);
        if (!name) {
            return GatewayResult<void>::err(invalid(key, name.error().message()));
        }
        auto cls = parsePriorityClass(name.value());
        if (!cls) {
            return GatewayResult<void>::err(invalid(key, "unknown priority class"));
        }
        out.classifier.tierBaseClass[static_cast<std::size_t>(*tier)] = *cls;
    }
    return GatewayResult<void>::ok();
}

GatewayResult<void> readRouting(const ConfigManager& config, GatewaySettings& out) {
    auto fraction = setting<double>(config, "routing.reserved_fraction",
                                    out.routing.reservedFraction);
    if (!fraction) {
        return fraction.propagate<void>();
    }
    if (!(fraction.value() >= 0.0 && fraction.value() <= 0.5)) {
        return GatewayResult<void>::err(
            invalid("routing.reserved_fraction", "must be within [0, 0.5]"));
    }
    out.routing.reservedFraction = fraction.value();

    auto floor = setting<std::string>(
        config, "routing.reserved_floor",
        std::string(priorityClassName(out.routing.reservedFloor)));
    if (!floor) {
        return floor.propagate<void>();
    }
    auto cls = parsePriorityClass(floor.value());
    if (!cls) {
        return GatewayResult<void>::err(
            invalid("routing.reserved_floor", "unknown priority class"));
    }
    out.routing.reservedFloor = *cls;
    return GatewayResult<void>::ok();
}

GatewayResult<void> readHealth(const ConfigManager& config, GatewaySettings& out) {
    auto interval = positive(config, "health.probe_interval_ms",
                             out.health.probeInterval.count());
    if (!interval) {
        return interval.propagate<void>();
    }
    out.health.probeInterval = std::chrono::milliseconds(interval.value());

    auto window = positive(config, "health.rolling_window_seconds",
                           out.health.rollingWindow.count());
    if (!window) {
        return window.propagate<void>();
    }
    out.health.rollingWindow = std::chrono::seconds(window.value());

    auto samples = positive(config, "health.minimum_samples", out.health.minimumSamples);
    if (!samples) {
        return samples.propagate<void>();
    }
    out.health.minimumSamples = static_cast<uint32_t>(samples.value());

    auto threads = positive(config, "health.probe_threads",
                            static_cast<int64_t>(out.health.probeThreads));
    if (!threads) {
        return threads.propagate<void>();
    }
    out.health.probeThreads = static_cast<std::size_t>(threads.value());
    return GatewayResult<void>::ok();
}

// Rule entries appear under tiers.<tier> and principals[i].rules.
GatewayResult<RateLimitRule> parseRule(const YAML::Node& entry, const std::string& where,
                                       std::string_view owner) {
    if (!entry.IsMap()) {
        return GatewayResult<RateLimitRule>::err(invalid(where, "expected a mapping"));
    }

    auto resource = required<std::string>(entry, "resource", where);
    if (!resource) {
        return resource.propagate<RateLimitRule>();
    }
    if (!isValidPattern(resource.value())) {
        return GatewayResult<RateLimitRule>::err(
            invalid(where + ".resource", "malformed pattern"));
    }

    auto base = required<int64_t>(entry, "base_quota", where);
    if (!base) {
        return base.propagate<RateLimitRule>();
    }
    if (base.value() <= 0) {
        return GatewayResult<RateLimitRule>::err(invalid(where + ".base_quota", "must be > 0"));
    }

    auto window = required<int64_t>(entry, "window_seconds", where);
    if (!window) {
        return window.propagate<RateLimitRule>();
    }
    if (window.value() <= 0) {
        return GatewayResult<RateLimitRule>::err(
            invalid(where + ".window_seconds", "must be > 0"));
    }

    auto multiplier = fieldOr<double>(entry, "priority_multiplier", where, 1.0);
    if (!multiplier) {
        return multiplier.propagate<RateLimitRule>();
    }

    auto critical = fieldOr<bool>(entry, "critical_path", where, false);
    if (!critical) {
        return critical.propagate<RateLimitRule>();
    }

    auto name = fieldOr<std::string>(entry, "name", where,
                                      std::string(owner) + ":" + resource.value());
    if (!name) {
        return name.propagate<RateLimitRule>();
    }

    RateLimitRule rule{
        .name = std::move(name).value(),
        .resourcePattern = std::move(resource).value(),
        .baseQuota = static_cast<uint64_t>(base.value()),
        .window = std::chrono::seconds(window.value()),
        .priorityMultiplier = multiplier.value(),
        .criticalPath = critical.value(),
    };

    auto valid = RuleRegistry::validate(rule);
    if (!valid) {
        return GatewayResult<RateLimitRule>::err(invalid(where, valid.error().message()));
    }
    return GatewayResult<RateLimitRule>::ok(std::move(rule));
}

GatewayResult<std::vector<RateLimitRule>> parseRules(const YAML::Node& list,
                                                     const std::string& where,
                                                     std::string_view owner) {
    std::vector<RateLimitRule> rules;
    if (!list.IsSequence()) {
        return GatewayResult<std::vector<RateLimitRule>>::err(invalid(where, "expected a list"));
    }
    std::size_t index = 0;
    for (const auto& entry : list) {
        auto rule = parseRule(entry, where + "[" + std::to_string(index++) + "]", owner);
        if (!rule) {
            return rule.propagate<std::vector<RateLimitRule>>();
        }
        rules.push_back(std::move(rule).value());
    }
    return GatewayResult<std::vector<RateLimitRule>>::ok(std::move(rules));
}

GatewayResult<void> readTiers(const ConfigManager& config, GatewaySettings& out) {
    for (const auto& tierKey : config.childKeys("tiers")) {
        const auto key = "tiers." + tierKey;
        auto tier = parseTier(tierKey);
        if (!tier) {
            return GatewayResult<void>::err(invalid(key, "unknown tier"));
        }
        auto list = config.node(key);
        if (!list) {
            return GatewayResult<void>::err(invalid(key, list.error().message()));
        }
        auto rules = parseRules(list.value(), key, tierKey);
        if (!rules) {
            return rules.propagate<void>();
        }
        out.tierRules[static_cast<std::size_t>(*tier)] = std::move(rules).value();
    }
    return GatewayResult<void>::ok();
}

GatewayResult<UpstreamSettings> parseUpstream(const YAML::Node& entry, const std::string& where) {
    if (!entry.IsMap()) {
        return GatewayResult<UpstreamSettings>::err(invalid(where, "expected a mapping"));
    }

    auto id = required<std::string>(entry, "id", where);
    if (!id) {
        return id.propagate<UpstreamSettings>();
    }
    if (id.value().empty()) {
        return GatewayResult<UpstreamSettings>::err(invalid(where + ".id", "must not be empty"));
    }

    auto threshold = required<double>(entry, "failure_threshold", where);
    if (!threshold) {
        return threshold.propagate<UpstreamSettings>();
    }
    if (!(threshold.value() > 0.0 && threshold.value() <= 1.0)) {
        return GatewayResult<UpstreamSettings>::err(
            invalid(where + ".failure_threshold", "must be within (0, 1]"));
    }

    auto recovery = required<int64_t>(entry, "recovery_timeout_seconds", where);
    if (!recovery) {
        return recovery.propagate<UpstreamSettings>();
    }
    if (recovery.value() <= 0) {
        return GatewayResult<UpstreamSettings>::err(
            invalid(where + ".recovery_timeout_seconds", "must be > 0"));
    }

    auto critical = required<bool>(entry, "critical_path", where);
    if (!critical) {
        return critical.propagate<UpstreamSettings>();
    }

    auto concurrency = required<int64_t>(entry, "max_concurrency", where);
    if (!concurrency) {
        return concurrency.propagate<UpstreamSettings>();
    }
    if (concurrency.value() <= 0 || concurrency.value() > 1'000'000) {
        return GatewayResult<UpstreamSettings>::err(
            invalid(where + ".max_concurrency", "must be in 1..1000000"));
    }

    auto probes = fieldOr<int64_t>(entry, "half_open_probes", where, 3);
    if (!probes) {
        return probes.propagate<UpstreamSettings>();
    }
    if (probes.value() <= 0 || probes.value() > 1000) {
        return GatewayResult<UpstreamSettings>::err(
            invalid(where + ".half_open_probes", "must be in 1..1000"));
    }

    auto trickle = fieldOr<int64_t>(entry, "critical_trickle", where, 1);
    if (!trickle) {
        return trickle.propagate<UpstreamSettings>();
    }
    if (trickle.value() < 0 || trickle.value() > concurrency.value()) {
        return GatewayResult<UpstreamSettings>::err(
            invalid(where + ".critical_trickle", "must be in 0..max_concurrency"));
    }

    auto address = field<std::string>(entry, "probe_address", where);
    if (!address) {
        return address.propagate<UpstreamSettings>();
    }
    if (address.value()) {
        auto parsed = ProbeAddress::parse(*address.value());
        if (!parsed) {
            return GatewayResult<UpstreamSettings>::err(
                invalid(where + ".probe_address", parsed.error().message()));
        }
    }

    UpstreamSettings settings;
    settings.service = UpstreamService{
        .id = std::move(id).value(),
        .failureThreshold = threshold.value(),
        .recoveryTimeout = std::chrono::seconds(recovery.value()),
        .criticalPath = critical.value(),
        .maxConcurrency = static_cast<uint32_t>(concurrency.value()),
        .halfOpenProbes = static_cast<uint32_t>(probes.value()),
        .criticalTrickle = static_cast<uint32_t>(trickle.value()),
    };
    settings.probeAddress = std::move(address).value();
    return GatewayResult<UpstreamSettings>::ok(std::move(settings));
}

GatewayResult<void> readUpstreams(const ConfigManager& config, GatewaySettings& out) {
    auto list = config.node("upstreams");
    if (!list) {
        return GatewayResult<void>::err(invalid("upstreams", "at least one upstream is required"));
    }
    if (!list.value().IsSequence() || list.value().size() == 0) {
        return GatewayResult<void>::err(invalid("upstreams", "expected a non-empty list"));
    }

    std::unordered_set<std::string> seen;
    std::size_t index = 0;
    for (const auto& entry : list.value()) {
        const auto where = "upstreams[" + std::to_string(index++) + "]";
        auto upstream = parseUpstream(entry, where);
        if (!upstream) {
            return upstream.propagate<void>();
        }
        if (!seen.insert(upstream.value().service.id).second) {
            return GatewayResult<void>::err(invalid(where + ".id", "duplicate upstream id"));
        }
        out.upstreams.push_back(std::move(upstream).value());
    }
    return GatewayResult<void>::ok();
}

GatewayResult<void> readRoutes(const ConfigManager& config, GatewaySettings& out) {
    auto list = config.node("routes");
    if (!list) {
        return GatewayResult<void>::err(invalid("routes", "at least one route is required"));
    }
    if (!list.value().IsSequence() || list.value().size() == 0) {
        return GatewayResult<void>::err(invalid("routes", "expected a non-empty list"));
    }

    auto known = [&out](const std::string& id) {
        return std::any_of(out.upstreams.begin(), out.upstreams.end(),
                           [&id](const UpstreamSettings& u) { return u.service.id == id; });
    };

    std::size_t index = 0;
    for (const auto& entry : list.value()) {
        const auto where = "routes[" + std::to_string(index++) + "]";
        if (!entry.IsMap()) {
            return GatewayResult<void>::err(invalid(where, "expected a mapping"));
        }

        auto resource = required<std::string>(entry, "resource", where);
        if (!resource) {
            return resource.propagate<void>();
        }
        if (!isValidPattern(resource.value())) {
            return GatewayResult<void>::err(invalid(where + ".resource", "malformed pattern"));
        }

        auto candidates = stringList(entry, "upstreams", where);
        if (!candidates) {
            return candidates.propagate<void>();
        }
        if (candidates.value().empty()) {
            return GatewayResult<void>::err(
                invalid(where + ".upstreams", "at least one upstream is required"));
        }
        for (const auto& id : candidates.value()) {
            if (!known(id)) {
                return GatewayResult<void>::err(
                    invalid(where + ".upstreams", "unknown upstream '" + id + "'"));
            }
        }

        auto fallback = field<std::string>(entry, "fallback", where);
        if (!fallback) {
            return fallback.propagate<void>();
        }
        if (fallback.value() && !known(*fallback.value())) {
            return GatewayResult<void>::err(
                invalid(where + ".fallback", "unknown upstream '" + *fallback.value() + "'"));
        }

        out.routes.push_back(ResourceRoute{
            .resourcePattern = std::move(resource).value(),
            .candidates = std::move(candidates).value(),
            .fallback = std::move(fallback).value(),
        });
    }
    return GatewayResult<void>::ok();
}

GatewayResult<void> readPrincipals(const ConfigManager& config, GatewaySettings& out) {
    if (!config.hasKey("principals")) {
        return GatewayResult<void>::ok();
    }
    auto list = config.node("principals");
    if (!list) {
        return GatewayResult<void>::err(invalid("principals", list.error().message()));
    }
    if (!list.value().IsSequence()) {
        return GatewayResult<void>::err(invalid("principals", "expected a list"));
    }

    std::unordered_set<std::string> seen;
    std::size_t index = 0;
    for (const auto& entry : list.value()) {
        const auto where = "principals[" + std::to_string(index++) + "]";
        if (!entry.IsMap()) {
            return GatewayResult<void>::err(invalid(where, "expected a mapping"));
        }

        auto id = required<std::string>(entry, "id", where);
        if (!id) {
            return id.propagate<void>();
        }
        if (id.value().empty() || !seen.insert(id.value()).second) {
            return GatewayResult<void>::err(invalid(where + ".id", "empty or duplicate id"));
        }

        auto tierName = required<std::string>(entry, "tier", where);
        if (!tierName) {
            return tierName.propagate<void>();
        }
        auto tier = parseTier(tierName.value());
        if (!tier) {
            return GatewayResult<void>::err(invalid(where + ".tier", "unknown tier"));
        }

        auto events = stringList(entry, "events", where);
        if (!events) {
            return events.propagate<void>();
        }

        Principal principal;
        principal.id = std::move(id).value();
        principal.tier = *tier;
        principal.eventBindings = std::move(events).value();

        const YAML::Node rules = entry["rules"];
        if (rules.IsDefined() && !rules.IsNull()) {
            auto parsed = parseRules(rules, where + ".rules", principal.id);
            if (!parsed) {
                return parsed.propagate<void>();
            }
            principal.rules = std::move(parsed).value();
        }

        out.principals.push_back(std::move(principal));
    }
    return GatewayResult<void>::ok();
}

}  // namespace

GatewayResult<GatewaySettings> loadGatewaySettings(const ConfigManager& config) {
    GatewaySettings settings;

    using Reader = GatewayResult<void> (*)(const ConfigManager&, GatewaySettings&);
    constexpr Reader kReaders[] = {
        &readGateway, &readLedger,    &readClassifier, &readRouting,
        &readHealth,  &readTiers,     &readUpstreams,  &readRoutes,
        &readPrincipals,
    };

    for (auto* read : kReaders) {
        auto result = read(config, settings);
        if (!result) {
            return result.propagate<GatewaySettings>();
        }
    }

    const bool anyRule =
        std::any_of(settings.tierRules.begin(), settings.tierRules.end(),
                    [](const auto& rules) { return !rules.empty(); }) ||
        std::any_of(settings.principals.begin(), settings.principals.end(),
                    [](const Principal& p) { return !p.rules.empty(); });
    if (!anyRule) {
        return GatewayResult<GatewaySettings>::err(
            invalid("tiers", "no rate-limit rules configured"));
    }

    return GatewayResult<GatewaySettings>::ok(std::move(settings));
}

}  // namespace agw::service

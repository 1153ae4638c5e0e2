/// @file health_monitor.cpp
/// @brief HealthMonitor implementation.

#include "agw/service/health_monitor.hpp"

#include "agw/foundation/gateway_logger.hpp"
#include "agw/foundation/sample_queue.hpp"
#include "agw/foundation/task_scheduler.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <shared_mutex>
#include <thread>
#include <unordered_map>

namespace agw::service {

using foundation::ErrorCode;
using foundation::GatewayError;
using foundation::GatewayLogger;
using foundation::GatewayResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::TaskPriority;
using foundation::TaskScheduler;

namespace {

struct UpstreamEntry {
    UpstreamService service;
    HealthProbe probe;
    std::unique_ptr<CircuitBreaker> breaker;

    // Written by the aggregator only; negative until the first sample.
    std::atomic<double> latencyEwma{-1.0};
};

}  // namespace

// ── Impl ────────────────────────────────────────────────────────────────────

struct HealthMonitor::Impl {
    HealthMonitorConfig config;
    const foundation::Clock& clock;
    std::shared_ptr<ITelemetrySink> telemetry;

    mutable std::shared_mutex registryMutex;
    std::unordered_map<std::string, std::unique_ptr<UpstreamEntry>> upstreams;

    foundation::SampleQueue<HealthSample> queue;

    std::mutex schedulerMutex;
    std::unique_ptr<TaskScheduler> scheduler;
    std::vector<TaskScheduler::TaskId> stragglers;

    std::atomic<bool> running{false};
    std::mutex stopMutex;
    std::condition_variable stopCv;
    std::thread samplerThread;
    std::thread aggregatorThread;

    Impl(HealthMonitorConfig cfg, const foundation::Clock& c,
         std::shared_ptr<ITelemetrySink> sink)
        : config(cfg), clock(c), telemetry(std::move(sink)), queue(cfg.queueCapacity) {}

    UpstreamEntry* find(std::string_view id) const {
        std::shared_lock lock(registryMutex);
        auto it = upstreams.find(std::string(id));
        return it == upstreams.end() ? nullptr : it->second.get();
    }

    void onTransition(const UpstreamService& service, CircuitState from, CircuitState to) {
        LogContext ctx;
        ctx.upstream = service.id;
        ctx.extra["from"] = std::string(circuitStateName(from));
        ctx.extra["to"] = std::string(circuitStateName(to));
        auto level = to == CircuitState::Open ? LogLevel::Warning : LogLevel::Info;
        GatewayLogger::instance().logWithContext(level, LogCategory::Health,
                                                 "circuit transition", ctx);

        if (telemetry) {
            TelemetryEvent event;
            event.kind = TelemetryKind::CircuitTransition;
            event.subject = service.id;
            event.oldState = std::string(circuitStateName(from));
            event.newState = std::string(circuitStateName(to));
            if (service.criticalPath && to == CircuitState::Open) {
                event.detail = "critical_path: trickling " +
                               std::to_string(service.criticalTrickle) + " concurrent";
            }
            event.timestamp = clock.now();
            telemetry->publish(event);
        }
    }

    void apply(const HealthSample& sample) {
        auto* entry = find(sample.upstream);
        if (entry == nullptr) {
            return;
        }
        entry->breaker->record(sample.success, sample.at,
                               sample.trial || sample.source == SampleSource::Probe);

        if (sample.success) {
            auto x = static_cast<double>(sample.latency.count());
            auto old = entry->latencyEwma.load(std::memory_order_relaxed);
            auto next = old < 0.0 ? x : kLatencyAlpha * x + (1.0 - kLatencyAlpha) * old;
            entry->latencyEwma.store(next, std::memory_order_relaxed);
        }
    }

    void evaluateAll() {
        std::shared_lock lock(registryMutex);
        for (auto& [_, entry] : upstreams) {
            entry->breaker->evaluate();
        }
    }

    TaskScheduler& ensureScheduler() {
        // schedulerMutex held by caller.
        if (!scheduler) {
            scheduler = std::make_unique<TaskScheduler>(std::max<std::size_t>(config.probeThreads, 1));
        }
        return *scheduler;
    }

    void pushProbeFailure(const std::string& id, std::string_view why) {
        LogContext ctx;
        ctx.upstream = id;
        GatewayLogger::instance().logWithContext(LogLevel::Warning, LogCategory::Health,
                                                 std::string("probe failed: ") + std::string(why),
                                                 ctx);
        queue.push(HealthSample{id, false, config.probeInterval, clock.now(), SampleSource::Probe});
    }

    void samplerLoop() {
        while (running.load(std::memory_order_acquire)) {
            auto cycle = runProbeCycle();
            if (!cycle) {
                AGW_LOG_ERROR(LogCategory::Health,
                              "probe cycle failed: " + std::string(cycle.error().message()));
            }
            std::unique_lock lock(stopMutex);
            stopCv.wait_for(lock, config.probeInterval,
                            [this] { return !running.load(std::memory_order_acquire); });
        }
    }

    void aggregatorLoop() {
        auto slice = std::min<std::chrono::milliseconds>(config.probeInterval,
                                                         std::chrono::milliseconds(200));
        while (running.load(std::memory_order_acquire)) {
            if (auto sample = queue.popFor(slice)) {
                apply(*sample);
            }
            while (auto sample = queue.tryPop()) {
                apply(*sample);
            }
            evaluateAll();
        }
    }

    GatewayResult<std::size_t> runProbeCycle();
};

GatewayResult<std::size_t> HealthMonitor::Impl::runProbeCycle() {
    std::vector<std::pair<std::string, HealthProbe>> probes;
    {
        std::shared_lock lock(registryMutex);
        for (const auto& [id, entry] : upstreams) {
            if (entry->probe) {
                probes.emplace_back(id, entry->probe);
            }
        }
    }
    if (probes.empty()) {
        return GatewayResult<std::size_t>::ok(0);
    }

    std::lock_guard schedLock(schedulerMutex);
    auto& sched = ensureScheduler();

    // Collect probes that overran a previous cycle.
    std::erase_if(stragglers, [&sched](TaskScheduler::TaskId id) {
        auto done = sched.waitFor(id, std::chrono::milliseconds(0));
        return !(done.hasError() && done.error().code() == ErrorCode::JobTimeout);
    });

    struct Pending {
        std::string upstream;
        TaskScheduler::TaskId task;
        std::shared_ptr<std::atomic<bool>> claimed;
    };
    std::vector<Pending> pending;
    pending.reserve(probes.size());

    for (auto& [id, probe] : probes) {
        auto claimed = std::make_shared<std::atomic<bool>>(false);
        auto scheduled = sched.schedule(
            [this, id, probe, claimed] {
                ProbeResult result;
                try {
                    result = probe();
                } catch (const std::exception& e) {
                    LogContext ctx;
                    ctx.upstream = id;
                    GatewayLogger::instance().logWithContext(
                        LogLevel::Warning, LogCategory::Health,
                        std::string("probe threw: ") + e.what(), ctx);
                    result = ProbeResult{false, std::chrono::milliseconds(0)};
                }
                if (!claimed->exchange(true)) {
                    queue.push(HealthSample{id, result.success, result.latency, clock.now(),
                                            SampleSource::Probe});
                }
            },
            TaskPriority::High);

        if (!scheduled) {
            pushProbeFailure(id, scheduled.error().message());
            continue;
        }
        pending.push_back(Pending{id, scheduled.value(), claimed});
    }

    const auto deadline = std::chrono::steady_clock::now() + config.probeInterval;
    for (auto& p : pending) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        auto done = sched.waitFor(p.task, std::max(remaining, std::chrono::milliseconds(0)));
        if (done) {
            continue;
        }
        if (done.error().code() == ErrorCode::JobTimeout) {
            stragglers.push_back(p.task);
            if (!p.claimed->exchange(true)) {
                pushProbeFailure(p.upstream, "deadline exceeded");
            }
        } else {
            AGW_LOG_WARN(LogCategory::Health,
                         "probe task for " + p.upstream + ": " +
                             std::string(done.error().message()));
        }
    }

    return GatewayResult<std::size_t>::ok(pending.size());
}

// ── Public API ──────────────────────────────────────────────────────────────

HealthMonitor::HealthMonitor(HealthMonitorConfig config,
                             const foundation::Clock& clock,
                             std::shared_ptr<ITelemetrySink> telemetry)
    : impl_(std::make_unique<Impl>(config, clock, std::move(telemetry))) {}

HealthMonitor::~HealthMonitor() {
    stop();
}

GatewayResult<void> HealthMonitor::registerUpstream(UpstreamService service, HealthProbe probe) {
    if (service.id.empty()) {
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::InvalidArgument, "upstream id must not be empty"));
    }
    if (!(service.failureThreshold > 0.0 && service.failureThreshold <= 1.0)) {
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::InvalidArgument,
                         "upstream " + service.id + ": failure threshold must be in (0, 1]"));
    }
    if (service.maxConcurrency == 0 || service.halfOpenProbes == 0 ||
        service.recoveryTimeout.count() <= 0) {
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::InvalidArgument,
                         "upstream " + service.id +
                             ": concurrency, half-open probes and recovery timeout must be "
                             "positive"));
    }

    auto entry = std::make_unique<UpstreamEntry>();
    entry->service = service;
    entry->probe = std::move(probe);
    entry->breaker = std::make_unique<CircuitBreaker>(
        CircuitBreakerConfig{
            .failureThreshold = service.failureThreshold,
            .recoveryTimeout = service.recoveryTimeout,
            .rollingWindow = impl_->config.rollingWindow,
            .minimumSamples = impl_->config.minimumSamples,
            .halfOpenProbes = service.halfOpenProbes,
            .name = service.id,
        },
        impl_->clock);

    auto* impl = impl_.get();
    entry->breaker->onTransition(
        [impl, service](std::string_view, CircuitState from, CircuitState to) {
            impl->onTransition(service, from, to);
        });

    std::unique_lock lock(impl_->registryMutex);
    auto [it, inserted] = impl_->upstreams.try_emplace(service.id, std::move(entry));
    if (!inserted) {
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::UpstreamAlreadyRegistered,
                         "upstream " + service.id + " already registered"));
    }
    return GatewayResult<void>::ok();
}

void HealthMonitor::recordOutcome(std::string_view upstream, bool success,
                                  std::chrono::milliseconds latency, bool trial) {
    if (impl_->find(upstream) == nullptr) {
        AGW_LOG_DEBUG(LogCategory::Health,
                      "outcome for unknown upstream " + std::string(upstream) + " dropped");
        return;
    }
    impl_->queue.push(HealthSample{std::string(upstream), success, latency, impl_->clock.now(),
                                   SampleSource::Passive, trial});
}

GatewayResult<std::size_t> HealthMonitor::runProbeCycle() {
    return impl_->runProbeCycle();
}

std::size_t HealthMonitor::drain() {
    std::size_t applied = 0;
    while (auto sample = impl_->queue.tryPop()) {
        impl_->apply(*sample);
        ++applied;
    }
    impl_->evaluateAll();
    return applied;
}

GatewayResult<void> HealthMonitor::start() {
    bool expected = false;
    if (!impl_->running.compare_exchange_strong(expected, true)) {
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::MonitorAlreadyRunning, "health monitor already running"));
    }
    impl_->aggregatorThread = std::thread([this] { impl_->aggregatorLoop(); });
    impl_->samplerThread = std::thread([this] { impl_->samplerLoop(); });
    AGW_LOG_INFO(LogCategory::Health,
                 "health monitor started, interval " +
                     std::to_string(impl_->config.probeInterval.count()) + "ms");
    return GatewayResult<void>::ok();
}

void HealthMonitor::stop() {
    if (!impl_->running.exchange(false)) {
        return;
    }
    {
        std::lock_guard lock(impl_->stopMutex);
    }
    impl_->stopCv.notify_all();

    if (impl_->samplerThread.joinable()) {
        impl_->samplerThread.join();
    }
    if (impl_->aggregatorThread.joinable()) {
        impl_->aggregatorThread.join();
    }
    drain();
    AGW_LOG_INFO(LogCategory::Health, "health monitor stopped");
}

bool HealthMonitor::isRunning() const {
    return impl_->running.load(std::memory_order_acquire);
}

std::optional<UpstreamSnapshot> HealthMonitor::snapshot(std::string_view upstream) const {
    auto* entry = impl_->find(upstream);
    if (entry == nullptr) {
        return std::nullopt;
    }
    UpstreamSnapshot snap;
    snap.service = entry->service;
    snap.state = entry->breaker->state();
    auto latency = entry->latencyEwma.load(std::memory_order_relaxed);
    if (latency >= 0.0) {
        snap.latencyMs = latency;
    }
    snap.failureRatio = entry->breaker->failureRatio();
    snap.samples = entry->breaker->sampleCount();
    snap.retryAfter = entry->breaker->retryAfter();
    return snap;
}

std::vector<UpstreamSnapshot> HealthMonitor::snapshots() const {
    std::vector<std::string> ids;
    {
        std::shared_lock lock(impl_->registryMutex);
        ids.reserve(impl_->upstreams.size());
        for (const auto& [id, _] : impl_->upstreams) {
            ids.push_back(id);
        }
    }
    std::sort(ids.begin(), ids.end());

    std::vector<UpstreamSnapshot> out;
    out.reserve(ids.size());
    for (const auto& id : ids) {
        if (auto snap = snapshot(id)) {
            out.push_back(std::move(*snap));
        }
    }
    return out;
}

GatewayResult<CircuitState> HealthMonitor::state(std::string_view upstream) const {
    auto* entry = impl_->find(upstream);
    if (entry == nullptr) {
        return GatewayResult<CircuitState>::err(
            GatewayError(ErrorCode::UpstreamNotFound,
                         "unknown upstream " + std::string(upstream)));
    }
    return GatewayResult<CircuitState>::ok(entry->breaker->state());
}

bool HealthMonitor::tryAcquireTrial(std::string_view upstream) {
    auto* entry = impl_->find(upstream);
    return entry != nullptr && entry->breaker->tryAcquireTrial();
}

void HealthMonitor::releaseTrial(std::string_view upstream) {
    if (auto* entry = impl_->find(upstream)) {
        entry->breaker->releaseTrial();
    }
}

GatewayResult<void> HealthMonitor::forceState(std::string_view upstream, CircuitState state) {
    auto* entry = impl_->find(upstream);
    if (entry == nullptr) {
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::UpstreamNotFound,
                         "unknown upstream " + std::string(upstream)));
    }
    entry->breaker->forceState(state);
    return GatewayResult<void>::ok();
}

std::size_t HealthMonitor::pendingSamples() const {
    return impl_->queue.size();
}

}  // namespace agw::service

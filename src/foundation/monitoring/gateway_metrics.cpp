/// @file gateway_metrics.cpp
/// @brief In-memory GatewayMetrics.

#include "agw/foundation/gateway_metrics.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <map>
#include <mutex>
#include <sstream>
#include <unordered_map>

namespace agw::foundation {

HistogramBuckets HistogramBuckets::admissionLatency() {
    return HistogramBuckets{{0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 25}};
}

std::string labeled(std::string_view base, std::string_view key, std::string_view value) {
    std::string out(base);
    out += '{';
    out += key;
    out += "=\"";
    out += value;
    out += "\"}";
    return out;
}

namespace {

struct HistogramData {
    std::vector<double> boundaries;
    std::vector<uint64_t> bucketCounts;  // one per boundary + 1 for +Inf
    uint64_t totalCount{0};
    double totalSum{0.0};

    explicit HistogramData(std::vector<double> bounds)
        : boundaries(std::move(bounds)), bucketCounts(boundaries.size() + 1, 0) {}

    void record(double value) {
        for (std::size_t i = 0; i < boundaries.size(); ++i) {
            if (value <= boundaries[i]) {
                ++bucketCounts[i];
            }
        }
        ++bucketCounts.back();
        ++totalCount;
        totalSum += value;
    }
};

// std::atomic<double>::fetch_add is not available everywhere; CAS loop.
void atomicAdd(std::atomic<double>& target, double delta) {
    double current = target.load(std::memory_order_relaxed);
    while (!target.compare_exchange_weak(
        current, current + delta, std::memory_order_release, std::memory_order_relaxed)) {
    }
}

std::string formatDouble(double value) {
    if (std::isinf(value)) {
        return value > 0 ? "+Inf" : "-Inf";
    }
    if (std::isnan(value)) {
        return "NaN";
    }
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

std::string_view baseName(std::string_view name) {
    return name.substr(0, name.find('{'));
}

// Emit `# TYPE` once per base name, then every series under it.
template <typename Map, typename Render>
void exportFamily(std::ostringstream& out, const Map& series, std::string_view type,
                  Render render) {
    std::map<std::string, std::vector<std::string>> families;
    for (const auto& [name, _] : series) {
        families[std::string(baseName(name))].push_back(name);
    }
    for (auto& [base, names] : families) {
        std::sort(names.begin(), names.end());
        out << "# TYPE " << base << ' ' << type << "\n";
        for (const auto& name : names) {
            out << name << ' ' << render(series.at(name)) << "\n";
        }
    }
}

}  // anonymous namespace

struct GatewayMetrics::Impl {
    mutable std::mutex counterMutex;
    std::unordered_map<std::string, std::atomic<uint64_t>> counters;

    mutable std::mutex gaugeMutex;
    std::unordered_map<std::string, std::atomic<double>> gauges;

    mutable std::mutex histogramMutex;
    std::unordered_map<std::string, HistogramData> histograms;

    mutable std::mutex healthMutex;
    std::string serviceName{"agw"};
    std::unordered_map<std::string, HealthStatus> componentHealth;
};

GatewayMetrics::GatewayMetrics() : impl_(std::make_unique<Impl>()) {}

GatewayMetrics::~GatewayMetrics() = default;

GatewayMetrics::GatewayMetrics(GatewayMetrics&&) noexcept = default;

GatewayMetrics& GatewayMetrics::operator=(GatewayMetrics&&) noexcept = default;

// ── Counters ────────────────────────────────────────────────────────────────

void GatewayMetrics::incrementCounter(std::string_view name, uint64_t value) {
    std::lock_guard lock(impl_->counterMutex);
    impl_->counters[std::string(name)].fetch_add(value, std::memory_order_relaxed);
}

uint64_t GatewayMetrics::counterValue(std::string_view name) const {
    std::lock_guard lock(impl_->counterMutex);
    auto it = impl_->counters.find(std::string(name));
    if (it == impl_->counters.end()) {
        return 0;
    }
    return it->second.load(std::memory_order_relaxed);
}

// ── Gauges ──────────────────────────────────────────────────────────────────

void GatewayMetrics::setGauge(std::string_view name, double value) {
    std::lock_guard lock(impl_->gaugeMutex);
    impl_->gauges[std::string(name)].store(value, std::memory_order_release);
}

void GatewayMetrics::incrementGauge(std::string_view name, double delta) {
    std::lock_guard lock(impl_->gaugeMutex);
    atomicAdd(impl_->gauges[std::string(name)], delta);
}

void GatewayMetrics::decrementGauge(std::string_view name, double delta) {
    std::lock_guard lock(impl_->gaugeMutex);
    atomicAdd(impl_->gauges[std::string(name)], -delta);
}

double GatewayMetrics::gaugeValue(std::string_view name) const {
    std::lock_guard lock(impl_->gaugeMutex);
    auto it = impl_->gauges.find(std::string(name));
    if (it == impl_->gauges.end()) {
        return 0.0;
    }
    return it->second.load(std::memory_order_acquire);
}

// ── Histograms ──────────────────────────────────────────────────────────────

void GatewayMetrics::registerHistogram(std::string_view name, HistogramBuckets buckets) {
    std::lock_guard lock(impl_->histogramMutex);
    auto key = std::string(name);
    if (impl_->histograms.find(key) == impl_->histograms.end()) {
        impl_->histograms.emplace(std::move(key), HistogramData(std::move(buckets.boundaries)));
    }
}

void GatewayMetrics::recordHistogram(std::string_view name, double value) {
    std::lock_guard lock(impl_->histogramMutex);
    auto it = impl_->histograms.find(std::string(name));
    if (it != impl_->histograms.end()) {
        it->second.record(value);
    }
}

// ── Health ──────────────────────────────────────────────────────────────────

void GatewayMetrics::setComponentHealth(std::string_view component, HealthStatus status) {
    std::lock_guard lock(impl_->healthMutex);
    impl_->componentHealth[std::string(component)] = status;
}

void GatewayMetrics::setServiceName(std::string name) {
    std::lock_guard lock(impl_->healthMutex);
    impl_->serviceName = std::move(name);
}

HealthCheckResult GatewayMetrics::healthCheck() const {
    std::lock_guard lock(impl_->healthMutex);

    HealthCheckResult result;
    result.serviceName = impl_->serviceName;
    result.timestamp = std::chrono::system_clock::now();
    result.components = impl_->componentHealth;

    result.status = HealthStatus::Healthy;
    for (const auto& [_, status] : impl_->componentHealth) {
        if (status == HealthStatus::Unhealthy) {
            result.status = HealthStatus::Unhealthy;
            break;
        }
        if (status == HealthStatus::Degraded) {
            result.status = HealthStatus::Degraded;
        }
    }
    return result;
}

// ── Prometheus scrape ───────────────────────────────────────────────────────

std::string GatewayMetrics::scrape() const {
    std::ostringstream out;

    {
        std::lock_guard lock(impl_->counterMutex);
        exportFamily(out, impl_->counters, "counter", [](const std::atomic<uint64_t>& v) {
            return std::to_string(v.load(std::memory_order_relaxed));
        });
    }

    {
        std::lock_guard lock(impl_->gaugeMutex);
        exportFamily(out, impl_->gauges, "gauge", [](const std::atomic<double>& v) {
            return formatDouble(v.load(std::memory_order_acquire));
        });
    }

    {
        std::lock_guard lock(impl_->histogramMutex);
        for (const auto& [name, data] : impl_->histograms) {
            out << "# TYPE " << name << " histogram\n";
            for (std::size_t i = 0; i < data.boundaries.size(); ++i) {
                out << name << "_bucket{le=\"" << formatDouble(data.boundaries[i]) << "\"} "
                    << data.bucketCounts[i] << "\n";
            }
            out << name << "_bucket{le=\"+Inf\"} " << data.bucketCounts.back() << "\n";
            out << name << "_sum " << formatDouble(data.totalSum) << "\n";
            out << name << "_count " << data.totalCount << "\n";
        }
    }

    return out.str();
}

void GatewayMetrics::reset() {
    {
        std::lock_guard lock(impl_->counterMutex);
        impl_->counters.clear();
    }
    {
        std::lock_guard lock(impl_->gaugeMutex);
        impl_->gauges.clear();
    }
    {
        std::lock_guard lock(impl_->histogramMutex);
        impl_->histograms.clear();
    }
    {
        std::lock_guard lock(impl_->healthMutex);
        impl_->componentHealth.clear();
    }
}

GatewayMetrics& GatewayMetrics::instance() {
    static GatewayMetrics inst;
    return inst;
}

}  // namespace agw::foundation

#pragma once

/// @file clock.hpp
/// @brief Injectable wall-clock source.
///
/// Quota buckets, override expiry, event-day checks and circuit recovery
/// timers all read time through a Clock so that tests can drive them
/// deterministically with ManualClock.

#include <atomic>
#include <chrono>
#include <cstdint>

namespace agw::foundation {

/// Abstract time source.
class Clock {
public:
    using time_point = std::chrono::system_clock::time_point;

    virtual ~Clock() = default;

    [[nodiscard]] virtual time_point now() const = 0;

    /// Milliseconds since the Unix epoch.
    [[nodiscard]] int64_t nowMillis() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   now().time_since_epoch())
            .count();
    }
};

/// Production clock backed by std::chrono::system_clock.
class SystemClock final : public Clock {
public:
    [[nodiscard]] time_point now() const override {
        return std::chrono::system_clock::now();
    }
};

/// Manually advanced clock for tests. Thread-safe.
class ManualClock final : public Clock {
public:
    explicit ManualClock(time_point start = time_point{std::chrono::hours(24 * 365 * 50)})
        : ticks_(start.time_since_epoch().count()) {}

    [[nodiscard]] time_point now() const override {
        return time_point{time_point::duration{ticks_.load(std::memory_order_acquire)}};
    }

    void set(time_point t) {
        ticks_.store(t.time_since_epoch().count(), std::memory_order_release);
    }

    template <typename Rep, typename Period>
    void advance(std::chrono::duration<Rep, Period> delta) {
        auto d = std::chrono::duration_cast<time_point::duration>(delta);
        ticks_.fetch_add(d.count(), std::memory_order_acq_rel);
    }

private:
    std::atomic<time_point::rep> ticks_;
};

} // namespace agw::foundation

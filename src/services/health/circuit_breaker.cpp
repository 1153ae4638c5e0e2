/// @file circuit_breaker.cpp
/// @brief CircuitBreaker state machine implementation.

#include "agw/service/circuit_breaker.hpp"

#include <algorithm>

namespace agw::service {

CircuitBreaker::CircuitBreaker(CircuitBreakerConfig config, const foundation::Clock& clock)
    : config_(std::move(config)), clock_(clock) {}

void CircuitBreaker::onTransition(TransitionCallback callback) {
    std::lock_guard lock(callbackMutex_);
    callbacks_.push_back(std::move(callback));
}

void CircuitBreaker::record(bool success, std::chrono::system_clock::time_point at,
                            bool trial) {
    std::vector<Transition> fired;
    {
        std::lock_guard lock(mutex_);

        switch (state_) {
            case CircuitState::Closed: {
                auto now = clock_.now();
                if (at + config_.rollingWindow <= now) {
                    break;  // too old to matter
                }
                window_.emplace_back(at, success);
                if (!success) {
                    ++windowFailures_;
                }
                trim(now);

                auto total = window_.size();
                if (total >= config_.minimumSamples && total > 0) {
                    auto ratio = static_cast<double>(windowFailures_) / static_cast<double>(total);
                    if (ratio > config_.failureThreshold) {
                        transitionTo(CircuitState::Open, fired);
                    }
                }
                break;
            }

            case CircuitState::HalfOpen:
                if (!trial) {
                    break;  // request admitted before the trip
                }
                if (!success) {
                    // Any failed probe re-opens immediately.
                    transitionTo(CircuitState::Open, fired);
                } else if (++halfOpenSuccesses_ >= config_.halfOpenProbes) {
                    transitionTo(CircuitState::Closed, fired);
                }
                break;

            case CircuitState::Open:
                // Only the recovery timer leaves Open.
                break;
        }
    }
    notify(fired);
}

bool CircuitBreaker::evaluate() {
    std::vector<Transition> fired;
    {
        std::lock_guard lock(mutex_);
        auto now = clock_.now();
        if (state_ == CircuitState::Open && now - openedAt_ >= config_.recoveryTimeout) {
            transitionTo(CircuitState::HalfOpen, fired);
        } else if (state_ == CircuitState::Closed) {
            trim(now);
        }
    }
    notify(fired);
    return !fired.empty();
}

bool CircuitBreaker::tryAcquireTrial() {
    std::lock_guard lock(mutex_);
    if (state_ != CircuitState::HalfOpen) {
        return false;
    }
    if (trialsInFlight_ + halfOpenSuccesses_ >= config_.halfOpenProbes) {
        return false;
    }
    ++trialsInFlight_;
    return true;
}

void CircuitBreaker::releaseTrial() {
    std::lock_guard lock(mutex_);
    if (trialsInFlight_ > 0) {
        --trialsInFlight_;
    }
}

void CircuitBreaker::forceState(CircuitState newState) {
    std::vector<Transition> fired;
    {
        std::lock_guard lock(mutex_);
        if (state_ != newState) {
            transitionTo(newState, fired);
        }
    }
    notify(fired);
}

void CircuitBreaker::reset() {
    std::lock_guard lock(mutex_);
    state_ = CircuitState::Closed;
    window_.clear();
    windowFailures_ = 0;
    halfOpenSuccesses_ = 0;
    trialsInFlight_ = 0;
    openedAt_ = {};
}

CircuitState CircuitBreaker::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

double CircuitBreaker::failureRatio() const {
    std::lock_guard lock(mutex_);
    if (window_.empty()) {
        return 0.0;
    }
    return static_cast<double>(windowFailures_) / static_cast<double>(window_.size());
}

std::size_t CircuitBreaker::sampleCount() const {
    std::lock_guard lock(mutex_);
    return window_.size();
}

uint32_t CircuitBreaker::halfOpenSuccessCount() const {
    std::lock_guard lock(mutex_);
    return halfOpenSuccesses_;
}

std::chrono::seconds CircuitBreaker::retryAfter() const {
    std::lock_guard lock(mutex_);
    switch (state_) {
        case CircuitState::Closed:
            return std::chrono::seconds(0);
        case CircuitState::HalfOpen:
            return std::chrono::seconds(1);
        case CircuitState::Open: {
            auto remaining = std::chrono::ceil<std::chrono::seconds>(
                openedAt_ + config_.recoveryTimeout - clock_.now());
            return std::max(remaining, std::chrono::seconds(1));
        }
    }
    return std::chrono::seconds(1);
}

std::string_view CircuitBreaker::name() const {
    return config_.name;
}

void CircuitBreaker::transitionTo(CircuitState newState, std::vector<Transition>& fired) {
    fired.push_back(Transition{state_, newState});
    state_ = newState;

    // Each state starts with a fresh window; stale failures must not
    // re-trip a circuit that just recovered.
    window_.clear();
    windowFailures_ = 0;
    halfOpenSuccesses_ = 0;
    trialsInFlight_ = 0;

    if (newState == CircuitState::Open) {
        openedAt_ = clock_.now();
    }
}

void CircuitBreaker::trim(std::chrono::system_clock::time_point now) {
    auto cutoff = now - config_.rollingWindow;
    while (!window_.empty() && window_.front().first <= cutoff) {
        if (!window_.front().second) {
            --windowFailures_;
        }
        window_.pop_front();
    }
}

void CircuitBreaker::notify(const std::vector<Transition>& fired) {
    if (fired.empty()) {
        return;
    }
    std::vector<TransitionCallback> callbacks;
    {
        std::lock_guard lock(callbackMutex_);
        callbacks = callbacks_;
    }
    for (const auto& t : fired) {
        for (const auto& cb : callbacks) {
            cb(config_.name, t.from, t.to);
        }
    }
}

}  // namespace agw::service

#pragma once

/// @file sample_queue.hpp
/// @brief Bounded blocking queue connecting sample producers to one consumer.

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace agw::foundation {

/// Multi-producer blocking queue.
///
/// When full, push() drops the oldest element: health samples lose value
/// with age and a producer must never block the request path.
/// close() wakes every waiter; pops then drain what is left and return
/// nullopt once empty.
template <typename T>
class SampleQueue {
public:
    explicit SampleQueue(std::size_t capacity = 4096) : capacity_(capacity == 0 ? 1 : capacity) {}

    SampleQueue(const SampleQueue&) = delete;
    SampleQueue& operator=(const SampleQueue&) = delete;

    /// @return false if the queue is closed and the item was discarded.
    bool push(T item) {
        {
            std::lock_guard lock(mutex_);
            if (closed_) {
                return false;
            }
            if (queue_.size() >= capacity_) {
                queue_.pop_front();
                ++dropped_;
            }
            queue_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    std::optional<T> tryPop() {
        std::lock_guard lock(mutex_);
        return popLocked();
    }

    /// Block until an item arrives, the queue is closed, or @p timeout passes.
    template <typename Rep, typename Period>
    std::optional<T> popFor(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
        return popLocked();
    }

    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    [[nodiscard]] bool closed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard lock(mutex_);
        return queue_.size();
    }

    /// Items discarded because the queue was full.
    [[nodiscard]] uint64_t dropped() const {
        std::lock_guard lock(mutex_);
        return dropped_;
    }

private:
    std::optional<T> popLocked() {
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop_front();
        return item;
    }

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> queue_;
    bool closed_ = false;
    uint64_t dropped_ = 0;
};

}  // namespace agw::foundation

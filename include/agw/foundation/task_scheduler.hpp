#pragma once

/// @file task_scheduler.hpp
/// @brief TaskScheduler wrapping the kcenon thread_system pool.
///
/// Runs health probes off the sampling thread so that one slow upstream
/// cannot delay probes of the others.

#include "agw/foundation/gateway_result.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <thread>

namespace agw::foundation {

/// Maps to kcenon::thread::job_priority internally.
enum class TaskPriority { Critical, High, Normal, Low };

/// Thread-pool backed task scheduler with waitable task IDs.
///
/// @code
///   TaskScheduler scheduler(2);
///   auto id = scheduler.schedule([&] { probe("payments-primary"); }, TaskPriority::High);
///   auto done = scheduler.waitFor(id.value(), std::chrono::milliseconds(500));
/// @endcode
class TaskScheduler {
public:
    using TaskId = uint64_t;
    using TaskFunc = std::function<void()>;

    explicit TaskScheduler(std::size_t numThreads = std::thread::hardware_concurrency());

    ~TaskScheduler();

    TaskScheduler(const TaskScheduler&) = delete;
    TaskScheduler& operator=(const TaskScheduler&) = delete;
    TaskScheduler(TaskScheduler&&) noexcept;
    TaskScheduler& operator=(TaskScheduler&&) noexcept;

    /// @return The assigned TaskId, or JobScheduleFailed.
    GatewayResult<TaskId> schedule(TaskFunc task, TaskPriority priority = TaskPriority::Normal);

    /// Block until the task completes.
    /// @return Success, JobNotFound, or ThreadError if the task threw.
    GatewayResult<void> wait(TaskId id);

    /// Block until the task completes or @p timeout passes (JobTimeout).
    GatewayResult<void> waitFor(TaskId id, std::chrono::milliseconds timeout);

    /// Request cancellation of a task that has not started yet.
    GatewayResult<void> cancel(TaskId id);

    /// Number of tasks scheduled and not yet forgotten by wait().
    [[nodiscard]] std::size_t trackedCount() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace agw::foundation

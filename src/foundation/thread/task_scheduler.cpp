/// @file task_scheduler.cpp
/// @brief TaskScheduler on top of kcenon thread_system.

#include "agw/foundation/task_scheduler.hpp"

#include <kcenon/thread/core/job_builder.h>
#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>

#include <algorithm>
#include <atomic>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace agw::foundation {

static kcenon::thread::job_priority mapPriority(TaskPriority p) {
    switch (p) {
        case TaskPriority::Critical: return kcenon::thread::job_priority::highest;
        case TaskPriority::High:     return kcenon::thread::job_priority::high;
        case TaskPriority::Normal:   return kcenon::thread::job_priority::normal;
        case TaskPriority::Low:      return kcenon::thread::job_priority::low;
    }
    return kcenon::thread::job_priority::normal;
}

struct TaskScheduler::Impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::atomic<uint64_t> nextTaskId{1};

    std::unordered_map<TaskId, std::shared_future<void>> futures;
    std::unordered_map<TaskId, std::shared_ptr<std::atomic<bool>>> cancelFlags;

    mutable std::mutex mutex;

    std::optional<std::shared_future<void>> find(TaskId id) {
        std::lock_guard lock(mutex);
        auto it = futures.find(id);
        if (it == futures.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void forget(TaskId id) {
        std::lock_guard lock(mutex);
        futures.erase(id);
        cancelFlags.erase(id);
    }
};

TaskScheduler::TaskScheduler(std::size_t numThreads)
    : impl_(std::make_unique<Impl>())
{
    impl_->pool = std::make_shared<kcenon::thread::thread_pool>("agw_task_scheduler");

    std::vector<std::unique_ptr<kcenon::thread::thread_worker>> workers;
    auto count = std::max<std::size_t>(numThreads, 1);
    workers.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        workers.push_back(std::make_unique<kcenon::thread::thread_worker>());
    }
    impl_->pool->enqueue_batch(std::move(workers));
    impl_->pool->start();
}

TaskScheduler::~TaskScheduler() {
    if (impl_ && impl_->pool) {
        impl_->pool->stop(false);  // graceful: running tasks finish
    }
}

TaskScheduler::TaskScheduler(TaskScheduler&&) noexcept = default;
TaskScheduler& TaskScheduler::operator=(TaskScheduler&&) noexcept = default;

GatewayResult<TaskScheduler::TaskId> TaskScheduler::schedule(TaskFunc task, TaskPriority priority) {
    auto id = impl_->nextTaskId.fetch_add(1, std::memory_order_relaxed);
    auto cancelFlag = std::make_shared<std::atomic<bool>>(false);
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future().share();

    auto threadJob = kcenon::thread::job_builder()
        .name("agw_task_" + std::to_string(id))
        .priority(mapPriority(priority))
        .work([fn = std::move(task), cancelFlag, promise]() -> kcenon::common::VoidResult {
            try {
                if (!cancelFlag->load(std::memory_order_acquire)) {
                    fn();
                }
                promise->set_value();
            } catch (const std::exception&) {
                // Surfaced to the waiter as ThreadError.
                promise->set_exception(std::current_exception());
            }
            return kcenon::common::VoidResult::ok(std::monostate{});
        })
        .build();

    {
        std::lock_guard lock(impl_->mutex);
        impl_->futures[id] = future;
        impl_->cancelFlags[id] = cancelFlag;
    }

    auto enqResult = impl_->pool->enqueue(std::move(threadJob));
    if (enqResult.is_err()) {
        impl_->forget(id);
        return GatewayResult<TaskId>::err(
            GatewayError(ErrorCode::JobScheduleFailed, "failed to enqueue task"));
    }

    return GatewayResult<TaskId>::ok(id);
}

GatewayResult<void> TaskScheduler::wait(TaskId id) {
    auto future = impl_->find(id);
    if (!future) {
        return GatewayResult<void>::err(GatewayError(ErrorCode::JobNotFound, "task not found"));
    }

    try {
        future->get();
    } catch (const std::exception& e) {
        impl_->forget(id);
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::ThreadError, std::string("task failed: ") + e.what()));
    }

    impl_->forget(id);
    return GatewayResult<void>::ok();
}

GatewayResult<void> TaskScheduler::waitFor(TaskId id, std::chrono::milliseconds timeout) {
    auto future = impl_->find(id);
    if (!future) {
        return GatewayResult<void>::err(GatewayError(ErrorCode::JobNotFound, "task not found"));
    }
    if (future->wait_for(timeout) != std::future_status::ready) {
        // Still tracked so a later wait() can collect it.
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::JobTimeout, "task did not finish within deadline"));
    }
    return wait(id);
}

GatewayResult<void> TaskScheduler::cancel(TaskId id) {
    std::lock_guard lock(impl_->mutex);

    auto flagIt = impl_->cancelFlags.find(id);
    if (flagIt == impl_->cancelFlags.end()) {
        return GatewayResult<void>::err(GatewayError(ErrorCode::JobNotFound, "task not found"));
    }

    auto futIt = impl_->futures.find(id);
    if (futIt != impl_->futures.end() &&
        futIt->second.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::JobCancelled, "task already completed"));
    }

    flagIt->second->store(true, std::memory_order_release);
    return GatewayResult<void>::ok();
}

std::size_t TaskScheduler::trackedCount() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->futures.size();
}

}  // namespace agw::foundation

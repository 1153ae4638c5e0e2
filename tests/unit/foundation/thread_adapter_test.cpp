#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "agw/foundation/error_code.hpp"
#include "agw/foundation/sample_queue.hpp"
#include "agw/foundation/task_scheduler.hpp"

using namespace agw::foundation;
using namespace std::chrono_literals;

// ---------------------------------------------------------------------------
// ErrorCode: Thread subsystem lookup
// ---------------------------------------------------------------------------

TEST(ThreadErrorCodeTest, SubsystemLookup) {
    EXPECT_EQ(errorSubsystem(ErrorCode::ThreadError), "Thread");
    EXPECT_EQ(errorSubsystem(ErrorCode::JobScheduleFailed), "Thread");
    EXPECT_EQ(errorSubsystem(ErrorCode::JobNotFound), "Thread");
    EXPECT_EQ(errorSubsystem(ErrorCode::JobCancelled), "Thread");
    EXPECT_EQ(errorSubsystem(ErrorCode::JobTimeout), "Thread");
}

// ---------------------------------------------------------------------------
// TaskScheduler
// ---------------------------------------------------------------------------

TEST(TaskSchedulerTest, ScheduleAndWait) {
    TaskScheduler scheduler(2);
    std::atomic<bool> executed{false};

    auto id = scheduler.schedule([&] { executed.store(true); });
    ASSERT_TRUE(id.hasValue());

    auto done = scheduler.wait(id.value());
    EXPECT_TRUE(done.hasValue());
    EXPECT_TRUE(executed.load());
    EXPECT_EQ(scheduler.trackedCount(), 0u);
}

TEST(TaskSchedulerTest, ManyTasksAllRun) {
    TaskScheduler scheduler(4);
    std::atomic<int> count{0};

    std::vector<TaskScheduler::TaskId> ids;
    for (int i = 0; i < 64; ++i) {
        auto id = scheduler.schedule([&] { count.fetch_add(1); },
                                     i % 2 == 0 ? TaskPriority::High : TaskPriority::Low);
        ASSERT_TRUE(id.hasValue());
        ids.push_back(id.value());
    }
    for (auto id : ids) {
        EXPECT_TRUE(scheduler.wait(id).hasValue());
    }
    EXPECT_EQ(count.load(), 64);
}

TEST(TaskSchedulerTest, ThrowingTaskReportsThreadError) {
    TaskScheduler scheduler(1);
    auto id = scheduler.schedule([] { throw std::runtime_error("probe exploded"); });
    ASSERT_TRUE(id.hasValue());

    auto done = scheduler.wait(id.value());
    ASSERT_TRUE(done.hasError());
    EXPECT_EQ(done.error().code(), ErrorCode::ThreadError);
    EXPECT_NE(done.error().message().find("probe exploded"), std::string_view::npos);
}

TEST(TaskSchedulerTest, WaitUnknownTask) {
    TaskScheduler scheduler(1);
    auto done = scheduler.wait(999);
    ASSERT_TRUE(done.hasError());
    EXPECT_EQ(done.error().code(), ErrorCode::JobNotFound);
}

TEST(TaskSchedulerTest, WaitForTimesOutAndKeepsTracking) {
    TaskScheduler scheduler(1);
    std::atomic<bool> release{false};

    auto id = scheduler.schedule([&] {
        while (!release.load()) {
            std::this_thread::sleep_for(1ms);
        }
    });
    ASSERT_TRUE(id.hasValue());

    auto early = scheduler.waitFor(id.value(), 20ms);
    ASSERT_TRUE(early.hasError());
    EXPECT_EQ(early.error().code(), ErrorCode::JobTimeout);
    EXPECT_EQ(scheduler.trackedCount(), 1u);

    release.store(true);
    EXPECT_TRUE(scheduler.wait(id.value()).hasValue());
}

TEST(TaskSchedulerTest, CancelQueuedTaskSkipsWork) {
    TaskScheduler scheduler(1);
    std::atomic<bool> release{false};
    std::atomic<bool> secondRan{false};

    // Occupy the only worker so the second task stays queued.
    auto blocker = scheduler.schedule([&] {
        while (!release.load()) {
            std::this_thread::sleep_for(1ms);
        }
    });
    auto second = scheduler.schedule([&] { secondRan.store(true); });
    ASSERT_TRUE(blocker.hasValue());
    ASSERT_TRUE(second.hasValue());

    EXPECT_TRUE(scheduler.cancel(second.value()).hasValue());
    release.store(true);

    EXPECT_TRUE(scheduler.wait(blocker.value()).hasValue());
    EXPECT_TRUE(scheduler.wait(second.value()).hasValue());
    EXPECT_FALSE(secondRan.load());
}

TEST(TaskSchedulerTest, CancelCompletedTask) {
    TaskScheduler scheduler(1);
    auto id = scheduler.schedule([] {});
    ASSERT_TRUE(id.hasValue());
    ASSERT_TRUE(scheduler.waitFor(id.value(), 1000ms).hasValue());

    // wait() forgot the task.
    auto forgotten = scheduler.cancel(id.value());
    ASSERT_TRUE(forgotten.hasError());
    EXPECT_EQ(forgotten.error().code(), ErrorCode::JobNotFound);
}

TEST(TaskSchedulerTest, CancelFinishedButUncollectedTask) {
    TaskScheduler scheduler(1);
    std::atomic<bool> ran{false};
    auto id = scheduler.schedule([&] { ran.store(true); });
    ASSERT_TRUE(id.hasValue());

    while (!ran.load()) {
        std::this_thread::sleep_for(1ms);
    }
    // The promise is set right after the body returns.
    std::this_thread::sleep_for(20ms);

    auto result = scheduler.cancel(id.value());
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::JobCancelled);
    EXPECT_TRUE(scheduler.wait(id.value()).hasValue());
}

// ---------------------------------------------------------------------------
// SampleQueue
// ---------------------------------------------------------------------------

TEST(SampleQueueTest, FifoOrder) {
    SampleQueue<int> queue(8);
    EXPECT_TRUE(queue.push(1));
    EXPECT_TRUE(queue.push(2));
    EXPECT_EQ(queue.size(), 2u);

    EXPECT_EQ(queue.tryPop(), 1);
    EXPECT_EQ(queue.tryPop(), 2);
    EXPECT_FALSE(queue.tryPop().has_value());
}

TEST(SampleQueueTest, FullQueueDropsOldest) {
    SampleQueue<int> queue(2);
    queue.push(1);
    queue.push(2);
    queue.push(3);

    EXPECT_EQ(queue.size(), 2u);
    EXPECT_EQ(queue.dropped(), 1u);
    EXPECT_EQ(queue.tryPop(), 2);
    EXPECT_EQ(queue.tryPop(), 3);
}

TEST(SampleQueueTest, ClosedQueueRejectsPushButDrains) {
    SampleQueue<int> queue(4);
    queue.push(7);
    queue.close();

    EXPECT_TRUE(queue.closed());
    EXPECT_FALSE(queue.push(8));
    EXPECT_EQ(queue.popFor(10ms), 7);
    EXPECT_FALSE(queue.popFor(10ms).has_value());
}

TEST(SampleQueueTest, PopForTimesOutWhenEmpty) {
    SampleQueue<int> queue(4);
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(queue.popFor(20ms).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 15ms);
}

TEST(SampleQueueTest, CloseWakesBlockedConsumer) {
    SampleQueue<int> queue(4);
    std::atomic<bool> woke{false};

    std::thread consumer([&] {
        auto item = queue.popFor(5s);
        woke.store(!item.has_value());
    });
    std::this_thread::sleep_for(20ms);
    queue.close();
    consumer.join();

    EXPECT_TRUE(woke.load());
}

TEST(SampleQueueTest, ConcurrentProducers) {
    SampleQueue<int> queue(10000);
    std::vector<std::thread> producers;
    for (int t = 0; t < 4; ++t) {
        producers.emplace_back([&] {
            for (int i = 0; i < 500; ++i) {
                queue.push(i);
            }
        });
    }
    for (auto& p : producers) {
        p.join();
    }
    EXPECT_EQ(queue.size(), 2000u);
    EXPECT_EQ(queue.dropped(), 0u);
}

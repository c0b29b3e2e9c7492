#include "core/downloader/DownloadManager.hpp"
#include "support/EventRecorder.hpp"
#include "support/FakeTransferExecutor.hpp"
#include "support/ManualScheduler.hpp"
#include "support/MemoryTaskStore.hpp"
#include "support/TestTasks.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <optional>
#include <thread>

using namespace std::chrono_literals;
using namespace courier::core;
using namespace courier::core::downloader;
using courier::testing::EventRecorder;
using courier::testing::FakeTransferExecutor;
using courier::testing::ManualScheduler;
using courier::testing::MemoryTaskStore;
using courier::testing::makeTask;

class DownloadManagerTest : public ::testing::Test {
protected:
    DownloadManagerTest() {
        rebuild();
    }

    /**
     * Replace the manager, as a restarted process would. The store and
     * bus carry over; executor and scheduler are fresh.
     */
    void rebuild(std::optional<size_t> finishedHistory = std::nullopt) {
        manager.reset();
        executor = std::make_shared<FakeTransferExecutor>();
        scheduler = std::make_shared<ManualScheduler>();

        RetryTiming timing;
        timing.jitter = 0.0;

        ManagerDependencies deps;
        deps.executor = executor;
        deps.scheduler = scheduler;
        deps.ids = std::make_shared<SequentialIdGenerator>("id_");
        deps.store = store;
        deps.bus = bus;
        deps.backoff = std::make_shared<BackoffPolicy>(timing, 11u);
        deps.finishedHistory = finishedHistory;
        manager = std::make_unique<DownloadManager>(std::move(deps));
    }

    std::shared_ptr<TaskEventBus> bus = std::make_shared<TaskEventBus>(2);
    std::shared_ptr<FakeTransferExecutor> executor;
    std::shared_ptr<ManualScheduler> scheduler;
    std::shared_ptr<MemoryTaskStore> store = std::make_shared<MemoryTaskStore>();
    std::unique_ptr<DownloadManager> manager;
};

TEST_F(DownloadManagerTest, RequiresExecutor) {
    ManagerDependencies empty;
    EXPECT_THROW(DownloadManager{std::move(empty)}, std::invalid_argument);
}

TEST_F(DownloadManagerTest, RegistersAsListener) {
    EXPECT_TRUE(executor->hasListener());
}

TEST_F(DownloadManagerTest, CreateTaskGeneratesNames) {
    TaskParams params;
    params.url = "https://example.com/file";
    auto task = manager->createTask(params);

    EXPECT_EQ(task.taskId(), "id_1");
    EXPECT_EQ(task.filename(), "id_2");
    EXPECT_FALSE(manager->status(task.taskId()));
}

TEST_F(DownloadManagerTest, RoutesReportsToTheTask) {
    auto task = makeTask("t");
    ASSERT_TRUE(manager->enqueue(task));
    EXPECT_EQ(executor->submitCount("t"), 1u);
    EXPECT_EQ(manager->status("t"), DownloadTaskStatus::Enqueued);

    executor->reportStatus("t", DownloadTaskStatus::Running);
    EXPECT_EQ(manager->status("t"), DownloadTaskStatus::Running);

    executor->reportStatusCode("t", toCode(DownloadTaskStatus::Complete));
    EXPECT_EQ(manager->status("t"), DownloadTaskStatus::Complete);
    EXPECT_EQ(manager->activeCount(), 0u);
    EXPECT_TRUE(manager->waitForAll(0ms));
    ASSERT_TRUE(manager->taskFor("t"));
    EXPECT_EQ(manager->droppedEventCount(), 0u);
}

TEST_F(DownloadManagerTest, RejectsDuplicateActiveTask) {
    ASSERT_TRUE(manager->enqueue(makeTask("t")));
    EXPECT_FALSE(manager->enqueue(makeTask("t")));
    EXPECT_EQ(executor->submitCount("t"), 1u);

    executor->reportStatus("t", DownloadTaskStatus::Complete);
    EXPECT_TRUE(manager->enqueue(makeTask("t")));
    EXPECT_EQ(manager->status("t"), DownloadTaskStatus::Enqueued);
}

TEST_F(DownloadManagerTest, CountsDroppedReports) {
    executor->reportStatus("ghost", DownloadTaskStatus::Running);
    executor->reportProgress("ghost", 0.5);
    EXPECT_EQ(manager->droppedEventCount(), 2u);

    manager->enqueue(makeTask("t"));
    executor->reportStatusCode("t", 99);
    EXPECT_EQ(manager->droppedEventCount(), 3u);

    executor->reportStatus("t", DownloadTaskStatus::WaitingToRetry);
    EXPECT_EQ(manager->droppedEventCount(), 4u);

    executor->reportStatus("t", DownloadTaskStatus::Complete);
    executor->reportProgress("t", 0.9);
    EXPECT_EQ(manager->droppedEventCount(), 5u);
    EXPECT_EQ(manager->status("t"), DownloadTaskStatus::Complete);
}

TEST_F(DownloadManagerTest, RetriesThroughScheduler) {
    manager->enqueue(makeTask("t", ProgressUpdatePolicy::StatusOnly, 1));
    executor->reportStatus("t", DownloadTaskStatus::Failed);
    EXPECT_EQ(manager->status("t"), DownloadTaskStatus::WaitingToRetry);

    ASSERT_TRUE(scheduler->fireNext());
    EXPECT_EQ(executor->submitCount("t"), 2u);
    EXPECT_EQ(manager->taskFor("t")->retriesRemaining(), 0);

    executor->reportStatus("t", DownloadTaskStatus::Failed);
    EXPECT_EQ(manager->status("t"), DownloadTaskStatus::Failed);
}

TEST_F(DownloadManagerTest, BatchTalliesOutcomes) {
    std::vector<Task> tasks{makeTask("a"), makeTask("b"), makeTask("c")};
    auto batch = manager->enqueueBatch(tasks);

    executor->reportStatus("a", DownloadTaskStatus::Complete);
    executor->reportStatus("b", DownloadTaskStatus::NotFound);
    executor->reportStatus("c", DownloadTaskStatus::Complete);

    ASSERT_TRUE(batch->waitUntilResolved(2s));
    EXPECT_EQ(batch->numSucceeded(), 2u);
    EXPECT_EQ(batch->numFailed(), 1u);
    ASSERT_EQ(batch->failed().size(), 1u);
    EXPECT_EQ(batch->failed()[0].taskId(), "b");
}

TEST_F(DownloadManagerTest, BatchUpgradesSilentTasks) {
    auto batch = manager->enqueueBatch({makeTask("quiet", ProgressUpdatePolicy::None)});
    EXPECT_EQ(manager->taskFor("quiet")->progressUpdates(), ProgressUpdatePolicy::StatusOnly);

    executor->reportStatus("quiet", DownloadTaskStatus::Complete);
    ASSERT_TRUE(batch->waitUntilResolved(2s));
    EXPECT_EQ(batch->numSucceeded(), 1u);
}

TEST_F(DownloadManagerTest, CancelAndCancelAll) {
    EXPECT_FALSE(manager->cancel("ghost"));

    for (const char* id : {"a", "b", "c"}) {
        manager->enqueue(makeTask(id));
    }
    EXPECT_TRUE(manager->cancel("a"));
    EXPECT_FALSE(manager->cancel("a"));

    EXPECT_EQ(manager->cancelAll(), 2u);
    EXPECT_EQ(manager->activeCount(), 0u);
    EXPECT_EQ(executor->canceled().size(), 3u);
    EXPECT_EQ(manager->status("b"), DownloadTaskStatus::Canceled);
    EXPECT_EQ(store->size(), 0u);
}

TEST_F(DownloadManagerTest, PauseAndResumeById) {
    EXPECT_THROW(manager->pause("ghost"), TaskControlError);
    EXPECT_THROW(manager->resume("ghost"), TaskControlError);

    manager->enqueue(makeTask("t"));
    executor->reportStatus("t", DownloadTaskStatus::Running);

    EXPECT_TRUE(manager->pause("t"));
    EXPECT_THROW(manager->pause("t"), TaskControlError);
    EXPECT_TRUE(manager->resume("t"));
    EXPECT_EQ(manager->status("t"), DownloadTaskStatus::Running);
}

TEST_F(DownloadManagerTest, RestoresPersistedTasks) {
    store->save(makeTask("saved", ProgressUpdatePolicy::StatusOnly, 3).withRetryConsumed());

    EXPECT_EQ(manager->restoreFromStore(), 1u);
    ASSERT_EQ(executor->submitted().size(), 1u);
    EXPECT_EQ(executor->submitted()[0].retriesRemaining(), 2);
    EXPECT_EQ(manager->status("saved"), DownloadTaskStatus::Enqueued);

    EXPECT_EQ(manager->restoreFromStore(), 0u);
}

TEST_F(DownloadManagerTest, ShutdownKeepsRecords) {
    EventRecorder recorder(bus);
    manager->enqueue(makeTask("t"));
    manager->shutdown();

    EXPECT_FALSE(executor->hasListener());
    EXPECT_TRUE(scheduler->isStopped());
    EXPECT_EQ(executor->canceled(), std::vector<std::string>{"t"});
    EXPECT_EQ(store->size(), 1u);
    EXPECT_EQ(manager->activeCount(), 0u);
    EXPECT_FALSE(manager->enqueue(makeTask("u")));
    EXPECT_EQ(recorder.count(), 0u);
}

TEST_F(DownloadManagerTest, ShutdownDropsPendingRetry) {
    manager->enqueue(makeTask("t", ProgressUpdatePolicy::StatusOnly, 2));
    executor->reportStatus("t", DownloadTaskStatus::Failed);
    ASSERT_EQ(scheduler->pendingCount(), 1u);

    manager->shutdown();
    EXPECT_EQ(scheduler->pendingCount(), 0u);
    EXPECT_FALSE(scheduler->fireNext());
    EXPECT_EQ(executor->submitCount("t"), 1u);
    ASSERT_TRUE(store->find("t"));
}

TEST_F(DownloadManagerTest, RestoredTaskKeepsItsRetryBound) {
    manager->enqueue(makeTask("t", ProgressUpdatePolicy::StatusOnly, 1));
    executor->reportStatus("t", DownloadTaskStatus::Failed);
    ASSERT_EQ(manager->status("t"), DownloadTaskStatus::WaitingToRetry);

    rebuild();
    EXPECT_EQ(manager->restoreFromStore(), 1u);
    ASSERT_EQ(executor->submitted().size(), 1u);
    EXPECT_EQ(executor->submitted()[0].retriesRemaining(), 0);

    executor->reportStatus("t", DownloadTaskStatus::Failed);
    EXPECT_EQ(manager->status("t"), DownloadTaskStatus::Failed);
    EXPECT_EQ(scheduler->pendingCount(), 0u);
    EXPECT_EQ(store->size(), 0u);
}

TEST_F(DownloadManagerTest, FinishedHistoryIsBounded) {
    rebuild(2);

    for (const char* id : {"a", "b", "c"}) {
        manager->enqueue(makeTask(id));
        executor->reportStatus(id, DownloadTaskStatus::Complete);
    }

    EXPECT_EQ(manager->finishedCount(), 2u);
    EXPECT_FALSE(manager->status("a"));
    EXPECT_EQ(manager->status("b"), DownloadTaskStatus::Complete);
    EXPECT_EQ(manager->status("c"), DownloadTaskStatus::Complete);

    // A re-run moves the task to the newest end
    manager->enqueue(makeTask("b"));
    executor->reportStatus("b", DownloadTaskStatus::NotFound);
    manager->enqueue(makeTask("d"));
    executor->reportStatus("d", DownloadTaskStatus::Complete);

    EXPECT_FALSE(manager->status("c"));
    EXPECT_EQ(manager->status("b"), DownloadTaskStatus::NotFound);
    EXPECT_EQ(manager->finishedCount(), 2u);
}

TEST_F(DownloadManagerTest, ZeroHistoryKeepsNothing) {
    rebuild(0);
    manager->enqueue(makeTask("t"));
    executor->reportStatus("t", DownloadTaskStatus::Complete);

    EXPECT_EQ(manager->finishedCount(), 0u);
    EXPECT_FALSE(manager->status("t"));
}

TEST_F(DownloadManagerTest, ForgetAndClearFinished) {
    for (const char* id : {"a", "b", "c"}) {
        manager->enqueue(makeTask(id));
    }
    executor->reportStatus("a", DownloadTaskStatus::Complete);
    executor->reportStatus("b", DownloadTaskStatus::Complete);

    EXPECT_TRUE(manager->forget("a"));
    EXPECT_FALSE(manager->forget("a"));
    EXPECT_FALSE(manager->forget("c"));
    EXPECT_FALSE(manager->status("a"));
    EXPECT_EQ(manager->status("c"), DownloadTaskStatus::Enqueued);

    manager->clearFinished();
    EXPECT_EQ(manager->finishedCount(), 0u);
    EXPECT_FALSE(manager->status("b"));
    EXPECT_EQ(manager->activeCount(), 1u);
}

namespace {

/**
 * Executor whose resubmits block until the test releases them
 */
class GatedExecutor : public FakeTransferExecutor {
public:
    void submit(const Task& task) override {
        FakeTransferExecutor::submit(task);
        if (submitCount(task.taskId()) == 2) {
            entered.set_value();
            release.wait();
        }
    }

    std::promise<void> entered;
    std::shared_future<void> release;
};

} // namespace

TEST(DownloadManagerShutdownTest, WaitsForRetryInFlight) {
    RetryTiming timing;
    timing.baseDelay = 1ms;
    timing.jitter = 0.0;

    auto executor = std::make_shared<GatedExecutor>();
    auto store = std::make_shared<MemoryTaskStore>();
    std::promise<void> release;
    executor->release = release.get_future().share();
    auto entered = executor->entered.get_future();

    ManagerDependencies deps;
    deps.executor = executor;
    deps.scheduler = std::make_shared<TimerQueue>();
    deps.store = store;
    deps.bus = std::make_shared<TaskEventBus>(1);
    deps.backoff = std::make_shared<BackoffPolicy>(timing, 3u);
    auto manager = std::make_unique<DownloadManager>(std::move(deps));

    manager->enqueue(makeTask("t", ProgressUpdatePolicy::StatusOnly, 1));
    executor->reportStatus("t", DownloadTaskStatus::Failed);
    ASSERT_EQ(entered.wait_for(5s), std::future_status::ready);

    std::atomic<bool> destroyed{false};
    std::thread destroyer([&] {
        manager.reset();
        destroyed = true;
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(destroyed.load());
    EXPECT_TRUE(executor->canceled().empty());

    release.set_value();
    destroyer.join();

    EXPECT_TRUE(destroyed.load());
    EXPECT_EQ(executor->submitCount("t"), 2u);
    EXPECT_EQ(executor->canceled(), std::vector<std::string>{"t"});
    EXPECT_FALSE(executor->hasListener());
    ASSERT_TRUE(store->find("t"));
    EXPECT_EQ(store->find("t")->retriesRemaining(), 0);
}

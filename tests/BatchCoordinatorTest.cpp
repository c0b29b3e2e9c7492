#include "core/downloader/BatchCoordinator.hpp"
#include "support/TestTasks.hpp"

#include <gtest/gtest.h>

#include <mutex>
#include <utility>

using namespace std::chrono_literals;
using namespace courier::core::downloader;
using courier::testing::makeTask;

class BatchCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        tasks = {makeTask("one"), makeTask("two"), makeTask("three")};
        batch = BatchCoordinator::create(tasks, [this](size_t succeeded, size_t failed) {
            std::lock_guard<std::mutex> lock(mutex);
            tallies.emplace_back(succeeded, failed);
        });
        batch->attach(bus);
    }

    std::vector<std::pair<size_t, size_t>> recordedTallies() {
        std::lock_guard<std::mutex> lock(mutex);
        return tallies;
    }

    std::shared_ptr<TaskEventBus> bus = std::make_shared<TaskEventBus>(2);
    std::vector<Task> tasks;
    std::mutex mutex;
    std::vector<std::pair<size_t, size_t>> tallies;
    BatchPtr batch;
};

TEST_F(BatchCoordinatorTest, TwoCompleteOneNotFound) {
    bus->publish(StatusEvent{tasks[0], DownloadTaskStatus::Complete});
    bus->publish(StatusEvent{tasks[1], DownloadTaskStatus::NotFound});
    bus->publish(StatusEvent{tasks[2], DownloadTaskStatus::Complete});

    ASSERT_TRUE(batch->waitUntilResolved(2s));
    EXPECT_EQ(batch->numSucceeded(), 2u);
    EXPECT_EQ(batch->numFailed(), 1u);

    auto failed = batch->failed();
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_EQ(failed[0].taskId(), "two");
    EXPECT_EQ(batch->results().at(tasks[1]), DownloadTaskStatus::NotFound);

    bus->waitIdle();
    auto seen = recordedTallies();
    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen.back(), std::make_pair(size_t{2}, size_t{1}));
    for (size_t i = 0; i < seen.size(); ++i) {
        EXPECT_EQ(seen[i].first + seen[i].second, i + 1);
    }
}

TEST_F(BatchCoordinatorTest, IgnoresNonFinalAndDuplicateStatuses) {
    bus->publish(StatusEvent{tasks[0], DownloadTaskStatus::Running});
    bus->publish(StatusEvent{tasks[0], DownloadTaskStatus::WaitingToRetry});
    bus->publish(StatusEvent{tasks[0], DownloadTaskStatus::Failed});
    bus->publish(StatusEvent{tasks[0], DownloadTaskStatus::Complete});
    bus->waitIdle();

    EXPECT_EQ(batch->numSucceeded(), 0u);
    EXPECT_EQ(batch->numFailed(), 1u);
    EXPECT_FALSE(batch->isResolved());
    EXPECT_EQ(recordedTallies().size(), 1u);
}

TEST_F(BatchCoordinatorTest, CountsTerminalProgressSentinels) {
    bus->publish(ProgressEvent(tasks[0], 0.5));
    bus->publish(ProgressEvent(tasks[0], kProgressComplete));
    bus->publish(ProgressEvent(tasks[1], kProgressCanceled));
    bus->publish(ProgressEvent(tasks[2], kProgressWaitingToRetry));
    bus->waitIdle();

    EXPECT_EQ(batch->numSucceeded(), 1u);
    EXPECT_EQ(batch->numFailed(), 1u);
    EXPECT_FALSE(batch->isResolved());
}

TEST_F(BatchCoordinatorTest, IgnoresTasksOutsideTheBatch) {
    EXPECT_FALSE(batch->record(makeTask("stranger"), DownloadTaskStatus::Complete));
    bus->publish(StatusEvent{makeTask("stranger"), DownloadTaskStatus::Complete});
    bus->waitIdle();
    EXPECT_EQ(batch->results().size(), 0u);
}

TEST_F(BatchCoordinatorTest, WaitTimesOutWhileUnresolved) {
    EXPECT_FALSE(batch->waitUntilResolved(20ms));
}

TEST_F(BatchCoordinatorTest, DetachStopsCounting) {
    batch->detach();
    bus->publish(StatusEvent{tasks[0], DownloadTaskStatus::Complete});
    bus->waitIdle();
    EXPECT_EQ(batch->numSucceeded(), 0u);
}

TEST(BatchCoordinatorEmptyTest, EmptyBatchIsResolved) {
    auto batch = BatchCoordinator::create({});
    EXPECT_TRUE(batch->isResolved());
    EXPECT_TRUE(batch->waitUntilResolved(0ms));
}

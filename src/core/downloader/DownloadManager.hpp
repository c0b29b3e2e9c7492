#pragma once

/**
 * DownloadManager.hpp
 *
 * Entry point for background transfers: creates tasks, drives one state
 * machine per task and routes executor reports to them.
 */

#include "BackoffPolicy.hpp"
#include "BatchCoordinator.hpp"
#include "Task.hpp"
#include "TaskEventBus.hpp"
#include "TaskStateMachine.hpp"
#include "TaskStore.hpp"
#include "TransferExecutor.hpp"
#include "../IdGenerator.hpp"
#include "../TimerQueue.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace courier::core::downloader {

/**
 * Collaborators of a DownloadManager. Only the executor is required; the
 * others default to a TimerQueue, a RandomIdGenerator, a bus sized by
 * events.dispatchThreads and a BackoffPolicy built from the retry.* keys.
 * Without a store nothing is persisted. finishedHistory defaults to
 * history.finishedTasks.
 */
struct ManagerDependencies {
    std::shared_ptr<TransferExecutor> executor;
    std::shared_ptr<DelayScheduler> scheduler;
    std::shared_ptr<IdGenerator> ids;
    std::shared_ptr<TaskStore> store;
    std::shared_ptr<TaskEventBus> bus;
    std::shared_ptr<BackoffPolicy> backoff;
    std::optional<size_t> finishedHistory;
};

/**
 * DownloadManager - task registry and executor listener
 *
 * Features:
 * - One TaskStateMachine per active task
 * - Batches with aggregated results
 * - Cancel, pause and resume by task id
 * - Persisted records, restored with restoreFromStore()
 * - Reports for unknown or finished tasks are dropped and counted
 */
class DownloadManager : public TransferListener {
public:
    /**
     * Constructor
     * @param deps Collaborators; executor must be set
     */
    explicit DownloadManager(ManagerDependencies deps);

    /**
     * Destructor - calls shutdown()
     */
    ~DownloadManager() override;

    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    /**
     * Build a task, generating any missing id or filename
     * @throws ValidationError on invalid parameters
     */
    Task createTask(const TaskParams& params);

    /**
     * Start a task
     * @param task Task to run
     * @return false if a task with the same id is already active
     */
    bool enqueue(const Task& task);

    /**
     * Start a group of tasks and track their outcomes together. Tasks with
     * the none policy are upgraded to statusOnly so the batch can observe
     * them.
     * @param tasks Tasks to run
     * @param callback Called with (succeeded, failed) after each result
     * @return The batch, already listening
     */
    BatchPtr enqueueBatch(const std::vector<Task>& tasks,
                          BatchCoordinator::ProgressCallback callback = nullptr);

    /**
     * Cancel a task
     * @return true if the task was active and is now canceled
     */
    bool cancel(const std::string& taskId);

    /**
     * Cancel every active task
     * @return Number of tasks canceled
     */
    size_t cancelAll();

    /**
     * Pause a running task
     * @return true once paused
     * @throws TaskControlError if the task is unknown, not running or not pausable
     */
    bool pause(const std::string& taskId);

    /**
     * Resume a paused task
     * @return true once resumed
     * @throws TaskControlError if the task is unknown or not paused
     */
    bool resume(const std::string& taskId);

    /**
     * Current status of an active task, or final status of a finished one
     */
    std::optional<DownloadTaskStatus> status(const std::string& taskId) const;

    /**
     * Latest copy of a task (retry counter included)
     */
    std::optional<Task> taskFor(const std::string& taskId) const;

    /**
     * Drop a finished task from the history
     * @return false if the task is unknown or still active
     */
    bool forget(const std::string& taskId);

    void clearFinished();

    size_t activeCount() const;
    size_t finishedCount() const;
    uint64_t droppedEventCount() const { return m_droppedEvents.load(); }

    /**
     * Re-enqueue every persisted task that is not already active
     * @return Number of tasks restored
     */
    size_t restoreFromStore();

    /**
     * Block until no task is active
     * @return false on timeout
     */
    bool waitForAll(std::chrono::milliseconds timeout);

    SubscriptionPtr subscribe(SubscriptionFilter filter, TaskEventCallback callback);
    void unsubscribe(const SubscriptionPtr& subscription);

    TaskEventBus& getEventBus() { return *m_context->bus; }

    /**
     * Stop every transfer without finishing its task. Records stay in the
     * store so the tasks can be restored later. The scheduler is stopped
     * too; a retry callback already running is waited for.
     */
    void shutdown();

    // TransferListener
    void onStatus(const std::string& taskId, DownloadTaskStatus status) override;
    void onStatusCode(const std::string& taskId, int statusCode) override;
    void onProgress(const std::string& taskId, double progress) override;

private:
    using MachinePtr = std::shared_ptr<TaskStateMachine>;

    struct FinishedTask {
        Task task;
        DownloadTaskStatus status;
    };

    MachinePtr find(const std::string& taskId) const;
    MachinePtr findForControl(const std::string& taskId) const;
    void onRetired(const Task& task, DownloadTaskStatus status);
    void rememberLocked(const Task& task, DownloadTaskStatus status);
    void countDropped(const std::string& taskId, const char* what);

    std::shared_ptr<TaskContext> m_context;
    std::shared_ptr<IdGenerator> m_ids;

    mutable std::mutex m_mutex;
    std::condition_variable m_idleCondition;
    std::unordered_map<std::string, MachinePtr> m_active;
    std::unordered_map<std::string, FinishedTask> m_finished;
    std::deque<std::string> m_finishedOrder;
    const size_t m_finishedLimit;

    std::atomic<uint64_t> m_droppedEvents{0};
    std::atomic<bool> m_running{true};
};

} // namespace courier::core::downloader

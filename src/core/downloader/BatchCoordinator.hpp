#pragma once

/**
 * BatchCoordinator.hpp
 *
 * Aggregates the outcomes of a group of tasks.
 */

#include "Task.hpp"
#include "TaskEvent.hpp"
#include "TaskEventBus.hpp"
#include "TaskStatus.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace courier::core::downloader {

/**
 * BatchCoordinator - tallies final statuses for a fixed set of tasks
 *
 * The first final status seen for a task is its result; later ones are
 * ignored. Succeeded means complete, every other final status counts as
 * failed. The callback runs after each recorded result, never concurrently
 * with itself.
 */
class BatchCoordinator : public std::enable_shared_from_this<BatchCoordinator> {
public:
    using ProgressCallback = std::function<void(size_t succeeded, size_t failed)>;

    /**
     * Create a coordinator. Use create(); attach() needs a shared owner.
     */
    BatchCoordinator(std::vector<Task> tasks, ProgressCallback callback);
    ~BatchCoordinator();

    BatchCoordinator(const BatchCoordinator&) = delete;
    BatchCoordinator& operator=(const BatchCoordinator&) = delete;

    static std::shared_ptr<BatchCoordinator> create(std::vector<Task> tasks,
                                                    ProgressCallback callback = nullptr);

    /**
     * Start listening for the batch's events
     * @param bus Bus the tasks publish on
     */
    void attach(const std::shared_ptr<TaskEventBus>& bus);

    /**
     * Stop listening. Results recorded so far are kept.
     */
    void detach();

    /**
     * Record a result directly
     * @return true if this was the first final status for a task of the batch
     */
    bool record(const Task& task, DownloadTaskStatus status);

    size_t numSucceeded() const;
    size_t numFailed() const;
    std::vector<Task> succeeded() const;
    std::vector<Task> failed() const;
    std::unordered_map<Task, DownloadTaskStatus> results() const;

    /**
     * @return true once every task has a result
     */
    bool isResolved() const;

    /**
     * Block until resolved
     * @return false on timeout
     */
    bool waitUntilResolved(std::chrono::milliseconds timeout);

    const std::vector<Task>& tasks() const { return m_tasks; }

private:
    void onEvent(const TaskEvent& event);
    bool isResolvedLocked() const { return m_results.size() >= m_taskIds.size(); }

    const std::vector<Task> m_tasks;
    const std::unordered_set<std::string> m_taskIds;
    ProgressCallback m_callback;

    mutable std::mutex m_mutex;
    std::condition_variable m_resolvedCondition;
    std::unordered_map<Task, DownloadTaskStatus> m_results;
    std::vector<Task> m_succeeded;
    std::vector<Task> m_failed;

    std::mutex m_callbackMutex;

    std::mutex m_attachMutex;
    std::weak_ptr<TaskEventBus> m_bus;
    SubscriptionPtr m_subscription;
};

using BatchPtr = std::shared_ptr<BatchCoordinator>;

} // namespace courier::core::downloader

#pragma once

/**
 * TaskStateMachine.hpp
 *
 * Per-task authority over status, legal transitions and retry scheduling.
 */

#include "BackoffPolicy.hpp"
#include "Task.hpp"
#include "TaskEventBus.hpp"
#include "TaskStatus.hpp"
#include "TaskStore.hpp"
#include "TransferExecutor.hpp"
#include "../TimerQueue.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

namespace courier::core::downloader {

/**
 * Thrown for a pause or resume that is not legal in the task's state
 */
class TaskControlError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/**
 * Collaborators shared by every state machine of one DownloadManager.
 * store may be null (no persistence).
 */
struct TaskContext {
    std::shared_ptr<TaskEventBus> bus;
    std::shared_ptr<TransferExecutor> executor;
    std::shared_ptr<DelayScheduler> scheduler;
    std::shared_ptr<BackoffPolicy> backoff;
    std::shared_ptr<TaskStore> store;
};

/**
 * TaskStateMachine - lifecycle of one task
 *
 *   [enqueued] -> running -> complete | notFound | failed | canceled
 *   enqueued | running -> waitingToRetry  (failed with retries remaining)
 *   waitingToRetry -> enqueued            (backoff elapsed, one retry consumed)
 *   any non-final -> canceled             (cancel())
 *   running <-> paused                    (pause()/resume())
 *
 * All transitions of one machine are serialized by its own mutex. Events
 * are published while that mutex is held, which fixes their order; the
 * executor and the retirement callback are only called with it released.
 * Once final, the machine is retired and drops every further report.
 */
class TaskStateMachine : public std::enable_shared_from_this<TaskStateMachine> {
public:
    using RetiredCallback = std::function<void(const Task& task, DownloadTaskStatus status)>;

    TaskStateMachine(Task task, std::shared_ptr<TaskContext> context, RetiredCallback onRetired = nullptr);
    ~TaskStateMachine();

    TaskStateMachine(const TaskStateMachine&) = delete;
    TaskStateMachine& operator=(const TaskStateMachine&) = delete;

    /**
     * Persist the task and hand it to the executor. Call once.
     */
    void start();

    /**
     * Apply a status reported by the executor
     * @return false if the report was dropped (retired task or illegal transition)
     */
    bool handleStatus(DownloadTaskStatus status);

    /**
     * Apply a progress report: a fraction in [0,1) or a sentinel
     * @return false if the report was dropped
     */
    bool handleProgress(double progress);

    /**
     * Cancel from any non-final state. Idempotent.
     * @return true if this call canceled the task
     */
    bool cancel();

    /**
     * Pause a running task
     * @return true once paused; false if the executor did not acknowledge
     * @throws TaskControlError if not running or the executor cannot pause it
     */
    bool pause();

    /**
     * Resume a paused task
     * @return true once resumed; false if the executor did not acknowledge
     * @throws TaskControlError if the task is not paused
     */
    bool resume();

    /**
     * Detach from the owner without finishing the task: the retry timer is
     * canceled, no later retry resubmits, and the retirement callback is
     * never called again. Waits for a retirement callback that is running.
     */
    void abandon();

    DownloadTaskStatus status() const;
    bool isPaused() const;
    bool isRetired() const;
    Task task() const;
    const std::string& taskId() const { return m_taskId; }
    double lastProgress() const;
    bool hasPendingRetry() const;

private:
    struct Effects {
        bool submit{false};
        bool cancelTransfer{false};
        bool retired{false};
    };

    bool applyStatusLocked(DownloadTaskStatus status, Effects& effects);
    void finishLocked(DownloadTaskStatus status, Effects& effects);
    void enterWaitingToRetryLocked();
    void retryTimerFired(uint64_t generation);

    void emitStatusLocked(DownloadTaskStatus status);
    void emitProgressLocked(double progress);
    void persistLocked();

    void dropLocked(const char* what, const std::string& detail) const;
    void runEffects(const Effects& effects, const Task& task, DownloadTaskStatus status);

    const std::string m_taskId;
    std::shared_ptr<TaskContext> m_context;
    RetiredCallback m_onRetired;

    std::mutex m_retireMutex;
    bool m_detached{false};

    mutable std::mutex m_mutex;
    bool m_abandoned{false};
    Task m_task;
    DownloadTaskStatus m_status{DownloadTaskStatus::Enqueued};
    bool m_paused{false};
    bool m_started{false};
    double m_lastProgress{0.0};
    TimerHandle m_retryTimer;
    uint64_t m_retryGeneration{0};
};

} // namespace courier::core::downloader

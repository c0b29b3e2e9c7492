/**
 * TaskStateMachine.cpp
 *
 * Transition rules, retry scheduling and event emission for one task.
 */

#include "TaskStateMachine.hpp"
#include "../Logger.hpp"

#include <optional>

namespace courier::core::downloader {

TaskStateMachine::TaskStateMachine(Task task, std::shared_ptr<TaskContext> context, RetiredCallback onRetired)
    : m_taskId(task.taskId())
    , m_context(std::move(context))
    , m_onRetired(std::move(onRetired))
    , m_task(std::move(task)) {
    if (!m_context || !m_context->bus || !m_context->executor || !m_context->scheduler || !m_context->backoff) {
        throw std::invalid_argument("TaskStateMachine requires bus, executor, scheduler and backoff");
    }
}

TaskStateMachine::~TaskStateMachine() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_retryTimer.valid()) {
        m_context->scheduler->cancel(m_retryTimer);
    }
}

void TaskStateMachine::start() {
    std::optional<Task> snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_started) {
            throw std::logic_error("Task " + m_taskId + " already started");
        }
        m_started = true;
        persistLocked();
        snapshot = m_task;
    }

    COURIER_LOG_DEBUG("Enqueued {}", snapshot->describe());

    try {
        m_context->executor->submit(*snapshot);
    } catch (const std::exception& e) {
        COURIER_LOG_ERROR("Executor rejected task {}: {}", m_taskId, e.what());
        handleStatus(DownloadTaskStatus::Failed);
    }
}

bool TaskStateMachine::handleStatus(DownloadTaskStatus status) {
    Effects effects;
    std::optional<Task> snapshot;
    DownloadTaskStatus current;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!applyStatusLocked(status, effects)) {
            return false;
        }
        snapshot = m_task;
        current = m_status;
    }
    runEffects(effects, *snapshot, current);
    return true;
}

bool TaskStateMachine::handleProgress(double progress) {
    Effects effects;
    std::optional<Task> snapshot;
    DownloadTaskStatus current;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (isFinalState(m_status)) {
            dropLocked("progress", std::to_string(progress));
            return false;
        }

        if (isFractionalProgress(progress)) {
            if (m_status == DownloadTaskStatus::WaitingToRetry) {
                dropLocked("progress while waiting to retry", std::to_string(progress));
                return false;
            }
            if (m_status == DownloadTaskStatus::Enqueued) {
                m_status = DownloadTaskStatus::Running;
                emitStatusLocked(DownloadTaskStatus::Running);
            } else if (m_paused) {
                // Transfer resumed without resume(); report it the same way
                emitStatusLocked(DownloadTaskStatus::Running);
            }
            m_paused = false;
            m_lastProgress = progress;
            emitProgressLocked(progress);
            return true;
        }

        if (isPausedProgress(progress)) {
            if (m_status != DownloadTaskStatus::Running) {
                dropLocked("paused marker outside running", std::to_string(progress));
                return false;
            }
            if (!m_paused) {
                m_paused = true;
                emitProgressLocked(kProgressPaused);
            }
            return true;
        }

        auto status = statusForProgress(progress);
        if (!status || *status == DownloadTaskStatus::WaitingToRetry) {
            dropLocked("progress value", std::to_string(progress));
            return false;
        }
        if (!applyStatusLocked(*status, effects)) {
            return false;
        }
        snapshot = m_task;
        current = m_status;
    }
    runEffects(effects, *snapshot, current);
    return true;
}

bool TaskStateMachine::applyStatusLocked(DownloadTaskStatus status, Effects& effects) {
    if (isFinalState(m_status)) {
        dropLocked("status", toString(status));
        return false;
    }

    switch (status) {
        case DownloadTaskStatus::Enqueued:
            // Executors may acknowledge a submit; nothing changes
            if (m_status == DownloadTaskStatus::Enqueued) {
                return true;
            }
            dropLocked("status", toString(status));
            return false;

        case DownloadTaskStatus::Running:
            if (m_status == DownloadTaskStatus::Enqueued) {
                m_status = DownloadTaskStatus::Running;
                emitStatusLocked(DownloadTaskStatus::Running);
                return true;
            }
            if (m_status == DownloadTaskStatus::Running) {
                m_paused = false;
                return true;
            }
            dropLocked("status", toString(status));
            return false;

        case DownloadTaskStatus::Failed:
            if (m_status == DownloadTaskStatus::WaitingToRetry) {
                dropLocked("status", toString(status));
                return false;
            }
            if (m_task.retriesRemaining() > 0) {
                enterWaitingToRetryLocked();
                return true;
            }
            finishLocked(DownloadTaskStatus::Failed, effects);
            return true;

        case DownloadTaskStatus::Complete:
        case DownloadTaskStatus::NotFound:
        case DownloadTaskStatus::Canceled:
            if (m_status == DownloadTaskStatus::WaitingToRetry) {
                dropLocked("status", toString(status));
                return false;
            }
            finishLocked(status, effects);
            return true;

        case DownloadTaskStatus::WaitingToRetry:
            break;
    }

    dropLocked("status", toString(status));
    return false;
}

void TaskStateMachine::finishLocked(DownloadTaskStatus status, Effects& effects) {
    if (m_retryTimer.valid()) {
        m_context->scheduler->cancel(m_retryTimer);
        m_retryTimer = TimerHandle{};
    }

    m_status = status;
    m_paused = false;
    if (status == DownloadTaskStatus::Complete) {
        m_lastProgress = kProgressComplete;
    }

    emitStatusLocked(status);
    if (auto sentinel = progressSentinelFor(status)) {
        emitProgressLocked(*sentinel);
    }

    if (m_context->store) {
        m_context->store->remove(m_taskId);
    }
    effects.retired = true;
}

void TaskStateMachine::enterWaitingToRetryLocked() {
    m_status = DownloadTaskStatus::WaitingToRetry;
    m_paused = false;

    emitStatusLocked(DownloadTaskStatus::WaitingToRetry);
    emitProgressLocked(kProgressWaitingToRetry);

    // A restart from the store must not get this retry back
    if (m_context->store && !m_context->store->save(m_task.withRetryConsumed())) {
        COURIER_LOG_WARN("Task {} could not be persisted", m_taskId);
    }

    if (m_abandoned) {
        return;
    }

    int attempt = m_task.retries() - m_task.retriesRemaining() + 1;
    auto delay = m_context->backoff->delayFor(attempt);
    uint64_t generation = ++m_retryGeneration;

    COURIER_LOG_INFO("Task {} failed, retry {}/{} in {} ms",
                     m_taskId, attempt, m_task.retries(), delay.count());

    std::weak_ptr<TaskStateMachine> weak = weak_from_this();
    m_retryTimer = m_context->scheduler->schedule(delay, [weak, generation]() {
        if (auto self = weak.lock()) {
            self->retryTimerFired(generation);
        }
    });
}

void TaskStateMachine::retryTimerFired(uint64_t generation) {
    std::optional<Task> snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_abandoned || generation != m_retryGeneration ||
            m_status != DownloadTaskStatus::WaitingToRetry) {
            return;
        }
        m_retryTimer = TimerHandle{};
        m_task = m_task.withRetryConsumed();
        m_status = DownloadTaskStatus::Enqueued;
        m_lastProgress = 0.0;
        emitStatusLocked(DownloadTaskStatus::Enqueued);
        snapshot = m_task;
    }

    COURIER_LOG_DEBUG("Resubmitting task {} ({} retries left)", m_taskId, snapshot->retriesRemaining());

    Effects effects;
    effects.submit = true;
    runEffects(effects, *snapshot, DownloadTaskStatus::Enqueued);
}

bool TaskStateMachine::cancel() {
    Effects effects;
    std::optional<Task> snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (isFinalState(m_status)) {
            return false;
        }
        effects.cancelTransfer = m_status != DownloadTaskStatus::WaitingToRetry;
        finishLocked(DownloadTaskStatus::Canceled, effects);
        snapshot = m_task;
    }

    COURIER_LOG_INFO("Canceled task {}", m_taskId);
    runEffects(effects, *snapshot, DownloadTaskStatus::Canceled);
    return true;
}

void TaskStateMachine::abandon() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_abandoned = true;
        ++m_retryGeneration;
        if (m_retryTimer.valid()) {
            m_context->scheduler->cancel(m_retryTimer);
            m_retryTimer = TimerHandle{};
        }
    }

    std::lock_guard<std::mutex> lock(m_retireMutex);
    m_detached = true;
}

bool TaskStateMachine::pause() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_status != DownloadTaskStatus::Running || m_paused) {
            throw TaskControlError("Task " + m_taskId + " cannot be paused while " +
                                   (m_paused ? std::string("paused") : toString(m_status)));
        }
        if (!m_context->executor->supportsPause(m_taskId)) {
            throw TaskControlError("Task " + m_taskId + " does not support pause");
        }
    }

    if (!m_context->executor->pause(m_taskId)) {
        COURIER_LOG_WARN("Executor did not pause task {}", m_taskId);
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_status != DownloadTaskStatus::Running) {
        return false;
    }
    if (!m_paused) {
        m_paused = true;
        emitProgressLocked(kProgressPaused);
    }
    COURIER_LOG_INFO("Paused task {}", m_taskId);
    return true;
}

bool TaskStateMachine::resume() {
    std::optional<Task> snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_paused || m_status != DownloadTaskStatus::Running) {
            throw TaskControlError("Task " + m_taskId + " is not paused");
        }
        snapshot = m_task;
    }

    if (!m_context->executor->resume(*snapshot)) {
        COURIER_LOG_WARN("Executor did not resume task {}", m_taskId);
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_status != DownloadTaskStatus::Running) {
        return false;
    }
    if (m_paused) {
        m_paused = false;
        emitStatusLocked(DownloadTaskStatus::Running);
        emitProgressLocked(m_lastProgress);
    }
    COURIER_LOG_INFO("Resumed task {}", m_taskId);
    return true;
}

void TaskStateMachine::emitStatusLocked(DownloadTaskStatus status) {
    if (m_task.providesStatusUpdates()) {
        m_context->bus->publish(StatusEvent{m_task, status});
    }
}

void TaskStateMachine::emitProgressLocked(double progress) {
    if (m_task.providesProgressUpdates()) {
        m_context->bus->publish(ProgressEvent(m_task, progress));
    }
}

void TaskStateMachine::persistLocked() {
    if (m_context->store && !m_context->store->save(m_task)) {
        COURIER_LOG_WARN("Task {} could not be persisted", m_taskId);
    }
}

void TaskStateMachine::dropLocked(const char* what, const std::string& detail) const {
    if (m_status == DownloadTaskStatus::Canceled) {
        COURIER_LOG_DEBUG("Ignoring {} {} for canceled task {}", what, detail, m_taskId);
    } else {
        COURIER_LOG_WARN("Dropping {} {} for task {} in state {}", what, detail, m_taskId, toString(m_status));
    }
}

void TaskStateMachine::runEffects(const Effects& effects, const Task& task, DownloadTaskStatus status) {
    if (effects.cancelTransfer) {
        m_context->executor->cancel(m_taskId);
    }
    if (effects.submit) {
        try {
            m_context->executor->submit(task);
        } catch (const std::exception& e) {
            COURIER_LOG_ERROR("Executor rejected task {}: {}", m_taskId, e.what());
            handleStatus(DownloadTaskStatus::Failed);
        }
    }
    if (effects.retired) {
        COURIER_LOG_DEBUG("Task {} finished as {}", m_taskId, toString(status));
        std::lock_guard<std::mutex> lock(m_retireMutex);
        if (m_onRetired && !m_detached) {
            m_onRetired(task, status);
        }
    }
}

DownloadTaskStatus TaskStateMachine::status() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_status;
}

bool TaskStateMachine::isPaused() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_paused;
}

bool TaskStateMachine::isRetired() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return isFinalState(m_status);
}

Task TaskStateMachine::task() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_task;
}

double TaskStateMachine::lastProgress() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastProgress;
}

bool TaskStateMachine::hasPendingRetry() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_retryTimer.valid();
}

} // namespace courier::core::downloader

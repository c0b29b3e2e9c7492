/**
 * BatchCoordinator.cpp
 *
 * Batch result tracking.
 */

#include "BatchCoordinator.hpp"
#include "../Logger.hpp"

namespace courier::core::downloader {

namespace {

std::unordered_set<std::string> idsOf(const std::vector<Task>& tasks) {
    std::unordered_set<std::string> ids;
    for (const auto& task : tasks) {
        ids.insert(task.taskId());
    }
    return ids;
}

} // namespace

BatchCoordinator::BatchCoordinator(std::vector<Task> tasks, ProgressCallback callback)
    : m_tasks(std::move(tasks))
    , m_taskIds(idsOf(m_tasks))
    , m_callback(std::move(callback)) {
}

BatchCoordinator::~BatchCoordinator() {
    detach();
}

std::shared_ptr<BatchCoordinator> BatchCoordinator::create(std::vector<Task> tasks, ProgressCallback callback) {
    return std::make_shared<BatchCoordinator>(std::move(tasks), std::move(callback));
}

void BatchCoordinator::attach(const std::shared_ptr<TaskEventBus>& bus) {
    std::lock_guard<std::mutex> lock(m_attachMutex);
    if (m_subscription) {
        throw std::logic_error("Batch already attached");
    }

    std::weak_ptr<BatchCoordinator> weak = weak_from_this();
    m_subscription = bus->subscribe(
        SubscriptionFilter::forTasks(m_taskIds),
        [weak](const TaskEvent& event) {
            if (auto self = weak.lock()) {
                self->onEvent(event);
            }
        });
    m_bus = bus;
}

void BatchCoordinator::detach() {
    std::lock_guard<std::mutex> lock(m_attachMutex);
    if (!m_subscription) return;

    if (auto bus = m_bus.lock()) {
        bus->unsubscribe(m_subscription);
    } else {
        m_subscription->cancel();
    }
    m_subscription.reset();
    m_bus.reset();
}

void BatchCoordinator::onEvent(const TaskEvent& event) {
    if (auto status = finalStatusOf(event)) {
        record(taskOf(event), *status);
    }
}

bool BatchCoordinator::record(const Task& task, DownloadTaskStatus status) {
    if (!isFinalState(status) || m_taskIds.count(task.taskId()) == 0) {
        return false;
    }

    // Serializes callbacks so observers see the counts grow in order
    std::lock_guard<std::mutex> callbackLock(m_callbackMutex);

    size_t succeededCount;
    size_t failedCount;
    bool resolved;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_results.emplace(task, status).second) {
            return false;
        }
        if (status == DownloadTaskStatus::Complete) {
            m_succeeded.push_back(task);
        } else {
            m_failed.push_back(task);
        }
        succeededCount = m_succeeded.size();
        failedCount = m_failed.size();
        resolved = isResolvedLocked();
    }

    if (resolved) {
        Logger::instance().info("Batch of {} resolved: {} succeeded, {} failed",
                                m_taskIds.size(), succeededCount, failedCount);
        m_resolvedCondition.notify_all();
    }

    if (m_callback) {
        try {
            m_callback(succeededCount, failedCount);
        } catch (const std::exception& e) {
            Logger::instance().error("Batch callback threw: {}", e.what());
        }
    }
    return true;
}

size_t BatchCoordinator::numSucceeded() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_succeeded.size();
}

size_t BatchCoordinator::numFailed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_failed.size();
}

std::vector<Task> BatchCoordinator::succeeded() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_succeeded;
}

std::vector<Task> BatchCoordinator::failed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_failed;
}

std::unordered_map<Task, DownloadTaskStatus> BatchCoordinator::results() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_results;
}

bool BatchCoordinator::isResolved() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return isResolvedLocked();
}

bool BatchCoordinator::waitUntilResolved(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_resolvedCondition.wait_for(lock, timeout, [this] { return isResolvedLocked(); });
}

} // namespace courier::core::downloader

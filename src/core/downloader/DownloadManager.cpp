/**
 * DownloadManager.cpp
 *
 * Task registry, batch wiring and executor report routing.
 */

#include "DownloadManager.hpp"
#include "../Config.hpp"
#include "../Logger.hpp"

#include <algorithm>

namespace courier::core::downloader {

namespace {

std::shared_ptr<TaskContext> makeContext(ManagerDependencies& deps) {
    if (!deps.executor) {
        throw std::invalid_argument("DownloadManager requires a TransferExecutor");
    }

    auto& config = Config::instance();
    auto context = std::make_shared<TaskContext>();
    context->executor = std::move(deps.executor);
    context->store = std::move(deps.store);

    context->scheduler = deps.scheduler ? std::move(deps.scheduler)
                                        : std::make_shared<TimerQueue>();
    context->bus = deps.bus ? std::move(deps.bus)
                            : std::make_shared<TaskEventBus>(
                                  config.get<size_t>("events.dispatchThreads", 2));
    context->backoff = deps.backoff ? std::move(deps.backoff)
                                    : std::make_shared<BackoffPolicy>(BackoffPolicy::fromConfig());
    return context;
}

} // namespace

DownloadManager::DownloadManager(ManagerDependencies deps)
    : m_context(makeContext(deps))
    , m_ids(deps.ids ? std::move(deps.ids) : std::make_shared<RandomIdGenerator>())
    , m_finishedLimit(deps.finishedHistory.value_or(
          Config::instance().get<size_t>("history.finishedTasks", 256))) {
    m_context->executor->setListener(this);
    Logger::instance().info("DownloadManager initialized (persistence {})",
                            m_context->store ? "on" : "off");
}

DownloadManager::~DownloadManager() {
    shutdown();
}

Task DownloadManager::createTask(const TaskParams& params) {
    return Task(params, *m_ids);
}

bool DownloadManager::enqueue(const Task& task) {
    if (!m_running) {
        Logger::instance().warn("Rejecting task {}: manager is shut down", task.taskId());
        return false;
    }

    auto machine = std::make_shared<TaskStateMachine>(
        task, m_context,
        [this](const Task& finished, DownloadTaskStatus status) { onRetired(finished, status); });

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_active.emplace(task.taskId(), machine).second) {
            Logger::instance().warn("Task {} is already active", task.taskId());
            return false;
        }
        if (m_finished.erase(task.taskId()) > 0) {
            m_finishedOrder.erase(std::find(m_finishedOrder.begin(), m_finishedOrder.end(), task.taskId()));
        }
    }

    Logger::instance().info("Enqueued {}", task.describe());
    machine->start();
    return true;
}

BatchPtr DownloadManager::enqueueBatch(const std::vector<Task>& tasks,
                                       BatchCoordinator::ProgressCallback callback) {
    std::vector<Task> batchTasks;
    batchTasks.reserve(tasks.size());
    for (const auto& task : tasks) {
        if (task.progressUpdates() == ProgressUpdatePolicy::None) {
            TaskChanges changes;
            changes.progressUpdates = ProgressUpdatePolicy::StatusOnly;
            batchTasks.push_back(task.copyWith(changes));
        } else {
            batchTasks.push_back(task);
        }
    }

    auto batch = BatchCoordinator::create(batchTasks, std::move(callback));
    // Listen before starting so no outcome is missed
    batch->attach(m_context->bus);

    Logger::instance().info("Enqueueing batch of {} tasks", batchTasks.size());
    for (const auto& task : batchTasks) {
        if (!enqueue(task)) {
            Logger::instance().warn("Batch task {} was not enqueued", task.taskId());
        }
    }
    return batch;
}

bool DownloadManager::cancel(const std::string& taskId) {
    auto machine = find(taskId);
    if (!machine) {
        return false;
    }
    return machine->cancel();
}

size_t DownloadManager::cancelAll() {
    std::vector<MachinePtr> machines;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        machines.reserve(m_active.size());
        for (const auto& [id, machine] : m_active) {
            machines.push_back(machine);
        }
    }

    size_t canceled = 0;
    for (const auto& machine : machines) {
        if (machine->cancel()) {
            ++canceled;
        }
    }
    return canceled;
}

bool DownloadManager::pause(const std::string& taskId) {
    return findForControl(taskId)->pause();
}

bool DownloadManager::resume(const std::string& taskId) {
    return findForControl(taskId)->resume();
}

std::optional<DownloadTaskStatus> DownloadManager::status(const std::string& taskId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (auto it = m_active.find(taskId); it != m_active.end()) {
        return it->second->status();
    }
    if (auto it = m_finished.find(taskId); it != m_finished.end()) {
        return it->second.status;
    }
    return std::nullopt;
}

std::optional<Task> DownloadManager::taskFor(const std::string& taskId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (auto it = m_active.find(taskId); it != m_active.end()) {
        return it->second->task();
    }
    if (auto it = m_finished.find(taskId); it != m_finished.end()) {
        return it->second.task;
    }
    return std::nullopt;
}

bool DownloadManager::forget(const std::string& taskId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_finished.erase(taskId) == 0) {
        return false;
    }
    m_finishedOrder.erase(std::find(m_finishedOrder.begin(), m_finishedOrder.end(), taskId));
    return true;
}

void DownloadManager::clearFinished() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_finished.clear();
    m_finishedOrder.clear();
}

size_t DownloadManager::activeCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_active.size();
}

size_t DownloadManager::finishedCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_finished.size();
}

size_t DownloadManager::restoreFromStore() {
    if (!m_context->store) {
        return 0;
    }

    size_t restored = 0;
    for (const auto& task : m_context->store->loadAll()) {
        if (enqueue(task)) {
            ++restored;
        }
    }
    Logger::instance().info("Restored {} persisted tasks", restored);
    return restored;
}

bool DownloadManager::waitForAll(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_idleCondition.wait_for(lock, timeout, [this] { return m_active.empty(); });
}

SubscriptionPtr DownloadManager::subscribe(SubscriptionFilter filter, TaskEventCallback callback) {
    return m_context->bus->subscribe(std::move(filter), std::move(callback));
}

void DownloadManager::unsubscribe(const SubscriptionPtr& subscription) {
    m_context->bus->unsubscribe(subscription);
}

void DownloadManager::shutdown() {
    if (!m_running.exchange(false)) return;

    Logger::instance().info("Shutting down DownloadManager");

    m_context->executor->setListener(nullptr);

    std::unordered_map<std::string, MachinePtr> machines;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        machines.swap(m_active);
    }
    for (const auto& [id, machine] : machines) {
        machine->abandon();
    }

    // Waits for a retry that is resubmitting right now, so the cancel below reaches it
    m_context->scheduler->stop();

    for (const auto& [id, machine] : machines) {
        m_context->executor->cancel(id);
    }
    machines.clear();
    m_idleCondition.notify_all();

    m_context->bus->waitIdle();
}

void DownloadManager::onStatus(const std::string& taskId, DownloadTaskStatus status) {
    auto machine = find(taskId);
    if (!machine) {
        countDropped(taskId, "status");
        return;
    }
    if (!machine->handleStatus(status)) {
        m_droppedEvents.fetch_add(1);
    }
}

void DownloadManager::onStatusCode(const std::string& taskId, int statusCode) {
    auto status = statusFromCode(statusCode);
    if (!status) {
        Logger::instance().warn("Dropping unknown status code {} for task {}", statusCode, taskId);
        m_droppedEvents.fetch_add(1);
        return;
    }
    onStatus(taskId, *status);
}

void DownloadManager::onProgress(const std::string& taskId, double progress) {
    auto machine = find(taskId);
    if (!machine) {
        countDropped(taskId, "progress");
        return;
    }
    if (!machine->handleProgress(progress)) {
        m_droppedEvents.fetch_add(1);
    }
}

DownloadManager::MachinePtr DownloadManager::find(const std::string& taskId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_active.find(taskId);
    return it != m_active.end() ? it->second : nullptr;
}

DownloadManager::MachinePtr DownloadManager::findForControl(const std::string& taskId) const {
    auto machine = find(taskId);
    if (!machine) {
        throw TaskControlError("No active task " + taskId);
    }
    return machine;
}

void DownloadManager::onRetired(const Task& task, DownloadTaskStatus status) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_active.erase(task.taskId());
        rememberLocked(task, status);
    }
    m_idleCondition.notify_all();

    Logger::instance().info("Task {} finished: {}", task.taskId(), toString(status));
}

void DownloadManager::rememberLocked(const Task& task, DownloadTaskStatus status) {
    if (m_finishedLimit == 0) {
        return;
    }

    bool inserted = m_finished.insert_or_assign(task.taskId(), FinishedTask{task, status}).second;
    if (!inserted) {
        m_finishedOrder.erase(std::find(m_finishedOrder.begin(), m_finishedOrder.end(), task.taskId()));
    }
    m_finishedOrder.push_back(task.taskId());

    while (m_finishedOrder.size() > m_finishedLimit) {
        m_finished.erase(m_finishedOrder.front());
        m_finishedOrder.pop_front();
    }
}

void DownloadManager::countDropped(const std::string& taskId, const char* what) {
    m_droppedEvents.fetch_add(1);

    bool finished;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        finished = m_finished.count(taskId) > 0;
    }
    if (finished) {
        Logger::instance().debug("Dropping late {} for finished task {}", what, taskId);
    } else {
        Logger::instance().warn("Dropping {} for unknown task {}", what, taskId);
    }
}

} // namespace courier::core::downloader

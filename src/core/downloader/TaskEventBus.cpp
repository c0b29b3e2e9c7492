/**
 * TaskEventBus.cpp
 *
 * Strand-per-task event delivery.
 */

#include "TaskEventBus.hpp"
#include "../Logger.hpp"

#include <algorithm>

namespace courier::core::downloader {

TaskEventBus::TaskEventBus(size_t dispatchThreads)
    : m_pool(dispatchThreads == 0 ? 1 : dispatchThreads, "events") {
}

TaskEventBus::~TaskEventBus() {
    waitIdle();
}

SubscriptionPtr TaskEventBus::subscribe(SubscriptionFilter filter, TaskEventCallback callback) {
    std::lock_guard<std::mutex> lock(m_subscribersMutex);

    auto subscription = std::make_shared<Subscription>(m_nextId++);
    m_subscribers.push_back({std::move(filter), std::move(callback), subscription});
    return subscription;
}

void TaskEventBus::unsubscribe(const SubscriptionPtr& subscription) {
    if (!subscription) return;

    subscription->cancel();

    std::lock_guard<std::mutex> lock(m_subscribersMutex);
    m_subscribers.erase(
        std::remove_if(m_subscribers.begin(), m_subscribers.end(),
            [id = subscription->getId()](const SubscriberEntry& entry) {
                return entry.subscription->getId() == id;
            }),
        m_subscribers.end()
    );
}

void TaskEventBus::publish(TaskEvent event) {
    std::string taskId = taskOf(event).taskId();
    bool schedule = false;

    {
        std::lock_guard<std::mutex> lock(m_strandsMutex);
        auto [it, inserted] = m_strands.try_emplace(taskId);
        it->second.pending.push_back(std::move(event));
        // A strand that already existed has a drain job queued or running
        schedule = inserted;
    }

    if (schedule && !m_pool.post([this, taskId] { drain(taskId); })) {
        std::lock_guard<std::mutex> lock(m_strandsMutex);
        m_strands.erase(taskId);
        if (m_strands.empty()) {
            m_idleCondition.notify_all();
        }
        Logger::instance().warn("Event bus stopping, dropped events for task {}", taskId);
    }
}

void TaskEventBus::drain(const std::string& taskId) {
    while (true) {
        std::optional<TaskEvent> event;
        {
            std::lock_guard<std::mutex> lock(m_strandsMutex);
            auto it = m_strands.find(taskId);
            if (it == m_strands.end()) {
                return;
            }
            if (it->second.pending.empty()) {
                m_strands.erase(it);
                if (m_strands.empty()) {
                    m_idleCondition.notify_all();
                }
                return;
            }
            event.emplace(std::move(it->second.pending.front()));
            it->second.pending.pop_front();
        }

        deliver(*event);
    }
}

void TaskEventBus::deliver(const TaskEvent& event) {
    std::vector<std::pair<TaskEventCallback, SubscriptionPtr>> targets;
    const Task& task = taskOf(event);

    {
        std::lock_guard<std::mutex> lock(m_subscribersMutex);
        for (const auto& entry : m_subscribers) {
            if (entry.subscription->isActive() && entry.filter.matches(task)) {
                targets.emplace_back(entry.callback, entry.subscription);
            }
        }
    }

    // Call callbacks outside of lock
    for (const auto& [callback, subscription] : targets) {
        if (!subscription->isActive()) continue;
        try {
            callback(event);
        } catch (const std::exception& e) {
            Logger::instance().error("Observer of task {} threw: {}", task.taskId(), e.what());
        }
    }
}

void TaskEventBus::waitIdle() {
    std::unique_lock<std::mutex> lock(m_strandsMutex);
    m_idleCondition.wait(lock, [this] { return m_strands.empty(); });
}

size_t TaskEventBus::getSubscriberCount() const {
    std::lock_guard<std::mutex> lock(m_subscribersMutex);
    return m_subscribers.size();
}

} // namespace courier::core::downloader

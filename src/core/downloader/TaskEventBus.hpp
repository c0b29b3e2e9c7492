#pragma once

/**
 * TaskEventBus.hpp
 *
 * Thread-safe publish/subscribe channel for task events.
 * Events of one task are delivered in publish order; events of different
 * tasks are delivered in parallel on a thread pool.
 */

#include "TaskEvent.hpp"
#include "../ThreadPool.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace courier::core::downloader {

using TaskEventCallback = std::function<void(const TaskEvent&)>;

/**
 * Which events a subscriber receives. An empty filter matches everything.
 */
struct SubscriptionFilter {
    std::optional<std::string> group;
    std::optional<std::unordered_set<std::string>> taskIds;

    static SubscriptionFilter all() { return {}; }

    static SubscriptionFilter forGroup(std::string group) {
        SubscriptionFilter filter;
        filter.group = std::move(group);
        return filter;
    }

    static SubscriptionFilter forTasks(std::unordered_set<std::string> taskIds) {
        SubscriptionFilter filter;
        filter.taskIds = std::move(taskIds);
        return filter;
    }

    bool matches(const Task& task) const {
        if (group && task.group() != *group) return false;
        if (taskIds && taskIds->count(task.taskId()) == 0) return false;
        return true;
    }
};

/**
 * Event subscription handle
 */
class Subscription {
public:
    explicit Subscription(uint64_t id)
        : m_id(id), m_active(true) {}

    uint64_t getId() const { return m_id; }
    bool isActive() const { return m_active; }
    void cancel() { m_active = false; }

private:
    uint64_t m_id;
    std::atomic<bool> m_active;
};

using SubscriptionPtr = std::shared_ptr<Subscription>;

/**
 * TaskEventBus - per-task ordered fan-out
 *
 * publish() never calls observers itself: the event is appended to its
 * task's queue and a pool worker drains that queue. A slow observer holds
 * up only the task whose event it is handling.
 */
class TaskEventBus {
public:
    /**
     * Constructor
     * @param dispatchThreads Number of delivery threads
     */
    explicit TaskEventBus(size_t dispatchThreads = 2);
    ~TaskEventBus();

    TaskEventBus(const TaskEventBus&) = delete;
    TaskEventBus& operator=(const TaskEventBus&) = delete;

    /**
     * Subscribe to events
     * @param filter Which tasks to receive events for
     * @param callback Callback function, invoked on a dispatch thread
     * @return Subscription handle for unsubscribing
     */
    SubscriptionPtr subscribe(SubscriptionFilter filter, TaskEventCallback callback);

    /**
     * Unsubscribe. Events already being delivered to this subscriber may
     * still complete; no new deliveries start.
     */
    void unsubscribe(const SubscriptionPtr& subscription);

    /**
     * Queue an event for delivery
     * @param event Event to deliver
     */
    void publish(TaskEvent event);

    /**
     * Block until every published event has been delivered
     */
    void waitIdle();

    size_t getSubscriberCount() const;

private:
    struct SubscriberEntry {
        SubscriptionFilter filter;
        TaskEventCallback callback;
        SubscriptionPtr subscription;
    };

    struct Strand {
        std::deque<TaskEvent> pending;
    };

    void drain(const std::string& taskId);
    void deliver(const TaskEvent& event);

    mutable std::mutex m_subscribersMutex;
    std::vector<SubscriberEntry> m_subscribers;
    std::atomic<uint64_t> m_nextId{1};

    std::mutex m_strandsMutex;
    std::condition_variable m_idleCondition;
    std::unordered_map<std::string, Strand> m_strands;

    // Declared last so workers stop before the state they use is destroyed
    ThreadPool m_pool;
};

} // namespace courier::core::downloader

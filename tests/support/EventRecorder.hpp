#pragma once

/**
 * EventRecorder.hpp
 *
 * Collects the events a bus delivers, for assertions.
 */

#include "core/downloader/TaskEventBus.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace courier::testing {

class EventRecorder {
public:
    using DownloadTaskStatus = core::downloader::DownloadTaskStatus;
    using TaskEvent = core::downloader::TaskEvent;

    explicit EventRecorder(std::shared_ptr<core::downloader::TaskEventBus> bus,
                           core::downloader::SubscriptionFilter filter = core::downloader::SubscriptionFilter::all())
        : m_bus(std::move(bus)) {
        m_subscription = m_bus->subscribe(std::move(filter), [this](const TaskEvent& event) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_events.push_back(event);
        });
    }

    ~EventRecorder() {
        m_bus->unsubscribe(m_subscription);
    }

    EventRecorder(const EventRecorder&) = delete;
    EventRecorder& operator=(const EventRecorder&) = delete;

    /**
     * Wait for every published event to be delivered
     */
    void flush() {
        m_bus->waitIdle();
    }

    std::vector<TaskEvent> events() {
        flush();
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_events;
    }

    std::vector<DownloadTaskStatus> statuses(const std::string& taskId) {
        std::vector<DownloadTaskStatus> result;
        for (const auto& event : events()) {
            if (const auto* status = std::get_if<core::downloader::StatusEvent>(&event)) {
                if (status->task.taskId() == taskId) result.push_back(status->status);
            }
        }
        return result;
    }

    std::vector<double> progress(const std::string& taskId) {
        std::vector<double> result;
        for (const auto& event : events()) {
            if (const auto* progress = std::get_if<core::downloader::ProgressEvent>(&event)) {
                if (progress->task.taskId() == taskId) result.push_back(progress->progress);
            }
        }
        return result;
    }

    size_t count() {
        return events().size();
    }

private:
    std::shared_ptr<core::downloader::TaskEventBus> m_bus;
    core::downloader::SubscriptionPtr m_subscription;
    std::mutex m_mutex;
    std::vector<TaskEvent> m_events;
};

} // namespace courier::testing

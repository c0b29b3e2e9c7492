#pragma once

/**
 * TaskEvent.hpp
 *
 * Notifications delivered to observers of a task.
 */

#include "Task.hpp"
#include "TaskStatus.hpp"

#include <optional>
#include <variant>

namespace courier::core::downloader {

/**
 * A status transition
 */
struct StatusEvent {
    Task task;
    DownloadTaskStatus status;
};

/**
 * A progress update
 *
 * progress is a fraction in [0,1) while transferring; 1.0 and the
 * negative sentinels encode terminal outcomes, -4.0 a pending retry and
 * -5.0 a paused transfer. status carries the same outcome as a typed
 * value and is empty for fractional progress and for the paused marker.
 */
struct ProgressEvent {
    Task task;
    double progress;
    std::optional<DownloadTaskStatus> status;

    ProgressEvent(Task task_, double progress_)
        : task(std::move(task_)), progress(progress_), status(statusForProgress(progress_)) {}
};

using TaskEvent = std::variant<StatusEvent, ProgressEvent>;

const Task& taskOf(const TaskEvent& event);

/**
 * Final status carried by an event, from either channel
 */
std::optional<DownloadTaskStatus> finalStatusOf(const TaskEvent& event);

json toJson(const TaskEvent& event);

} // namespace courier::core::downloader

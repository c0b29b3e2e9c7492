// Courier - Task events

#include "TaskEvent.hpp"

namespace courier::core::downloader {

const Task& taskOf(const TaskEvent& event) {
    return std::visit([](const auto& e) -> const Task& { return e.task; }, event);
}

std::optional<DownloadTaskStatus> finalStatusOf(const TaskEvent& event) {
    std::optional<DownloadTaskStatus> status;
    if (const auto* statusEvent = std::get_if<StatusEvent>(&event)) {
        status = statusEvent->status;
    } else {
        status = std::get<ProgressEvent>(event).status;
    }

    if (status && isFinalState(*status)) {
        return status;
    }
    return std::nullopt;
}

json toJson(const TaskEvent& event) {
    const Task& task = taskOf(event);
    json j = {
        {"taskId", task.taskId()},
        {"group", task.group()},
        {"filename", task.filename()},
        {"metaData", task.metadata()}
    };

    if (const auto* statusEvent = std::get_if<StatusEvent>(&event)) {
        j["type"] = "status";
        j["status"] = toString(statusEvent->status);
    } else {
        const auto& progressEvent = std::get<ProgressEvent>(event);
        j["type"] = "progress";
        j["progress"] = progressEvent.progress;
        if (progressEvent.status) {
            j["status"] = toString(*progressEvent.status);
        }
    }
    return j;
}

} // namespace courier::core::downloader

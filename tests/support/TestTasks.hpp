#pragma once

/**
 * TestTasks.hpp
 *
 * Shorthand for building tasks in tests.
 */

#include "core/IdGenerator.hpp"
#include "core/downloader/Task.hpp"

#include <string>

namespace courier::testing {

inline core::downloader::Task makeTask(
        const std::string& taskId,
        core::downloader::ProgressUpdatePolicy policy = core::downloader::ProgressUpdatePolicy::StatusOnly,
        int retries = 0,
        const std::string& group = "default") {
    core::SequentialIdGenerator ids("file_");
    core::downloader::TaskParams params;
    params.taskId = taskId;
    params.url = "https://example.com/" + taskId;
    params.directory = "downloads";
    params.progressUpdates = policy;
    params.retries = retries;
    params.group = group;
    return core::downloader::Task(params, ids);
}

} // namespace courier::testing

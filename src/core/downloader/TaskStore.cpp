/**
 * TaskStore.cpp
 *
 * JSON file persistence for task records.
 */

#include "TaskStore.hpp"
#include "../Logger.hpp"
#include "../../utils/UrlUtils.hpp"

#include <fstream>

namespace courier::core::downloader {

namespace fs = std::filesystem;

JsonFileTaskStore::JsonFileTaskStore(fs::path directory)
    : m_directory(std::move(directory)) {
    std::error_code ec;
    fs::create_directories(m_directory, ec);
    if (ec) {
        Logger::instance().error("Cannot create task record directory {}: {}",
                                 m_directory.string(), ec.message());
    }
}

fs::path JsonFileTaskStore::recordPath(const std::string& taskId) const {
    // Task ids are caller-supplied; escape them so they stay one path component
    return m_directory / (utils::UrlUtils::urlEncode(taskId) + ".json");
}

bool JsonFileTaskStore::save(const Task& task) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto path = recordPath(task.taskId());
    auto tempPath = path;
    tempPath += ".tmp";

    {
        std::ofstream file(tempPath, std::ios::trunc);
        if (!file.is_open()) {
            Logger::instance().error("Cannot write task record {}", tempPath.string());
            return false;
        }
        file << task.toJson().dump(2);
        if (!file) {
            Logger::instance().error("Failed writing task record {}", tempPath.string());
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tempPath, path, ec);
    if (ec) {
        Logger::instance().error("Cannot replace task record {}: {}", path.string(), ec.message());
        fs::remove(tempPath, ec);
        return false;
    }
    return true;
}

bool JsonFileTaskStore::remove(const std::string& taskId) {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::error_code ec;
    bool removed = fs::remove(recordPath(taskId), ec);
    if (ec) {
        Logger::instance().warn("Cannot remove task record for {}: {}", taskId, ec.message());
        return false;
    }
    return removed;
}

std::vector<Task> JsonFileTaskStore::loadAll() {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<Task> tasks;
    std::error_code ec;
    fs::directory_iterator it(m_directory, ec);
    if (ec) {
        Logger::instance().warn("Cannot list task records in {}: {}", m_directory.string(), ec.message());
        return tasks;
    }

    for (const auto& entry : it) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") {
            continue;
        }

        std::ifstream file(entry.path());
        try {
            tasks.push_back(Task::fromJson(json::parse(file)));
        } catch (const json::exception& e) {
            Logger::instance().warn("Skipping unreadable task record {}: {}", entry.path().string(), e.what());
        } catch (const ValidationError& e) {
            Logger::instance().warn("Skipping invalid task record {}: {}", entry.path().string(), e.what());
        }
    }

    return tasks;
}

} // namespace courier::core::downloader

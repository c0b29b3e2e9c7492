#pragma once

/**
 * TaskStore.hpp
 *
 * Persisted task records, used to resume tasks after a restart.
 */

#include "Task.hpp"

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace courier::core::downloader {

class TaskStore {
public:
    virtual ~TaskStore() = default;

    /**
     * Write (or overwrite) the record for a task
     * @return true if stored
     */
    virtual bool save(const Task& task) = 0;

    /**
     * Delete the record for a task
     * @return true if a record existed
     */
    virtual bool remove(const std::string& taskId) = 0;

    /**
     * Read every valid record. Unreadable records are skipped and logged.
     */
    virtual std::vector<Task> loadAll() = 0;
};

/**
 * JsonFileTaskStore - one "<taskId>.json" file per task in a directory
 */
class JsonFileTaskStore : public TaskStore {
public:
    explicit JsonFileTaskStore(std::filesystem::path directory);

    bool save(const Task& task) override;
    bool remove(const std::string& taskId) override;
    std::vector<Task> loadAll() override;

    const std::filesystem::path& directory() const { return m_directory; }

private:
    std::filesystem::path recordPath(const std::string& taskId) const;

    std::filesystem::path m_directory;
    mutable std::mutex m_mutex;
};

} // namespace courier::core::downloader

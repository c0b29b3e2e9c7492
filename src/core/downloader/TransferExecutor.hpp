#pragma once

/**
 * TransferExecutor.hpp
 *
 * Boundary between the task core and whatever moves the bytes.
 */

#include "Task.hpp"
#include "TaskStatus.hpp"

#include <string>

namespace courier::core::downloader {

/**
 * Receives reports from an executor. Implemented by DownloadManager.
 * Calls may arrive on any thread, including from inside submit().
 */
class TransferListener {
public:
    virtual ~TransferListener() = default;

    /**
     * Report a status change. Executors report running and the outcome
     * (complete, notFound, failed, canceled); enqueued and waitingToRetry
     * belong to the core.
     */
    virtual void onStatus(const std::string& taskId, DownloadTaskStatus status) = 0;

    /**
     * Report a status by ordinal, as received over a wire protocol.
     * Unknown ordinals are dropped.
     */
    virtual void onStatusCode(const std::string& taskId, int statusCode) = 0;

    /**
     * Report progress: a fraction in [0,1), or one of the sentinels.
     */
    virtual void onProgress(const std::string& taskId, double progress) = 0;
};

/**
 * Executes transfers asynchronously
 */
class TransferExecutor {
public:
    virtual ~TransferExecutor() = default;

    virtual void setListener(TransferListener* listener) = 0;

    /**
     * Start executing a task. Must eventually report exactly one outcome
     * unless the task is canceled or paused first.
     */
    virtual void submit(const Task& task) = 0;

    /**
     * Pause a running transfer
     * @return true once the transfer is paused (acknowledged)
     */
    virtual bool pause(const std::string& taskId) = 0;

    /**
     * Resume a paused transfer
     * @return true if the transfer was restarted
     */
    virtual bool resume(const Task& task) = 0;

    /**
     * Stop a transfer. Fire-and-forget; the executor should not report an
     * outcome for it afterwards.
     */
    virtual void cancel(const std::string& taskId) = 0;

    virtual bool supportsPause(const std::string& taskId) const = 0;
};

} // namespace courier::core::downloader

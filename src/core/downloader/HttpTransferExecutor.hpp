#pragma once

/**
 * HttpTransferExecutor.hpp
 *
 * TransferExecutor that performs HTTP GET/POST transfers with cpr.
 */

#include "TransferExecutor.hpp"
#include "../ThreadPool.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <unordered_map>

namespace courier::core::downloader {

struct HttpExecutorOptions {
    size_t maxConcurrent{4};
    std::chrono::milliseconds timeout{30000};

    /**
     * Read downloads.maxConcurrent and downloads.timeoutMs
     */
    static HttpExecutorOptions fromConfig();
};

/**
 * HttpTransferExecutor - runs transfers on a fixed pool of workers
 *
 * GET bodies stream into "<destination>.part", which is renamed on success.
 * A paused GET keeps its part file and continues with a Range request on
 * resume. POST transfers are not pausable.
 *
 * Status mapping: 2xx -> complete, 404 -> notFound, anything else or a
 * transport error -> failed.
 */
class HttpTransferExecutor : public TransferExecutor {
public:
    explicit HttpTransferExecutor(HttpExecutorOptions options = HttpExecutorOptions::fromConfig());
    ~HttpTransferExecutor() override;

    HttpTransferExecutor(const HttpTransferExecutor&) = delete;
    HttpTransferExecutor& operator=(const HttpTransferExecutor&) = delete;

    void setListener(TransferListener* listener) override;
    void submit(const Task& task) override;
    bool pause(const std::string& taskId) override;
    bool resume(const Task& task) override;
    void cancel(const std::string& taskId) override;
    bool supportsPause(const std::string& taskId) const override;

    /**
     * Full path a task's file is written to
     */
    static std::filesystem::path destinationFor(const Task& task);

private:
    struct Transfer {
        bool pausable{false};
        std::atomic<bool> canceled{false};
        std::atomic<bool> paused{false};
    };

    using TransferPtr = std::shared_ptr<Transfer>;

    void start(const Task& task, bool continuing);
    void run(const Task& task, const TransferPtr& transfer, bool continuing);
    void runGet(const Task& task, const TransferPtr& transfer, bool continuing);
    void runPost(const Task& task, const TransferPtr& transfer);
    void finish(const Task& task, const TransferPtr& transfer, DownloadTaskStatus status);

    bool isStopped(const TransferPtr& transfer) const;
    void reportStatus(const std::string& taskId, DownloadTaskStatus status);
    void reportProgress(const std::string& taskId, double progress);

    HttpExecutorOptions m_options;

    std::mutex m_listenerMutex;
    TransferListener* m_listener{nullptr};

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, TransferPtr> m_transfers;

    ThreadPool m_pool;
};

} // namespace courier::core::downloader

/**
 * HttpTransferExecutor.cpp
 *
 * HTTP transfers using cpr (which wraps libcurl).
 */

#include "HttpTransferExecutor.hpp"
#include "../Config.hpp"
#include "../Logger.hpp"
#include "../../utils/PathUtils.hpp"

#include <cpr/cpr.h>
#include <fstream>

namespace courier::core::downloader {

namespace fs = std::filesystem;

namespace {

cpr::Header buildHeader(const Headers& headers) {
    cpr::Header header;
    for (const auto& [name, value] : headers) {
        header[name] = value;
    }
    return header;
}

std::string bodyBytes(const RequestBody& body) {
    if (const auto* text = std::get_if<std::string>(&body)) {
        return *text;
    }
    if (const auto* bytes = std::get_if<Bytes>(&body)) {
        return std::string(bytes->begin(), bytes->end());
    }
    return {};
}

DownloadTaskStatus statusForResponse(long statusCode) {
    if (statusCode >= 200 && statusCode < 300) {
        return DownloadTaskStatus::Complete;
    }
    if (statusCode == 404) {
        return DownloadTaskStatus::NotFound;
    }
    return DownloadTaskStatus::Failed;
}

fs::path partPathFor(const fs::path& destination) {
    auto part = destination;
    part += ".part";
    return part;
}

} // namespace

HttpExecutorOptions HttpExecutorOptions::fromConfig() {
    auto& config = Config::instance();

    HttpExecutorOptions options;
    options.maxConcurrent = config.get<size_t>("downloads.maxConcurrent", 4);
    options.timeout = std::chrono::milliseconds(config.get<int64_t>("downloads.timeoutMs", 30000));
    if (options.maxConcurrent == 0) {
        options.maxConcurrent = 1;
    }
    return options;
}

HttpTransferExecutor::HttpTransferExecutor(HttpExecutorOptions options)
    : m_options(options)
    , m_pool(options.maxConcurrent == 0 ? 1 : options.maxConcurrent, "transfers") {
    Logger::instance().debug("HttpTransferExecutor started ({} workers, timeout {} ms)",
                             m_pool.size(), m_options.timeout.count());
}

HttpTransferExecutor::~HttpTransferExecutor() {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& [id, transfer] : m_transfers) {
        transfer->canceled = true;
    }
}

void HttpTransferExecutor::setListener(TransferListener* listener) {
    std::lock_guard<std::mutex> lock(m_listenerMutex);
    m_listener = listener;
}

fs::path HttpTransferExecutor::destinationFor(const Task& task) {
    fs::path base;
    switch (task.baseLocation()) {
        case BaseLocation::Documents: base = utils::PathUtils::getDocumentsPath(); break;
        case BaseLocation::Temporary: base = utils::PathUtils::getTemporaryPath(); break;
        case BaseLocation::Support:   base = utils::PathUtils::getSupportPath(); break;
    }
    return base / task.directory() / task.filename();
}

void HttpTransferExecutor::submit(const Task& task) {
    start(task, false);
}

bool HttpTransferExecutor::pause(const std::string& taskId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_transfers.find(taskId);
    if (it == m_transfers.end() || !it->second->pausable) {
        return false;
    }
    it->second->paused = true;
    return true;
}

bool HttpTransferExecutor::resume(const Task& task) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_transfers.find(task.taskId());
        if (it == m_transfers.end() || !it->second->paused) {
            return false;
        }
    }
    start(task, true);
    return true;
}

void HttpTransferExecutor::cancel(const std::string& taskId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_transfers.find(taskId);
    if (it != m_transfers.end()) {
        it->second->canceled = true;
        m_transfers.erase(it);
    }
}

bool HttpTransferExecutor::supportsPause(const std::string& taskId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_transfers.find(taskId);
    return it != m_transfers.end() && it->second->pausable;
}

void HttpTransferExecutor::start(const Task& task, bool continuing) {
    auto transfer = std::make_shared<Transfer>();
    transfer->pausable = !task.request().hasBody();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        // Replacing an entry stops the worker that owned it
        if (auto it = m_transfers.find(task.taskId()); it != m_transfers.end()) {
            it->second->canceled = true;
        }
        m_transfers[task.taskId()] = transfer;
    }

    bool queued = m_pool.post([this, task, transfer, continuing] {
        run(task, transfer, continuing);
    });
    if (!queued) {
        throw std::runtime_error("Transfer executor is shutting down");
    }
}

void HttpTransferExecutor::run(const Task& task, const TransferPtr& transfer, bool continuing) {
    if (isStopped(transfer)) {
        return;
    }

    reportStatus(task.taskId(), DownloadTaskStatus::Running);

    try {
        if (task.request().hasBody()) {
            runPost(task, transfer);
        } else {
            runGet(task, transfer, continuing);
        }
    } catch (const std::exception& e) {
        Logger::instance().warn("Download error: {} - {}", task.url(), e.what());
        finish(task, transfer, DownloadTaskStatus::Failed);
    }
}

void HttpTransferExecutor::runGet(const Task& task, const TransferPtr& transfer, bool continuing) {
    auto destination = destinationFor(task);
    auto partPath = partPathFor(destination);
    fs::create_directories(destination.parent_path());

    std::error_code ec;
    cpr::cpr_off_t offset = 0;
    if (continuing && fs::exists(partPath, ec)) {
        offset = static_cast<cpr::cpr_off_t>(fs::file_size(partPath, ec));
        if (ec) offset = 0;
    }

    cpr::Header header = buildHeader(task.headers());
    if (offset > 0) {
        header["Range"] = "bytes=" + std::to_string(offset) + "-";
    }

    double lastReported = -1.0;
    auto progress = cpr::ProgressCallback(
        [&](cpr::cpr_off_t downloadTotal, cpr::cpr_off_t downloadNow,
            cpr::cpr_off_t /*uploadTotal*/, cpr::cpr_off_t /*uploadNow*/,
            intptr_t /*userdata*/) -> bool {
            if (isStopped(transfer)) {
                return false; // Abort transfer
            }
            if (downloadTotal > 0) {
                double fraction = static_cast<double>(offset + downloadNow) /
                                  static_cast<double>(offset + downloadTotal);
                // Report whole percents; 1.0 is left to the complete status
                if (fraction < 1.0 && fraction - lastReported >= 0.01) {
                    lastReported = fraction;
                    reportProgress(task.taskId(), fraction);
                }
            }
            return true;
        });

    cpr::Response response;
    {
        std::ofstream file(partPath, std::ios::binary | (offset > 0 ? std::ios::app : std::ios::trunc));
        if (!file.is_open()) {
            Logger::instance().error("Failed to open output file {}", partPath.string());
            finish(task, transfer, DownloadTaskStatus::Failed);
            return;
        }
        response = cpr::Download(file, cpr::Url{task.url()}, header,
                                 cpr::Timeout{m_options.timeout}, progress);
    }

    // A paused transfer keeps its part file, even if resume() already replaced it
    if (transfer->paused) {
        Logger::instance().debug("Paused {} at {} bytes", task.taskId(), offset + response.downloaded_bytes);
        return;
    }
    if (isStopped(transfer)) {
        fs::remove(partPath, ec);
        return;
    }

    if (offset > 0 && response.status_code == 200) {
        // Range ignored: the part file now holds a stale prefix
        Logger::instance().info("Server ignored range for {}, restarting", task.taskId());
        fs::remove(partPath, ec);
        runGet(task, transfer, false);
        return;
    }

    if (response.error.code != cpr::ErrorCode::OK) {
        Logger::instance().warn("Download error: {} - {}", task.url(), response.error.message);
        finish(task, transfer, DownloadTaskStatus::Failed);
        return;
    }

    auto status = statusForResponse(response.status_code);
    if (status == DownloadTaskStatus::Complete) {
        fs::rename(partPath, destination, ec);
        if (ec) {
            Logger::instance().error("Cannot move {} into place: {}", destination.string(), ec.message());
            status = DownloadTaskStatus::Failed;
        }
    } else {
        Logger::instance().warn("HTTP {} for {}", response.status_code, task.url());
        fs::remove(partPath, ec);
    }

    finish(task, transfer, status);
}

void HttpTransferExecutor::runPost(const Task& task, const TransferPtr& transfer) {
    auto destination = destinationFor(task);
    fs::create_directories(destination.parent_path());

    auto progress = cpr::ProgressCallback(
        [&](cpr::cpr_off_t, cpr::cpr_off_t, cpr::cpr_off_t, cpr::cpr_off_t, intptr_t) -> bool {
            return !isStopped(transfer);
        });

    cpr::Response response = cpr::Post(cpr::Url{task.url()},
                                       buildHeader(task.headers()),
                                       cpr::Body{bodyBytes(task.body())},
                                       cpr::Timeout{m_options.timeout},
                                       progress);

    if (isStopped(transfer)) {
        return;
    }
    if (response.error.code != cpr::ErrorCode::OK) {
        Logger::instance().warn("Upload error: {} - {}", task.url(), response.error.message);
        finish(task, transfer, DownloadTaskStatus::Failed);
        return;
    }

    auto status = statusForResponse(response.status_code);
    if (status == DownloadTaskStatus::Complete) {
        std::ofstream file(destination, std::ios::binary | std::ios::trunc);
        file << response.text;
        if (!file) {
            Logger::instance().error("Failed writing response to {}", destination.string());
            status = DownloadTaskStatus::Failed;
        }
    } else {
        Logger::instance().warn("HTTP {} for {}", response.status_code, task.url());
    }

    finish(task, transfer, status);
}

void HttpTransferExecutor::finish(const Task& task, const TransferPtr& transfer, DownloadTaskStatus status) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_transfers.find(task.taskId());
        if (it == m_transfers.end() || it->second != transfer) {
            return;
        }
        m_transfers.erase(it);
    }
    Logger::instance().debug("Transfer {} ended: {}", task.taskId(), toString(status));
    reportStatus(task.taskId(), status);
}

bool HttpTransferExecutor::isStopped(const TransferPtr& transfer) const {
    return transfer->canceled || transfer->paused;
}

void HttpTransferExecutor::reportStatus(const std::string& taskId, DownloadTaskStatus status) {
    std::lock_guard<std::mutex> lock(m_listenerMutex);
    if (m_listener) {
        m_listener->onStatus(taskId, status);
    }
}

void HttpTransferExecutor::reportProgress(const std::string& taskId, double progress) {
    std::lock_guard<std::mutex> lock(m_listenerMutex);
    if (m_listener) {
        m_listener->onProgress(taskId, progress);
    }
}

} // namespace courier::core::downloader

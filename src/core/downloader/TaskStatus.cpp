// Courier - Task status helpers

#include "TaskStatus.hpp"

namespace courier::core::downloader {

std::optional<double> progressSentinelFor(DownloadTaskStatus status) {
    switch (status) {
        case DownloadTaskStatus::Complete:       return kProgressComplete;
        case DownloadTaskStatus::Failed:         return kProgressFailed;
        case DownloadTaskStatus::Canceled:       return kProgressCanceled;
        case DownloadTaskStatus::NotFound:       return kProgressNotFound;
        case DownloadTaskStatus::WaitingToRetry: return kProgressWaitingToRetry;
        case DownloadTaskStatus::Enqueued:
        case DownloadTaskStatus::Running:
            return std::nullopt;
    }
    return std::nullopt;
}

std::optional<DownloadTaskStatus> statusForProgress(double progress) {
    if (progress == kProgressComplete) return DownloadTaskStatus::Complete;
    if (progress == kProgressFailed) return DownloadTaskStatus::Failed;
    if (progress == kProgressCanceled) return DownloadTaskStatus::Canceled;
    if (progress == kProgressNotFound) return DownloadTaskStatus::NotFound;
    if (progress == kProgressWaitingToRetry) return DownloadTaskStatus::WaitingToRetry;
    return std::nullopt;
}

bool isFractionalProgress(double progress) {
    return progress >= 0.0 && progress < 1.0;
}

bool isPausedProgress(double progress) {
    return progress == kProgressPaused;
}

std::optional<DownloadTaskStatus> statusFromCode(int code) {
    if (code < 0 || code > static_cast<int>(DownloadTaskStatus::WaitingToRetry)) {
        return std::nullopt;
    }
    return static_cast<DownloadTaskStatus>(code);
}

int toCode(DownloadTaskStatus status) {
    return static_cast<int>(status);
}

std::string toString(DownloadTaskStatus status) {
    switch (status) {
        case DownloadTaskStatus::Enqueued:       return "enqueued";
        case DownloadTaskStatus::Running:        return "running";
        case DownloadTaskStatus::Complete:       return "complete";
        case DownloadTaskStatus::NotFound:       return "notFound";
        case DownloadTaskStatus::Failed:         return "failed";
        case DownloadTaskStatus::Canceled:       return "canceled";
        case DownloadTaskStatus::WaitingToRetry: return "waitingToRetry";
    }
    return "unknown";
}

} // namespace courier::core::downloader

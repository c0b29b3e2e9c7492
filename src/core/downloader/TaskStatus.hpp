#pragma once

/**
 * TaskStatus.hpp
 *
 * Lifecycle states of a transfer task and the progress sentinels that
 * encode terminal outcomes on the progress channel.
 */

#include <optional>
#include <string>

namespace courier::core::downloader {

/**
 * Download task status
 *
 * Ordinals are part of the collaborator protocol (onStatusCode) and
 * must not be reordered.
 */
enum class DownloadTaskStatus {
    Enqueued,
    Running,
    Complete,
    NotFound,
    Failed,
    Canceled,
    WaitingToRetry
};

/**
 * True for complete, notFound, failed and canceled: no further state
 * change is possible and no further events are expected.
 */
inline bool isFinalState(DownloadTaskStatus status) {
    switch (status) {
        case DownloadTaskStatus::Complete:
        case DownloadTaskStatus::NotFound:
        case DownloadTaskStatus::Failed:
        case DownloadTaskStatus::Canceled:
            return true;
        case DownloadTaskStatus::Enqueued:
        case DownloadTaskStatus::Running:
        case DownloadTaskStatus::WaitingToRetry:
            return false;
    }
    return false;
}

inline bool isNotFinalState(DownloadTaskStatus status) {
    return !isFinalState(status);
}

// Progress values representing a status
constexpr double kProgressComplete = 1.0;
constexpr double kProgressFailed = -1.0;
constexpr double kProgressCanceled = -2.0;
constexpr double kProgressNotFound = -3.0;
constexpr double kProgressWaitingToRetry = -4.0;
constexpr double kProgressPaused = -5.0;

/**
 * Sentinel for a status, if it has one (enqueued and running do not).
 */
std::optional<double> progressSentinelFor(DownloadTaskStatus status);

/**
 * Status encoded by a sentinel progress value. Fractional progress in
 * [0,1) and the paused marker carry no status.
 */
std::optional<DownloadTaskStatus> statusForProgress(double progress);

bool isFractionalProgress(double progress);
bool isPausedProgress(double progress);

/**
 * Status for a collaborator-supplied ordinal, or nullopt if out of range.
 */
std::optional<DownloadTaskStatus> statusFromCode(int code);
int toCode(DownloadTaskStatus status);

std::string toString(DownloadTaskStatus status);

} // namespace courier::core::downloader

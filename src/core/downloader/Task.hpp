#pragma once

/**
 * Task.hpp
 *
 * A transfer task: a Request plus destination, routing group, update
 * policy and user metadata. Identity is the taskId alone.
 */

#include "Request.hpp"
#include "../IdGenerator.hpp"

#include <optional>
#include <string>
#include <utility>

namespace courier::core::downloader {

/**
 * Base directory in which files are stored; the task's directory and
 * filename are relative to it.
 */
enum class BaseLocation {
    Documents,
    Temporary,
    Support
};

/**
 * Kind of updates a task reports to observers
 */
enum class ProgressUpdatePolicy {
    None,
    StatusOnly,
    ProgressOnly,
    Both
};

std::string toString(BaseLocation location);
std::string toString(ProgressUpdatePolicy policy);
std::optional<ProgressUpdatePolicy> parseProgressUpdatePolicy(const std::string& name);

/**
 * Arguments for creating a Task. Unset taskId and filename are generated.
 */
struct TaskParams {
    std::optional<std::string> taskId;
    std::string url;
    QueryParameters queryParameters;
    std::optional<std::string> filename;
    Headers headers;
    RequestBody body;
    std::string directory;
    BaseLocation baseLocation{BaseLocation::Documents};
    std::string group{"default"};
    ProgressUpdatePolicy progressUpdates{ProgressUpdatePolicy::StatusOnly};
    bool requiresUnmeteredNetwork{false};
    int retries{0};
    std::string metadata;
};

/**
 * Field overrides for Task::copyWith. Unset fields keep their value.
 */
struct TaskChanges {
    std::optional<std::string> taskId;
    std::optional<std::string> url;
    std::optional<std::string> filename;
    std::optional<Headers> headers;
    std::optional<RequestBody> body;
    std::optional<std::string> directory;
    std::optional<BaseLocation> baseLocation;
    std::optional<std::string> group;
    std::optional<ProgressUpdatePolicy> progressUpdates;
    std::optional<bool> requiresUnmeteredNetwork;
    std::optional<int> retries;
    std::optional<int> retriesRemaining;
    std::optional<std::string> metadata;
};

class Task {
public:
    /**
     * Create a task
     * @param params Task arguments
     * @param ids Generator for a missing taskId or filename
     * @throws ValidationError on invalid retries, filename or directory
     */
    Task(const TaskParams& params, IdGenerator& ids);

    const Request& request() const { return m_request; }

    const std::string& taskId() const { return m_taskId; }
    const std::string& url() const { return m_request.url(); }
    const Headers& headers() const { return m_request.headers(); }
    const RequestBody& body() const { return m_request.body(); }
    int retries() const { return m_request.retries(); }
    int retriesRemaining() const { return m_request.retriesRemaining(); }

    const std::string& filename() const { return m_filename; }
    const std::string& directory() const { return m_directory; }
    BaseLocation baseLocation() const { return m_baseLocation; }
    const std::string& group() const { return m_group; }
    ProgressUpdatePolicy progressUpdates() const { return m_progressUpdates; }
    bool requiresUnmeteredNetwork() const { return m_requiresUnmeteredNetwork; }
    const std::string& metadata() const { return m_metadata; }

    bool providesStatusUpdates() const;
    bool providesProgressUpdates() const;

    /**
     * Copy with changes. The taskId is kept unless overridden.
     * retriesRemaining is taken from changes if given; otherwise it is kept
     * when retries is unchanged and reset to the new retries when it changes.
     * @throws ValidationError if the changed fields are invalid
     */
    Task copyWith(const TaskChanges& changes) const;

    /**
     * Copy with one retry consumed
     */
    Task withRetryConsumed() const;

    /**
     * Persisted record: every field plus retriesRemaining, with
     * baseDirectory and progressUpdates stored as ordinals
     */
    json toJson() const;

    /**
     * @throws ValidationError on a malformed record
     */
    static Task fromJson(const json& j);

    std::string describe() const;

    friend bool operator==(const Task& a, const Task& b) { return a.m_taskId == b.m_taskId; }
    friend bool operator!=(const Task& a, const Task& b) { return !(a == b); }

private:
    Task(const TaskParams& params, std::pair<std::string, std::string> names);

    Task(Request request,
         std::string taskId,
         std::string filename,
         std::string directory,
         BaseLocation baseLocation,
         std::string group,
         ProgressUpdatePolicy progressUpdates,
         bool requiresUnmeteredNetwork,
         std::string metadata);

    static std::pair<std::string, std::string> resolveNames(const TaskParams& params, IdGenerator& ids);
    static void validateDestination(const std::string& filename, const std::string& directory);

    Request m_request;
    std::string m_taskId;
    std::string m_filename;
    std::string m_directory;
    BaseLocation m_baseLocation;
    std::string m_group;
    ProgressUpdatePolicy m_progressUpdates;
    bool m_requiresUnmeteredNetwork;
    std::string m_metadata;
};

} // namespace courier::core::downloader

namespace std {

template<>
struct hash<courier::core::downloader::Task> {
    size_t operator()(const courier::core::downloader::Task& task) const noexcept {
        return hash<string>{}(task.taskId());
    }
};

} // namespace std

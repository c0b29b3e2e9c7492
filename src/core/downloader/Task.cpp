/**
 * Task.cpp
 *
 * Task construction, derivation and record conversion.
 */

#include "Task.hpp"

#include <filesystem>
#include <sstream>

namespace courier::core::downloader {

namespace {

bool isPathSeparator(char c) {
    return c == '/' || c == static_cast<char>(std::filesystem::path::preferred_separator);
}

template<typename Enum>
Enum enumFromOrdinal(const json& j, const char* key, Enum last) {
    int ordinal = j.at(key).get<int>();
    if (ordinal < 0 || ordinal > static_cast<int>(last)) {
        throw ValidationError(std::string("Invalid ") + key + " ordinal " + std::to_string(ordinal));
    }
    return static_cast<Enum>(ordinal);
}

} // namespace

std::string toString(BaseLocation location) {
    switch (location) {
        case BaseLocation::Documents: return "documents";
        case BaseLocation::Temporary: return "temporary";
        case BaseLocation::Support:   return "support";
    }
    return "unknown";
}

std::string toString(ProgressUpdatePolicy policy) {
    switch (policy) {
        case ProgressUpdatePolicy::None:         return "none";
        case ProgressUpdatePolicy::StatusOnly:   return "statusOnly";
        case ProgressUpdatePolicy::ProgressOnly: return "progressOnly";
        case ProgressUpdatePolicy::Both:         return "both";
    }
    return "unknown";
}

std::optional<ProgressUpdatePolicy> parseProgressUpdatePolicy(const std::string& name) {
    if (name == "none") return ProgressUpdatePolicy::None;
    if (name == "statusOnly" || name == "status") return ProgressUpdatePolicy::StatusOnly;
    if (name == "progressOnly" || name == "progress") return ProgressUpdatePolicy::ProgressOnly;
    if (name == "both") return ProgressUpdatePolicy::Both;
    return std::nullopt;
}

Task::Task(const TaskParams& params, IdGenerator& ids)
    : Task(params, resolveNames(params, ids)) {
}

Task::Task(const TaskParams& params, std::pair<std::string, std::string> names)
    : Task(Request(params.url, params.queryParameters, params.headers, params.body, params.retries),
           std::move(names.first),
           std::move(names.second),
           params.directory,
           params.baseLocation,
           params.group,
           params.progressUpdates,
           params.requiresUnmeteredNetwork,
           params.metadata) {
}

Task::Task(Request request,
           std::string taskId,
           std::string filename,
           std::string directory,
           BaseLocation baseLocation,
           std::string group,
           ProgressUpdatePolicy progressUpdates,
           bool requiresUnmeteredNetwork,
           std::string metadata)
    : m_request(std::move(request))
    , m_taskId(std::move(taskId))
    , m_filename(std::move(filename))
    , m_directory(std::move(directory))
    , m_baseLocation(baseLocation)
    , m_group(std::move(group))
    , m_progressUpdates(progressUpdates)
    , m_requiresUnmeteredNetwork(requiresUnmeteredNetwork)
    , m_metadata(std::move(metadata)) {
    if (m_taskId.empty()) {
        throw ValidationError("taskId cannot be empty");
    }
    validateDestination(m_filename, m_directory);
}

std::pair<std::string, std::string> Task::resolveNames(const TaskParams& params, IdGenerator& ids) {
    std::string taskId = params.taskId ? *params.taskId : ids.nextId();
    std::string filename = params.filename ? *params.filename : ids.nextId();
    return {std::move(taskId), std::move(filename)};
}

void Task::validateDestination(const std::string& filename, const std::string& directory) {
    if (filename.empty()) {
        throw ValidationError("Filename cannot be empty");
    }
    for (char c : filename) {
        if (isPathSeparator(c)) {
            throw ValidationError("Filename cannot contain path separators: " + filename);
        }
    }
    if (!directory.empty() && isPathSeparator(directory.front())) {
        throw ValidationError("Directory must be relative to the base location: " + directory);
    }
}

bool Task::providesStatusUpdates() const {
    return m_progressUpdates == ProgressUpdatePolicy::StatusOnly ||
           m_progressUpdates == ProgressUpdatePolicy::Both;
}

bool Task::providesProgressUpdates() const {
    return m_progressUpdates == ProgressUpdatePolicy::ProgressOnly ||
           m_progressUpdates == ProgressUpdatePolicy::Both;
}

Task Task::copyWith(const TaskChanges& changes) const {
    int retries = changes.retries.value_or(m_request.retries());

    Request request(changes.url.value_or(m_request.url()),
                    {},
                    changes.headers.value_or(m_request.headers()),
                    changes.body.value_or(m_request.body()),
                    retries);

    if (changes.retriesRemaining) {
        request = request.withRetriesRemaining(*changes.retriesRemaining);
    } else if (retries == m_request.retries()) {
        request = request.withRetriesRemaining(m_request.retriesRemaining());
    }

    return Task(std::move(request),
                changes.taskId.value_or(m_taskId),
                changes.filename.value_or(m_filename),
                changes.directory.value_or(m_directory),
                changes.baseLocation.value_or(m_baseLocation),
                changes.group.value_or(m_group),
                changes.progressUpdates.value_or(m_progressUpdates),
                changes.requiresUnmeteredNetwork.value_or(m_requiresUnmeteredNetwork),
                changes.metadata.value_or(m_metadata));
}

Task Task::withRetryConsumed() const {
    Task copy = *this;
    copy.m_request = m_request.withRetryConsumed();
    return copy;
}

json Task::toJson() const {
    json j = m_request.toJson();
    j["taskId"] = m_taskId;
    j["filename"] = m_filename;
    j["directory"] = m_directory;
    j["baseDirectory"] = static_cast<int>(m_baseLocation);
    j["group"] = m_group;
    j["progressUpdates"] = static_cast<int>(m_progressUpdates);
    j["requiresWiFi"] = m_requiresUnmeteredNetwork;
    j["metaData"] = m_metadata;
    return j;
}

Task Task::fromJson(const json& j) {
    try {
        return Task(Request::fromJson(j),
                    j.at("taskId").get<std::string>(),
                    j.at("filename").get<std::string>(),
                    j.value("directory", std::string()),
                    enumFromOrdinal(j, "baseDirectory", BaseLocation::Support),
                    j.value("group", std::string("default")),
                    enumFromOrdinal(j, "progressUpdates", ProgressUpdatePolicy::Both),
                    j.value("requiresWiFi", false),
                    j.value("metaData", std::string()));
    } catch (const json::exception& e) {
        throw ValidationError(std::string("Malformed task record: ") + e.what());
    }
}

std::string Task::describe() const {
    std::ostringstream out;
    out << "Task{taskId: " << m_taskId
        << ", url: " << m_request.url()
        << ", filename: " << m_filename
        << ", directory: " << m_directory
        << ", baseLocation: " << toString(m_baseLocation)
        << ", group: " << m_group
        << ", progressUpdates: " << toString(m_progressUpdates)
        << ", requiresUnmeteredNetwork: " << (m_requiresUnmeteredNetwork ? "true" : "false")
        << ", retries: " << m_request.retries()
        << ", retriesRemaining: " << m_request.retriesRemaining()
        << ", metadata: " << m_metadata << "}";
    return out.str();
}

} // namespace courier::core::downloader

#pragma once

/**
 * Config.hpp
 *
 * Settings document shared by the transfer core and the CLI.
 * Keys use dot notation ("retry.baseDelayMs") over a JSON object.
 */

#include "Logger.hpp"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

namespace courier::core {

using json = nlohmann::json;

/**
 * Config - thread-safe singleton holding the settings document
 *
 * Sections:
 * - downloads: executor concurrency and timeouts
 * - retry:     backoff timing for failed transfers
 * - events:    dispatch threads for the event bus
 * - history:   finished tasks kept for status queries
 * - storage:   where persisted task records live
 * - logging:   console/file log level
 *
 * A loaded file is merge-patched over the defaults, so a file only needs
 * the keys it changes.
 */
class Config {
public:
    static Config& instance() {
        static Config instance;
        return instance;
    }

    /**
     * Built-in settings
     */
    static json defaults() {
        return {
            {"downloads", {{"maxConcurrent", 4}, {"timeoutMs", 30000}}},
            {"retry", {
                {"baseDelayMs", 1000},
                {"multiplier", 2.0},
                {"maxDelayMs", 60000},
                {"jitter", 0.2}
            }},
            {"events", {{"dispatchThreads", 2}}},
            {"history", {{"finishedTasks", 256}}},
            {"storage", {{"recordsPath", ""}}},
            {"logging", {{"level", "info"}}}
        };
    }

    /**
     * Merge a config file over the current settings
     * @return false if the file is missing, unreadable or not a JSON object
     */
    bool load(const std::filesystem::path& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            Logger::instance().warn("Cannot open config file {}", path.string());
            return false;
        }

        json patch = json::parse(file, nullptr, false);
        if (patch.is_discarded() || !patch.is_object()) {
            Logger::instance().error("Config file {} is not a JSON object", path.string());
            return false;
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        m_settings.merge_patch(patch);
        m_path = path;
        return true;
    }

    /**
     * Write the settings as indented JSON
     * @param path Target file; empty means the last loaded file
     */
    bool save(const std::filesystem::path& path = {}) const {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto target = path.empty() ? m_path : path;
        if (target.empty()) {
            return false;
        }

        std::error_code ec;
        if (target.has_parent_path()) {
            std::filesystem::create_directories(target.parent_path(), ec);
        }

        std::ofstream file(target, std::ios::trunc);
        file << m_settings.dump(4) << '\n';
        if (!file) {
            Logger::instance().error("Failed to write config {}", target.string());
            return false;
        }
        return true;
    }

    /**
     * Drop every change and return to defaults()
     */
    void reset() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_settings = defaults();
        m_path.clear();
    }

    /**
     * Read a value
     * @param key Dotted key path
     * @param fallback Returned when the key is absent or has another type
     */
    template<typename T>
    T get(const std::string& key, const T& fallback = T{}) const {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto pointer = pointerFor(key);
        if (!m_settings.contains(pointer)) {
            return fallback;
        }
        try {
            return m_settings.at(pointer).get<T>();
        } catch (const json::type_error& e) {
            Logger::instance().warn("Config key {} has the wrong type: {}", key, e.what());
            return fallback;
        }
    }

    /**
     * Write a value, creating intermediate objects
     */
    template<typename T>
    void set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_settings[pointerFor(key)] = value;
    }

    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_settings.contains(pointerFor(key));
    }

    /**
     * @return true if the key existed
     */
    bool remove(const std::string& key) {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto pointer = pointerFor(key);
        if (!m_settings.contains(pointer)) {
            return false;
        }
        m_settings.at(pointer.parent_pointer()).erase(pointer.back());
        return true;
    }

    /**
     * Apply a JSON merge patch (RFC 7386)
     */
    void merge(const json& patch) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_settings.merge_patch(patch);
    }

private:
    Config() : m_settings(defaults()) {}

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    static json::json_pointer pointerFor(const std::string& key) {
        std::string pointer;
        pointer.reserve(key.size() + 1);
        pointer += '/';
        for (char c : key) {
            pointer += c == '.' ? '/' : c;
        }
        return json::json_pointer(pointer);
    }

    mutable std::mutex m_mutex;
    json m_settings;
    std::filesystem::path m_path;
};

} // namespace courier::core

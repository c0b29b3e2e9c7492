#pragma once

/**
 * Logger.hpp
 *
 * Process-wide logging for the transfer core and the CLI.
 * Uses spdlog as the underlying logging library.
 */

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace courier::core {

/**
 * Log level enumeration
 */
enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/**
 * Parse a level name as written in the config file ("debug", "warn", ...).
 * Unknown names map to Info.
 */
inline LogLevel parseLogLevel(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (name == "trace") return LogLevel::Trace;
    if (name == "debug") return LogLevel::Debug;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "critical") return LogLevel::Critical;
    if (name == "off") return LogLevel::Off;
    return LogLevel::Info;
}

/**
 * Logger class - Thread-safe singleton logger
 *
 * Sinks:
 * - Console output with colors (stderr, so stdout stays free for event lines)
 * - Rotating file output, when a log directory is given
 *
 * Until initialize() is called every log call is a no-op, which is what
 * library consumers and the test binaries rely on.
 */
class Logger {
public:
    /**
     * Get singleton instance
     * @return Reference to Logger instance
     */
    static Logger& instance() {
        static Logger instance;
        return instance;
    }

    /**
     * Create the sinks and make this the default spdlog logger
     * @param level Minimum level
     * @param logDir Log file directory; empty disables the file sink
     */
    void initialize(LogLevel level = LogLevel::Info,
                    const std::string& logDir = "") {
        try {
            m_console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            m_console->set_pattern("%H:%M:%S.%e %^%-5l%$ [%t] %v");

            std::vector<spdlog::sink_ptr> sinks{m_console};
            if (!logDir.empty()) {
                sinks.push_back(makeFileSink(std::filesystem::path(logDir)));
            }

            m_logger = std::make_shared<spdlog::logger>("courier", sinks.begin(), sinks.end());
            m_logger->flush_on(spdlog::level::warn);
            setLevel(level);

            spdlog::set_default_logger(m_logger);
        } catch (const spdlog::spdlog_ex& ex) {
            useFallback(std::string("logger setup failed: ") + ex.what());
        } catch (const std::filesystem::filesystem_error& ex) {
            useFallback("cannot create log directory " + logDir + ": " + ex.what());
        }
    }

    /**
     * Change the level of the logger and its console sink
     */
    void setLevel(LogLevel level) {
        if (!m_logger) {
            return;
        }
        if (m_console) {
            m_console->set_level(toSpdlogLevel(level));
        }
        m_logger->set_level(toSpdlogLevel(level));
    }

    /**
     * Log at an explicit level
     */
    template<typename... Args>
    void log(LogLevel level, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->log(toSpdlogLevel(level), fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Trace, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Debug, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Info, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Warn, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Error, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Critical, fmt, std::forward<Args>(args)...);
    }

private:
    Logger() = default;
    ~Logger() {
        if (m_logger) {
            m_logger->flush();
        }
        spdlog::shutdown();
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static spdlog::sink_ptr makeFileSink(const std::filesystem::path& logDir) {
        std::filesystem::create_directories(logDir);
        auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (logDir / "courier.log").string(),
            10 * 1024 * 1024, // 10 MB per file
            5);
        sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        return sink;
    }

    void useFallback(const std::string& reason) {
        m_console.reset();
        m_logger = std::make_shared<spdlog::logger>(
            "courier", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        m_logger->error("Logging to stderr only, {}", reason);
    }

    static spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:    return spdlog::level::trace;
            case LogLevel::Debug:    return spdlog::level::debug;
            case LogLevel::Info:     return spdlog::level::info;
            case LogLevel::Warn:     return spdlog::level::warn;
            case LogLevel::Error:    return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
            case LogLevel::Off:      return spdlog::level::off;
        }
        return spdlog::level::info;
    }

private:
    std::shared_ptr<spdlog::logger> m_logger;
    spdlog::sink_ptr m_console;
};

} // namespace courier::core

// Convenience macros
#define COURIER_LOG_TRACE(...)    courier::core::Logger::instance().trace(__VA_ARGS__)
#define COURIER_LOG_DEBUG(...)    courier::core::Logger::instance().debug(__VA_ARGS__)
#define COURIER_LOG_INFO(...)     courier::core::Logger::instance().info(__VA_ARGS__)
#define COURIER_LOG_WARN(...)     courier::core::Logger::instance().warn(__VA_ARGS__)
#define COURIER_LOG_ERROR(...)    courier::core::Logger::instance().error(__VA_ARGS__)
#define COURIER_LOG_CRITICAL(...) courier::core::Logger::instance().critical(__VA_ARGS__)

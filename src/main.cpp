/**
 * Courier - resumable background file transfers
 *
 * Command line entry point: downloads the given urls as one batch and
 * prints every task event as a JSON line on stdout.
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/Config.hpp"
#include "core/Logger.hpp"
#include "core/downloader/DownloadManager.hpp"
#include "core/downloader/HttpTransferExecutor.hpp"
#include "core/downloader/TaskStore.hpp"
#include "utils/PathUtils.hpp"

namespace fs = std::filesystem;

using courier::core::Config;
using courier::core::LogLevel;
using courier::core::Logger;
namespace dl = courier::core::downloader;

namespace {

constexpr const char* kVersion = "1.0.0";

std::atomic<bool> g_interrupted{false};

struct Options {
    std::vector<std::string> urls;
    std::string directory;
    std::string group{"default"};
    int retries{0};
    dl::ProgressUpdatePolicy progress{dl::ProgressUpdatePolicy::Both};
    std::string configPath;
    bool debug{false};
    bool resume{false};
};

/**
 * Signal handler for graceful shutdown
 */
void signalHandler(int /*signal*/) {
    g_interrupted = true;
}

void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
#ifdef _WIN32
    std::signal(SIGBREAK, signalHandler);
#endif
}

void printUsage(const char* program) {
    std::cout << "Courier - resumable background file transfers\n"
              << "\nUsage: " << program << " [options] <url>...\n"
              << "\nOptions:\n"
              << "  --dir <path>         Directory under ~/Documents to save into\n"
              << "  --group <name>       Task group (default: default)\n"
              << "  --retries <n>        Retries per task, 0-10 (default: 0)\n"
              << "  --progress <policy>  none, status, progress or both (default: both)\n"
              << "  --config <file>      Configuration file\n"
              << "  --resume             Restart tasks left over from a previous run\n"
              << "  -d, --debug          Enable debug logging\n"
              << "  -h, --help           Show this help message\n"
              << "  -v, --version        Show version information\n"
              << std::endl;
}

/**
 * Parse arguments
 * @return Exit code to stop with, or -1 to continue
 */
int parseArguments(int argc, char* argv[], Options& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        auto value = [&](const std::string& name) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << name << std::endl;
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            std::cout << "courier v" << kVersion << std::endl;
            return 0;
        } else if (arg == "--debug" || arg == "-d") {
            options.debug = true;
        } else if (arg == "--resume") {
            options.resume = true;
        } else if (arg == "--dir" || arg == "--group" || arg == "--retries" ||
                   arg == "--progress" || arg == "--config") {
            const char* v = value(arg);
            if (!v) return 1;

            if (arg == "--dir") {
                options.directory = v;
            } else if (arg == "--group") {
                options.group = v;
            } else if (arg == "--config") {
                options.configPath = v;
            } else if (arg == "--retries") {
                try {
                    options.retries = std::stoi(v);
                } catch (const std::exception&) {
                    std::cerr << "Invalid retry count: " << v << std::endl;
                    return 1;
                }
            } else {
                auto policy = dl::parseProgressUpdatePolicy(v);
                if (!policy) {
                    std::cerr << "Unknown progress policy: " << v << std::endl;
                    return 1;
                }
                options.progress = *policy;
            }
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            return 1;
        } else {
            options.urls.push_back(arg);
        }
    }

    if (options.urls.empty() && !options.resume) {
        printUsage(argv[0]);
        return 1;
    }
    return -1;
}

/**
 * Load and apply configuration
 */
bool loadConfiguration(const Options& options) {
    auto& logger = Logger::instance();
    auto& config = Config::instance();

    try {
        fs::path configPath = options.configPath.empty()
            ? courier::utils::PathUtils::getConfigPath()
            : fs::path(options.configPath);

        if (fs::exists(configPath)) {
            if (!config.load(configPath)) {
                return false;
            }
            logger.info("Configuration loaded from {}", configPath.string());
        } else if (options.configPath.empty()) {
            if (config.save(configPath)) {
                logger.info("Default configuration created at {}", configPath.string());
            } else {
                logger.warn("Could not write default configuration to {}", configPath.string());
            }
        } else {
            logger.error("Configuration file {} does not exist", configPath.string());
            return false;
        }

        if (!options.debug) {
            logger.setLevel(courier::core::parseLogLevel(config.get<std::string>("logging.level", "info")));
        }
        return true;
    } catch (const std::exception& e) {
        logger.error("Failed to load configuration: {}", e.what());
        return false;
    }
}

fs::path recordsPath() {
    auto configured = Config::instance().get<std::string>("storage.recordsPath", "");
    return configured.empty() ? courier::utils::PathUtils::getRecordsPath() : fs::path(configured);
}

} // namespace

/**
 * Main application entry point
 */
int main(int argc, char* argv[]) {
    Options options;
    if (int code = parseArguments(argc, argv, options); code >= 0) {
        return code;
    }

    Logger::instance().initialize(
        options.debug ? LogLevel::Debug : LogLevel::Info,
        courier::utils::PathUtils::getLogsPath().string()
    );
    auto& logger = Logger::instance();
    logger.info("courier v{} starting...", kVersion);

    setupSignalHandlers();

    if (!loadConfiguration(options)) {
        logger.critical("Failed to load configuration");
        return 1;
    }

    try {
        std::mutex outputMutex;

        dl::ManagerDependencies deps;
        deps.executor = std::make_shared<dl::HttpTransferExecutor>();
        auto store = std::make_shared<dl::JsonFileTaskStore>(recordsPath());
        deps.store = store;
        dl::DownloadManager manager(std::move(deps));

        auto printer = manager.subscribe(dl::SubscriptionFilter::all(), [&outputMutex](const dl::TaskEvent& event) {
            std::lock_guard<std::mutex> lock(outputMutex);
            std::cout << dl::toJson(event).dump() << std::endl;
        });

        std::vector<std::string> trackedIds;
        if (options.resume) {
            for (const auto& task : store->loadAll()) {
                trackedIds.push_back(task.taskId());
            }
            logger.info("Resuming {} tasks", manager.restoreFromStore());
        }

        std::vector<dl::Task> tasks;
        for (const auto& url : options.urls) {
            dl::TaskParams params;
            params.url = url;
            params.directory = options.directory;
            params.group = options.group;
            params.retries = options.retries;
            params.progressUpdates = options.progress;
            try {
                tasks.push_back(manager.createTask(params));
            } catch (const dl::ValidationError& e) {
                logger.error("Invalid task for {}: {}", url, e.what());
                return 1;
            }
        }

        dl::BatchPtr batch;
        if (!tasks.empty()) {
            batch = manager.enqueueBatch(tasks, [&logger](size_t succeeded, size_t failed) {
                logger.info("Batch progress: {} succeeded, {} failed", succeeded, failed);
            });
        }

        while (!g_interrupted && !manager.waitForAll(std::chrono::milliseconds(200))) {
        }

        if (g_interrupted) {
            logger.info("Interrupted, unfinished tasks are kept for --resume");
            manager.shutdown();
            manager.unsubscribe(printer);
            return 1;
        }

        manager.getEventBus().waitIdle();
        manager.unsubscribe(printer);

        bool allComplete = true;
        if (batch) {
            std::cout << "{\"succeeded\":" << batch->numSucceeded()
                      << ",\"failed\":" << batch->numFailed() << "}" << std::endl;
            allComplete = batch->isResolved() && batch->numFailed() == 0;
        }
        for (const auto& id : trackedIds) {
            if (manager.status(id) != dl::DownloadTaskStatus::Complete) {
                allComplete = false;
            }
        }

        logger.info("courier finished");
        return allComplete ? 0 : 1;

    } catch (const std::exception& e) {
        logger.critical("Unhandled exception: {}", e.what());
        return 1;
    }
}

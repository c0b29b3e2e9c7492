#pragma once

#include <filesystem>
#include <string>
#include <cstdlib>

namespace courier::utils {

namespace fs = std::filesystem;

class PathUtils {
public:
    static fs::path getAppDataPath() {
#ifdef _WIN32
        const char* appData = std::getenv("APPDATA");
        return appData ? fs::path(appData) : fs::current_path();
#elif defined(__APPLE__)
        const char* home = std::getenv("HOME");
        return home ? fs::path(home) / "Library" / "Application Support" : fs::current_path();
#else
        const char* dataHome = std::getenv("XDG_DATA_HOME");
        if (dataHome && *dataHome) {
            return fs::path(dataHome);
        }
        const char* home = std::getenv("HOME");
        return home ? fs::path(home) / ".local" / "share" : fs::current_path();
#endif
    }

    static fs::path getCourierPath() {
        return getAppDataPath() / "Courier";
    }

    static fs::path getConfigPath() {
        return getCourierPath() / "config.json";
    }

    static fs::path getLogsPath() {
        return getCourierPath() / "logs";
    }

    static fs::path getRecordsPath() {
        return getCourierPath() / "tasks";
    }

    // Base locations a task's directory is relative to

    static fs::path getDocumentsPath() {
#ifdef _WIN32
        const char* profile = std::getenv("USERPROFILE");
        return profile ? fs::path(profile) / "Documents" : fs::current_path();
#else
        const char* home = std::getenv("HOME");
        return home ? fs::path(home) / "Documents" : fs::current_path();
#endif
    }

    static fs::path getTemporaryPath() {
        std::error_code ec;
        auto path = fs::temp_directory_path(ec);
        return ec ? fs::current_path() : path;
    }

    static fs::path getSupportPath() {
        return getCourierPath() / "support";
    }
};

} // namespace courier::utils

#pragma once

#include <string>

namespace runbox::utils {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError
};

inline const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo: return "INFO";
        case LogLevel::kWarn: return "WARN";
        case LogLevel::kError: return "ERROR";
    }
    return "UNKNOWN";
}

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

void ConfigureLogging(const LogConfig& config);
LogLevel ParseLogLevel(const std::string& value, LogLevel fallback);

// One line per event on stderr: "<time> [LEVEL] runbox [user]: message".
void Log(LogLevel level, const std::string& user, const std::string& message);

inline void LogDebug(const std::string& user, const std::string& message) {
    Log(LogLevel::kDebug, user, message);
}

inline void LogInfo(const std::string& user, const std::string& message) {
    Log(LogLevel::kInfo, user, message);
}

inline void LogWarn(const std::string& user, const std::string& message) {
    Log(LogLevel::kWarn, user, message);
}

inline void LogError(const std::string& user, const std::string& message) {
    Log(LogLevel::kError, user, message);
}

}  // namespace runbox::utils

#include "utils/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace runbox::utils {
namespace {

std::atomic<int> g_min_level{static_cast<int>(LogLevel::kInfo)};
std::mutex g_log_mutex;

std::string NowLocal() {
    const auto now = std::chrono::system_clock::now();
    const auto time = std::chrono::system_clock::to_time_t(now);
    std::tm local_time{};
    localtime_r(&time, &local_time);
    std::ostringstream oss;
    oss << std::put_time(&local_time, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

}  // namespace

void ConfigureLogging(const LogConfig& config) {
    g_min_level = static_cast<int>(config.min_level);
}

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return fallback;
}

void Log(LogLevel level, const std::string& user, const std::string& message) {
    if (static_cast<int>(level) < g_min_level.load()) {
        return;
    }
    std::ostringstream line;
    line << NowLocal() << " [" << ToString(level) << "] runbox ["
         << (user.empty() ? "system" : user) << "]: " << message << '\n';
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << line.str();
    std::cerr.flush();
}

}  // namespace runbox::utils

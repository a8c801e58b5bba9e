#include "config/config_loader.hpp"

#include <cstdlib>
#include <fstream>
#include <string>

#include "utils/logging.hpp"

namespace runbox::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

// RUNBOX_<NAME> wins over the bare <NAME>.
std::string GetEnvFallback(const std::string& name) {
    auto value = GetEnv(("RUNBOX_" + name).c_str());
    if (!value.empty()) {
        return value;
    }
    return GetEnv(name.c_str());
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

std::filesystem::path GetConfigPath() {
    const auto explicit_path = GetEnv("RUNBOX_CONFIG");
    if (!explicit_path.empty()) {
        return explicit_path;
    }
    return GetHomePath() / ".runbox" / "config.json";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

double ParseDouble(const std::string& value, double fallback) {
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

void ReadString(const nlohmann::json& source, const char* key, std::string& target) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ReadInt(const nlohmann::json& source, const char* key, int& target) {
    if (source.contains(key) && source[key].is_number_integer()) {
        target = source[key].get<int>();
    }
}

void ReadDouble(const nlohmann::json& source, const char* key, double& target) {
    if (source.contains(key) && source[key].is_number()) {
        target = source[key].get<double>();
    }
}

void OverrideString(const char* name, std::string& target) {
    const auto value = GetEnvFallback(name);
    if (!value.empty()) {
        target = value;
    }
}

void OverrideInt(const char* name, int& target) {
    const auto value = GetEnvFallback(name);
    if (!value.empty()) {
        target = ParseInt(value, target);
    }
}

void OverrideDouble(const char* name, double& target) {
    const auto value = GetEnvFallback(name);
    if (!value.empty()) {
        target = ParseDouble(value, target);
    }
}

}  // namespace

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("server") && data["server"].is_object()) {
        const auto& server = data["server"];
        ReadString(server, "host", config.server.host);
        ReadInt(server, "port", config.server.port);
        ReadInt(server, "ioThreads", config.server.io_threads);
        ReadString(server, "logLevel", config.server.log_level);
    }

    if (data.contains("limits") && data["limits"].is_object()) {
        const auto& limits = data["limits"];
        ReadInt(limits, "maxConcurrentSessions", config.limits.max_concurrent_sessions);
        ReadInt(limits, "memoryMb", config.limits.memory_mb);
        ReadDouble(limits, "cpuShare", config.limits.cpu_share);
        ReadInt(limits, "pidsLimit", config.limits.pids_limit);
        ReadInt(limits, "scratchMb", config.limits.scratch_mb);
        ReadInt(limits, "executionTimeoutS", config.limits.execution_timeout_s);
    }

    if (data.contains("guard") && data["guard"].is_object()) {
        const auto& guard = data["guard"];
        ReadInt(guard, "maxFailedAttempts", config.guard.max_failed_attempts);
        ReadInt(guard, "cooldownS", config.guard.cooldown_s);
        ReadInt(guard, "failureDelayMs", config.guard.failure_delay_ms);
    }

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        const auto& sandbox = data["sandbox"];
        ReadString(sandbox, "image", config.sandbox.image);
        ReadString(sandbox, "dockerSocket", config.sandbox.docker_socket);
        ReadString(sandbox, "apiVersion", config.sandbox.api_version);
        ReadString(sandbox, "user", config.sandbox.user);
        ReadString(sandbox, "workspaceRoot", config.sandbox.workspace_root);
        ReadInt(sandbox, "pollIntervalMs", config.sandbox.poll_interval_ms);
        ReadInt(sandbox, "drainGraceMs", config.sandbox.drain_grace_ms);
    }

    if (data.contains("credentials") && data["credentials"].is_object()) {
        ReadString(data["credentials"], "studentsFile", config.credentials.students_file);
    }
}

void ApplyEnvironment(Config& config) {
    OverrideString("HOST", config.server.host);
    OverrideInt("PORT", config.server.port);
    OverrideString("LOG_LEVEL", config.server.log_level);

    OverrideInt("MAX_CONCURRENT_USERS", config.limits.max_concurrent_sessions);
    OverrideInt("MEM_LIMIT_MB", config.limits.memory_mb);
    OverrideDouble("CPU_SHARE", config.limits.cpu_share);
    OverrideInt("PIDS_LIMIT", config.limits.pids_limit);
    OverrideInt("DISK_LIMIT_MB", config.limits.scratch_mb);
    OverrideInt("EXECUTION_TIMEOUT", config.limits.execution_timeout_s);

    OverrideInt("MAX_FAILED_ATTEMPTS", config.guard.max_failed_attempts);
    OverrideInt("BRUTE_FORCE_COOLDOWN", config.guard.cooldown_s);
    OverrideInt("AUTH_FAILURE_DELAY_MS", config.guard.failure_delay_ms);

    OverrideString("DOCKER_IMAGE", config.sandbox.image);
    OverrideString("DOCKER_SOCKET", config.sandbox.docker_socket);
    OverrideString("WORKSPACE_ROOT", config.sandbox.workspace_root);

    OverrideString("STUDENTS_FILE", config.credentials.students_file);
}

Config LoadConfigFrom(const std::filesystem::path& path) {
    Config config{};

    if (std::filesystem::exists(path)) {
        try {
            std::ifstream input(path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            utils::LogWarn("system", "Ignoring unreadable config " + path.string() + ": " + ex.what());
        }
    }

    ApplyEnvironment(config);
    return config;
}

Config LoadConfig() {
    return LoadConfigFrom(GetConfigPath());
}

}  // namespace runbox::config

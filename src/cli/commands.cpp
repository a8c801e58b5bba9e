#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "admission/admission_controller.hpp"
#include "auth/authenticator.hpp"
#include "auth/credential_store.hpp"
#include "auth/secret_hash.hpp"
#include "config/config_loader.hpp"
#include "guard/abuse_guard.hpp"
#include "sandbox/docker_client.hpp"
#include "sandbox/docker_sandbox.hpp"
#include "server/server.hpp"
#include "session/session_handler.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace {

std::atomic<bool> g_running{true};
volatile std::sig_atomic_t g_signal = 0;

constexpr std::chrono::seconds kShutdownGrace{30};

void HandleSignal(int signal) {
    g_signal = signal;
}

void InstallSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
    std::signal(SIGPIPE, SIG_IGN);
}

void ApplyLogLevel(const runbox::config::Config& config) {
    runbox::utils::LogConfig log_config;
    log_config.min_level = runbox::utils::ParseLogLevel(config.server.log_level,
                                                        runbox::utils::LogLevel::kInfo);
    runbox::utils::ConfigureLogging(log_config);
}

std::shared_ptr<runbox::sandbox::DockerClient> MakeDockerClient(const runbox::config::Config& config) {
    return std::make_shared<runbox::sandbox::DockerClient>(config.sandbox.docker_socket,
                                                           config.sandbox.api_version);
}

bool EnsureImage(runbox::sandbox::DockerClient& docker, const std::string& image) {
    try {
        if (docker.ImageExists(image)) {
            return true;
        }
        runbox::utils::LogInfo("system", "Image " + image + " not found locally, pulling");
        docker.PullImage(image);
        return true;
    } catch (const runbox::sandbox::DockerError& ex) {
        runbox::utils::LogError("system", std::string("Cannot prepare image: ") + ex.what());
        return false;
    }
}

int RunServe() {
    const auto config = runbox::config::LoadConfig();
    ApplyLogLevel(config);

    auto docker = MakeDockerClient(config);
    if (!docker->Ping()) {
        runbox::utils::LogError("system", "Docker engine not reachable at " + config.sandbox.docker_socket);
        return 1;
    }
    if (!EnsureImage(*docker, config.sandbox.image)) {
        return 1;
    }

    runbox::guard::AbuseGuard guard(config.guard.max_failed_attempts,
                                    std::chrono::seconds(config.guard.cooldown_s));
    runbox::auth::Authenticator authenticator(
        guard,
        runbox::auth::CredentialStore(config.credentials.students_file),
        std::chrono::milliseconds(config.guard.failure_delay_ms));
    runbox::admission::AdmissionController admission(
        static_cast<std::size_t>(std::max(1, config.limits.max_concurrent_sessions)));
    runbox::sandbox::DockerProvisioner provisioner(docker,
                                                   runbox::sandbox::PolicyFromConfig(config),
                                                   config.sandbox.workspace_root);

    runbox::session::WatchdogOptions options;
    options.timeout = std::chrono::seconds(config.limits.execution_timeout_s);
    options.poll_interval = std::chrono::milliseconds(config.sandbox.poll_interval_ms);
    options.drain_grace = std::chrono::milliseconds(config.sandbox.drain_grace_ms);
    options.memory_mb = config.limits.memory_mb;
    runbox::session::SessionHandler handler(admission, authenticator, provisioner, options);

    InstallSignalHandlers();
    runbox::server::Server server(config.server, authenticator, handler);
    try {
        server.Start();
    } catch (const std::exception& ex) {
        runbox::utils::LogError("system", std::string("Failed to start server: ") + ex.what());
        return 1;
    }

    runbox::utils::LogInfo("system", "runbox started (max " + std::to_string(admission.Capacity())
                                         + " sessions, image " + config.sandbox.image + "). Press Ctrl+C to stop.");

    bool shutdown_guard_started = false;
    while (g_running.load()) {
        if (g_signal != 0) {
            g_running.store(false);
            if (!shutdown_guard_started) {
                shutdown_guard_started = true;
                std::thread([] {
                    std::this_thread::sleep_for(kShutdownGrace);
                    std::_Exit(130);
                }).detach();
            }
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    runbox::utils::LogInfo("system", "Shutting down");
    server.Stop();
    return 0;
}

int RunHashSecrets() {
    std::string line;
    int hashed = 0;
    while (std::getline(std::cin, line)) {
        const auto trimmed = runbox::utils::Trim(line);
        if (trimmed.empty() || trimmed.front() == '#') {
            continue;
        }
        const auto entry = runbox::auth::ParseCredentialLine(trimmed);
        if (!entry) {
            std::cerr << "Skipping malformed line: " << trimmed << std::endl;
            continue;
        }
        if (runbox::auth::IsHashedSecret(entry->secret)) {
            std::cout << entry->identity << ":" << entry->secret << "\n";
        } else {
            std::cout << entry->identity << ":" << runbox::auth::HashSecret(entry->secret) << "\n";
        }
        ++hashed;
    }
    std::cout.flush();
    std::cerr << "Processed " << hashed << " credential(s)." << std::endl;
    return 0;
}

int RunCleanup() {
    const auto config = runbox::config::LoadConfig();
    ApplyLogLevel(config);
    auto docker = MakeDockerClient(config);
    try {
        const auto ids = docker->ListContainers(runbox::sandbox::kSessionLabel);
        for (const auto& id : ids) {
            docker->RemoveContainer(id, true);
            std::cout << "Removed " << id.substr(0, 12) << std::endl;
        }
        std::cout << ids.size() << " leftover container(s) removed." << std::endl;
    } catch (const runbox::sandbox::DockerError& ex) {
        std::cerr << "Cleanup failed: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}

void PrintUsage() {
    std::cout << "Usage: runbox serve | runbox hash-secrets < plain.txt > hashed.txt | runbox cleanup"
              << std::endl;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 1;
    }
    const std::string command = argv[1];
    try {
        if (command == "serve") {
            return RunServe();
        }
        if (command == "hash-secrets") {
            return RunHashSecrets();
        }
        if (command == "cleanup") {
            return RunCleanup();
        }
    } catch (const std::exception& ex) {
        std::cerr << "runbox " << command << " failed: " << ex.what() << std::endl;
        return 1;
    }
    PrintUsage();
    return 1;
}

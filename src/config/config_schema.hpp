#pragma once

#include <string>

namespace runbox::config {

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8000;
    int io_threads = 2;
    std::string log_level = "info";
};

struct LimitsConfig {
    int max_concurrent_sessions = 10;
    int memory_mb = 48;
    double cpu_share = 0.20;
    int pids_limit = 15;
    int scratch_mb = 10;
    int execution_timeout_s = 300;
};

struct GuardConfig {
    int max_failed_attempts = 5;
    int cooldown_s = 600;
    int failure_delay_ms = 1000;
};

struct SandboxConfig {
    std::string image = "python:3.14-alpine";
    std::string docker_socket = "/var/run/docker.sock";
    std::string api_version = "v1.41";
    std::string user = "65534:65534";
    std::string workspace_root;
    int poll_interval_ms = 200;
    int drain_grace_ms = 2000;
};

struct CredentialsConfig {
    std::string students_file = "students.txt";
};

struct Config {
    ServerConfig server;
    LimitsConfig limits;
    GuardConfig guard;
    SandboxConfig sandbox;
    CredentialsConfig credentials;
};

}  // namespace runbox::config

#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"
#include "sandbox/docker_client.hpp"
#include "sandbox/sandbox.hpp"

namespace runbox::sandbox {

constexpr const char* kSessionLabel = "runbox.session";
constexpr const char* kContainerScriptPath = "/app/script.py";

struct SandboxPolicy {
    std::string image = "python:3.14-alpine";
    std::string user = "65534:65534";
    int memory_mb = 48;
    double cpu_share = 0.20;
    int pids_limit = 15;
    int scratch_mb = 10;
};

SandboxPolicy PolicyFromConfig(const config::Config& config);

// Engine request body for one session container; every limit is fixed here.
nlohmann::json BuildContainerBody(const SandboxPolicy& policy,
                                  const std::filesystem::path& host_script,
                                  const std::string& session_label);

class DockerSandbox : public Sandbox {
public:
    static constexpr std::chrono::milliseconds kInputWriteBudget{50};

    DockerSandbox(std::shared_ptr<DockerClient> client,
                  std::string container_id,
                  std::unique_ptr<AttachedStream> stream);
    ~DockerSandbox() override;

    std::string Id() const override;
    std::size_t ReadOutput(char* buffer, std::size_t size) override;
    void WriteInput(const std::string& data) override;
    void FlushInput() override;
    bool IsRunning() override;
    void Kill() override;
    ExitState Inspect() override;
    std::string FetchLogs() override;
    void CloseStream() override;
    void Destroy() override;

private:
    std::shared_ptr<DockerClient> client_;
    std::string container_id_;
    std::unique_ptr<AttachedStream> stream_;
    std::atomic<bool> destroyed_{false};
    bool input_closed_ = false;
};

class DockerProvisioner : public SandboxProvisioner {
public:
    DockerProvisioner(std::shared_ptr<DockerClient> client,
                      SandboxPolicy policy,
                      std::filesystem::path workspace_root);

    std::unique_ptr<EphemeralWorkspace> PrepareWorkspace(const std::string& program) override;
    std::unique_ptr<Sandbox> Provision(const EphemeralWorkspace& workspace,
                                       const std::string& session_label) override;

private:
    std::shared_ptr<DockerClient> client_;
    SandboxPolicy policy_;
    std::filesystem::path workspace_root_;
};

}  // namespace runbox::sandbox

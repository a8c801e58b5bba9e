#include "sandbox/docker_sandbox.hpp"

#include <cmath>

#include "utils/logging.hpp"

namespace runbox::sandbox {
namespace {

constexpr long long kMiB = 1024LL * 1024LL;

std::string ShortId(const std::string& id) {
    return id.substr(0, 12);
}

}  // namespace

SandboxPolicy PolicyFromConfig(const config::Config& config) {
    SandboxPolicy policy;
    policy.image = config.sandbox.image;
    policy.user = config.sandbox.user;
    policy.memory_mb = config.limits.memory_mb;
    policy.cpu_share = config.limits.cpu_share;
    policy.pids_limit = config.limits.pids_limit;
    policy.scratch_mb = config.limits.scratch_mb;
    return policy;
}

nlohmann::json BuildContainerBody(const SandboxPolicy& policy,
                                  const std::filesystem::path& host_script,
                                  const std::string& session_label) {
    const long long memory = static_cast<long long>(policy.memory_mb) * kMiB;
    const auto tmpfs_options = "size=" + std::to_string(policy.scratch_mb) + "m,mode=1777";

    nlohmann::json host_config = {
        {"Memory", memory},
        // Equal to Memory: no swap on top of the ceiling.
        {"MemorySwap", memory},
        {"NanoCpus", static_cast<long long>(std::llround(policy.cpu_share * 1e9))},
        {"PidsLimit", policy.pids_limit},
        {"ReadonlyRootfs", true},
        {"Tmpfs", {{"/app", tmpfs_options}, {"/tmp", tmpfs_options}}},
        {"Binds", nlohmann::json::array({host_script.string() + ":" + kContainerScriptPath + ":ro"})},
        {"NetworkMode", "none"},
        {"CapDrop", nlohmann::json::array({"ALL"})},
        {"SecurityOpt", nlohmann::json::array({"no-new-privileges"})}
    };

    return {
        {"Image", policy.image},
        {"Cmd", nlohmann::json::array({"python3", "-u", kContainerScriptPath})},
        {"WorkingDir", "/app"},
        {"User", policy.user},
        {"Env", nlohmann::json::array({"PYTHONIOENCODING=utf-8", "PYTHON_COLORS=0"})},
        {"Tty", true},
        {"OpenStdin", true},
        {"StdinOnce", false},
        {"AttachStdin", true},
        {"AttachStdout", true},
        {"AttachStderr", true},
        {"NetworkDisabled", true},
        {"Labels", {{kSessionLabel, session_label}}},
        {"HostConfig", host_config}
    };
}

DockerSandbox::DockerSandbox(std::shared_ptr<DockerClient> client,
                             std::string container_id,
                             std::unique_ptr<AttachedStream> stream)
    : client_(std::move(client))
    , container_id_(std::move(container_id))
    , stream_(std::move(stream)) {}

DockerSandbox::~DockerSandbox() {
    try {
        Destroy();
    } catch (const std::exception& ex) {
        utils::LogError("system", "Failed to remove container " + ShortId(container_id_) + ": " + ex.what());
    }
}

std::string DockerSandbox::Id() const {
    return ShortId(container_id_);
}

std::size_t DockerSandbox::ReadOutput(char* buffer, std::size_t size) {
    return stream_->Read(buffer, size);
}

void DockerSandbox::WriteInput(const std::string& data) {
    const auto accepted = stream_->Write(data, kInputWriteBudget);
    if (accepted < data.size()) {
        utils::LogWarn("system", "MISBEHAVIOR: input backlog full for " + Id() + ", dropped "
                                     + std::to_string(data.size() - accepted) + " bytes");
    }
}

void DockerSandbox::FlushInput() {
    if (!stream_->Flush(std::chrono::milliseconds(0)) && !input_closed_) {
        input_closed_ = true;
        utils::LogDebug("system", "Input stream closed for " + Id());
    }
}

bool DockerSandbox::IsRunning() {
    try {
        const auto state = Inspect();
        return state.running;
    } catch (const DockerError& ex) {
        if (ex.Status() == 404) {
            return false;
        }
        throw;
    }
}

void DockerSandbox::Kill() {
    client_->KillContainer(container_id_);
}

ExitState DockerSandbox::Inspect() {
    const auto json = client_->InspectContainer(container_id_);
    ExitState state;
    if (json.contains("State") && json["State"].is_object()) {
        const auto& s = json["State"];
        state.running = s.value("Running", false);
        state.exit_code = s.value("ExitCode", -1);
        state.oom_killed = s.value("OOMKilled", false);
    }
    return state;
}

std::string DockerSandbox::FetchLogs() {
    return client_->ContainerLogs(container_id_);
}

void DockerSandbox::CloseStream() {
    stream_->Shutdown();
}

void DockerSandbox::Destroy() {
    if (destroyed_.exchange(true)) {
        return;
    }
    stream_->Shutdown();
    client_->RemoveContainer(container_id_, true);
    utils::LogDebug("system", "Removed container " + Id());
}

DockerProvisioner::DockerProvisioner(std::shared_ptr<DockerClient> client,
                                     SandboxPolicy policy,
                                     std::filesystem::path workspace_root)
    : client_(std::move(client))
    , policy_(std::move(policy))
    , workspace_root_(std::move(workspace_root)) {}

std::unique_ptr<EphemeralWorkspace> DockerProvisioner::PrepareWorkspace(const std::string& program) {
    try {
        return EphemeralWorkspace::Create(workspace_root_, program);
    } catch (const std::exception& ex) {
        throw ProvisioningFailed(ex.what());
    }
}

std::unique_ptr<Sandbox> DockerProvisioner::Provision(const EphemeralWorkspace& workspace,
                                                      const std::string& session_label) {
    std::string container_id;
    try {
        container_id = client_->CreateContainer(
            "runbox_" + session_label,
            BuildContainerBody(policy_, workspace.ScriptPath(), session_label));
        // Attach before start so the first bytes the program prints are not lost.
        auto stream = client_->Attach(container_id);
        client_->StartContainer(container_id);
        return std::make_unique<DockerSandbox>(client_, container_id, std::move(stream));
    } catch (const DockerError& ex) {
        if (!container_id.empty()) {
            try {
                client_->RemoveContainer(container_id, true);
            } catch (const DockerError& cleanup) {
                utils::LogError("system", "Failed to remove half-started container "
                                              + ShortId(container_id) + ": " + cleanup.what());
            }
        }
        throw ProvisioningFailed(ex.what());
    }
}

}  // namespace runbox::sandbox

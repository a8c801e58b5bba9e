#pragma once

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>

#include "sandbox/workspace.hpp"

namespace runbox::sandbox {

struct ExitState {
    bool running = false;
    int exit_code = -1;
    bool oom_killed = false;
};

class ProvisioningFailed : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Handle to one running, isolated program. Thread-safe: the output relay reads
// while the session thread writes, polls and kills.
class Sandbox {
public:
    virtual ~Sandbox() = default;

    virtual std::string Id() const = 0;

    // Blocks until output is available. Returns 0 at end of stream or on error.
    virtual std::size_t ReadOutput(char* buffer, std::size_t size) = 0;
    // Bounded in time: input the program has not consumed yet stays queued.
    virtual void WriteInput(const std::string& data) = 0;
    // Pushes queued input without blocking.
    virtual void FlushInput() = 0;

    virtual bool IsRunning() = 0;
    virtual void Kill() = 0;
    virtual ExitState Inspect() = 0;
    virtual std::string FetchLogs() = 0;

    // Unblocks a pending ReadOutput.
    virtual void CloseStream() = 0;
    // Force-removes the sandbox. Safe to call more than once.
    virtual void Destroy() = 0;
};

class SandboxProvisioner {
public:
    virtual ~SandboxProvisioner() = default;

    virtual std::unique_ptr<EphemeralWorkspace> PrepareWorkspace(const std::string& program) = 0;

    // Throws ProvisioningFailed. Nothing is left behind on failure.
    virtual std::unique_ptr<Sandbox> Provision(const EphemeralWorkspace& workspace,
                                               const std::string& session_label) = 0;
};

}  // namespace runbox::sandbox

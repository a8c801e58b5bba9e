#pragma once

#include <memory>
#include <string>

#include "admission/admission_controller.hpp"
#include "auth/authenticator.hpp"
#include "sandbox/sandbox.hpp"
#include "session/client_channel.hpp"
#include "session/watchdog.hpp"

namespace runbox::session {

// Releases everything a session acquired, in reverse order, exactly once.
// Each step is independent; failures are logged and do not stop later steps.
class SessionTeardown {
public:
    explicit SessionTeardown(admission::AdmissionController& admission);
    SessionTeardown(const SessionTeardown&) = delete;
    SessionTeardown& operator=(const SessionTeardown&) = delete;
    ~SessionTeardown();

    void SetUser(const std::string& user) { user_ = user; }
    void SlotAcquired() { slot_acquired_ = true; }
    void IdentityMarked(const std::string& identity);
    void AdoptWorkspace(std::unique_ptr<sandbox::EphemeralWorkspace> workspace);
    void AdoptSandbox(std::unique_ptr<sandbox::Sandbox> box);

    sandbox::EphemeralWorkspace* Workspace() const { return workspace_.get(); }
    sandbox::Sandbox* ActiveSandbox() const { return sandbox_.get(); }

    void Run();
    bool Done() const { return done_; }

private:
    admission::AdmissionController& admission_;
    std::string user_ = "system";
    bool slot_acquired_ = false;
    std::string identity_;
    std::unique_ptr<sandbox::EphemeralWorkspace> workspace_;
    std::unique_ptr<sandbox::Sandbox> sandbox_;
    bool done_ = false;
};

class SessionHandler {
public:
    SessionHandler(admission::AdmissionController& admission,
                   auth::Authenticator& authenticator,
                   sandbox::SandboxProvisioner& provisioner,
                   WatchdogOptions options);

    // Drives one connection from the first message to the end message.
    // Never throws; the caller closes the channel afterwards.
    void Handle(ClientChannel& channel);

private:
    void Run(ClientChannel& channel, SessionTeardown& teardown, std::string& user);
    std::string NextSessionLabel();

    admission::AdmissionController& admission_;
    auth::Authenticator& authenticator_;
    sandbox::SandboxProvisioner& provisioner_;
    WatchdogOptions options_;
};

}  // namespace runbox::session

#include "session/session_handler.hpp"

#include <iomanip>
#include <random>
#include <sstream>

#include "session/io_bridge.hpp"
#include "session/protocol.hpp"
#include "session/session_error.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace runbox::session {
namespace {

void SendRejection(ClientChannel& channel, const std::string& notice) {
    channel.Send(MakeNotice(notice));
    channel.Send(MakeEndMessage(1));
}

}  // namespace

SessionTeardown::SessionTeardown(admission::AdmissionController& admission)
    : admission_(admission) {}

SessionTeardown::~SessionTeardown() {
    Run();
}

void SessionTeardown::IdentityMarked(const std::string& identity) {
    identity_ = identity;
}

void SessionTeardown::AdoptWorkspace(std::unique_ptr<sandbox::EphemeralWorkspace> workspace) {
    workspace_ = std::move(workspace);
}

void SessionTeardown::AdoptSandbox(std::unique_ptr<sandbox::Sandbox> box) {
    sandbox_ = std::move(box);
}

void SessionTeardown::Run() {
    if (done_) {
        return;
    }
    done_ = true;

    if (sandbox_) {
        try {
            sandbox_->Destroy();
        } catch (const std::exception& ex) {
            utils::LogError(user_, "Failed to remove sandbox " + sandbox_->Id() + ": " + ex.what());
        }
        sandbox_.reset();
    }
    if (workspace_) {
        try {
            workspace_->Remove();
        } catch (const std::exception& ex) {
            utils::LogError(user_, std::string("Failed to remove workspace: ") + ex.what());
        }
        workspace_.reset();
    }
    if (!identity_.empty()) {
        admission_.MarkInactive(identity_);
        identity_.clear();
    }
    if (slot_acquired_) {
        admission_.Release();
        slot_acquired_ = false;
    }
}

SessionHandler::SessionHandler(admission::AdmissionController& admission,
                               auth::Authenticator& authenticator,
                               sandbox::SandboxProvisioner& provisioner,
                               WatchdogOptions options)
    : admission_(admission)
    , authenticator_(authenticator)
    , provisioner_(provisioner)
    , options_(options) {}

std::string SessionHandler::NextSessionLabel() {
    static thread_local std::mt19937_64 engine{std::random_device{}()};
    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << engine();
    return oss.str();
}

void SessionHandler::Handle(ClientChannel& channel) {
    const auto origin = channel.Origin();
    if (!admission_.TryAcquire()) {
        utils::LogWarn("system", "Server busy (" + std::to_string(admission_.Capacity())
                                     + " sessions), rejecting " + origin);
        SendRejection(channel, CapacityNotice());
        return;
    }

    SessionTeardown teardown(admission_);
    teardown.SlotAcquired();

    std::string user = "unknown";
    try {
        Run(channel, teardown, user);
    } catch (const SessionError& ex) {
        utils::LogWarn(user, std::string(ToString(ex.Kind())) + " for " + origin + ": " + ex.what());
        SendRejection(channel, ex.what());
    } catch (const std::exception& ex) {
        utils::LogError(user, std::string("Session failed: ") + ex.what());
        SendRejection(channel, InternalErrorNotice(ex.what()));
    }
    teardown.Run();
}

void SessionHandler::Run(ClientChannel& channel, SessionTeardown& teardown, std::string& user) {
    ReceiveResult first;
    do {
        first = channel.Receive(options_.poll_interval);
    } while (first.status == ReceiveStatus::kTimeout);
    if (first.status == ReceiveStatus::kClosed) {
        utils::LogInfo("system", "Client " + channel.Origin() + " left before sending a request");
        return;
    }

    const auto request = ParseSessionRequest(first.text);
    if (!request) {
        throw SessionError(ErrorKind::kMalformedRequest, MalformedRequestNotice());
    }
    if (!request->identity.empty()) {
        user = request->identity;
        teardown.SetUser(user);
    }

    const auto auth = authenticator_.Authenticate(channel.Origin(), request->identity, request->secret);
    if (auth.status == auth::AuthStatus::kRateLimited) {
        throw SessionError(ErrorKind::kRateLimited, RateLimitNotice(auth.wait_seconds));
    }
    if (auth.status == auth::AuthStatus::kRejected) {
        authenticator_.SleepFailureDelay();
        throw SessionError(ErrorKind::kAuthenticationFailed, InvalidCredentialsNotice());
    }

    if (!admission_.MarkActive(request->identity)) {
        throw SessionError(ErrorKind::kDuplicateSession, DuplicateSessionNotice());
    }
    teardown.IdentityMarked(request->identity);

    if (utils::Trim(request->program).empty()) {
        utils::LogInfo(user, "Empty program submitted");
        return;
    }

    const auto label = NextSessionLabel();
    try {
        teardown.AdoptWorkspace(provisioner_.PrepareWorkspace(request->program));
        utils::LogInfo(user, "Spawning sandbox for session " + label);
        teardown.AdoptSandbox(provisioner_.Provision(*teardown.Workspace(), label));
    } catch (const sandbox::ProvisioningFailed& ex) {
        throw SessionError(ErrorKind::kProvisioningFailed, ProvisioningNotice(ex.what()));
    }

    auto& box = *teardown.ActiveSandbox();
    IoBridge bridge(box, channel, user);
    bridge.Start();
    Watchdog watchdog(box, channel, bridge, options_, user);
    const auto state = watchdog.Run();
    if (state == WatchState::kClientGone) {
        utils::LogInfo(user, "Client disconnected, sandbox " + box.Id() + " cancelled");
    } else {
        utils::LogInfo(user, "Session finished with exit code " + std::to_string(watchdog.ExitCode()));
    }
}

}  // namespace runbox::session

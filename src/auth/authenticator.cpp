#include "auth/authenticator.hpp"

#include <thread>

#include "utils/logging.hpp"

namespace runbox::auth {

Authenticator::Authenticator(guard::AbuseGuard& guard,
                             CredentialStore store,
                             std::chrono::milliseconds failure_delay)
    : guard_(guard)
    , store_(std::move(store))
    , failure_delay_(failure_delay) {}

AuthResult Authenticator::Authenticate(const std::string& origin,
                                       const std::string& identity,
                                       const std::string& secret) {
    const auto decision = guard_.Check(origin);
    if (!decision.allowed) {
        utils::LogWarn(identity, "Rate limited from " + origin + ", wait "
                                     + std::to_string(decision.wait_seconds) + "s");
        return {AuthStatus::kRateLimited, decision.wait_seconds};
    }

    if (!store_.Verify(identity, secret)) {
        guard_.RecordFailure(origin);
        utils::LogWarn(identity, "Invalid credentials from " + origin + " (failures: "
                                     + std::to_string(guard_.FailureCount(origin)) + ")");
        return {AuthStatus::kRejected, 0};
    }

    guard_.RecordSuccess(origin);
    return {AuthStatus::kGranted, 0};
}

void Authenticator::SleepFailureDelay() const {
    if (failure_delay_.count() > 0) {
        std::this_thread::sleep_for(failure_delay_);
    }
}

}  // namespace runbox::auth

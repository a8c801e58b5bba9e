#pragma once

#include <chrono>
#include <string>

#include "auth/credential_store.hpp"
#include "guard/abuse_guard.hpp"

namespace runbox::auth {

enum class AuthStatus {
    kGranted,
    kRateLimited,
    kRejected
};

struct AuthResult {
    AuthStatus status = AuthStatus::kRejected;
    long long wait_seconds = 0;
};

// Shared by the /login route and the session handler. A failure is recorded
// before Authenticate returns; the caller applies FailureDelay() afterwards.
class Authenticator {
public:
    Authenticator(guard::AbuseGuard& guard,
                  CredentialStore store,
                  std::chrono::milliseconds failure_delay);

    AuthResult Authenticate(const std::string& origin,
                            const std::string& identity,
                            const std::string& secret);

    std::chrono::milliseconds FailureDelay() const { return failure_delay_; }
    void SleepFailureDelay() const;

    guard::AbuseGuard& Guard() { return guard_; }

private:
    guard::AbuseGuard& guard_;
    CredentialStore store_;
    std::chrono::milliseconds failure_delay_;
};

}  // namespace runbox::auth

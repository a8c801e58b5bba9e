#pragma once

#include <stdexcept>
#include <string>

namespace runbox::session {

enum class ErrorKind {
    kCapacityExceeded,
    kRateLimited,
    kAuthenticationFailed,
    kDuplicateSession,
    kMalformedRequest,
    kProvisioningFailed,
    kExecutionTimeout,
    kResourceLimitExceeded,
    kInternalError
};

const char* ToString(ErrorKind kind);

// Rejection carrying the notice shown to the client.
class SessionError : public std::runtime_error {
public:
    SessionError(ErrorKind kind, const std::string& notice)
        : std::runtime_error(notice), kind_(kind) {}

    ErrorKind Kind() const { return kind_; }

private:
    ErrorKind kind_;
};

std::string CapacityNotice();
std::string RateLimitNotice(long long wait_seconds);
std::string InvalidCredentialsNotice();
std::string DuplicateSessionNotice();
std::string MalformedRequestNotice();
std::string ProvisioningNotice(const std::string& reason);
std::string TimeoutNotice(long long timeout_seconds);
std::string OutOfMemoryNotice(int memory_mb);
std::string ProcessLimitNotice();
std::string InternalErrorNotice(const std::string& reason);

}  // namespace runbox::session

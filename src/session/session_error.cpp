#include "session/session_error.hpp"

namespace runbox::session {

const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kCapacityExceeded: return "CapacityExceeded";
        case ErrorKind::kRateLimited: return "RateLimited";
        case ErrorKind::kAuthenticationFailed: return "AuthenticationFailed";
        case ErrorKind::kDuplicateSession: return "DuplicateSession";
        case ErrorKind::kMalformedRequest: return "MalformedRequest";
        case ErrorKind::kProvisioningFailed: return "ProvisioningFailed";
        case ErrorKind::kExecutionTimeout: return "ExecutionTimeout";
        case ErrorKind::kResourceLimitExceeded: return "ResourceLimitExceeded";
        case ErrorKind::kInternalError: return "InternalError";
    }
    return "Unknown";
}

std::string CapacityNotice() {
    return "[Server Busy] Please wait...";
}

std::string RateLimitNotice(long long wait_seconds) {
    return "[Access Denied] Wait " + std::to_string(wait_seconds) + "s.";
}

std::string InvalidCredentialsNotice() {
    return "[Access Denied] Invalid credentials.";
}

std::string DuplicateSessionNotice() {
    return "[Access Denied] User already active.";
}

std::string MalformedRequestNotice() {
    return "[Error] Malformed request.";
}

std::string ProvisioningNotice(const std::string& reason) {
    return "[Execution Error] Could not start the sandbox: " + reason;
}

std::string TimeoutNotice(long long timeout_seconds) {
    return "[Execution Timeout] Script killed after " + std::to_string(timeout_seconds) + "s.";
}

std::string OutOfMemoryNotice(int memory_mb) {
    return "[Resource Limit] Out of Memory: Script exceeded " + std::to_string(memory_mb) + "m.";
}

std::string ProcessLimitNotice() {
    return "[Resource Limit] Script terminated (Likely hit process limit).";
}

std::string InternalErrorNotice(const std::string& reason) {
    return "System Error: " + reason;
}

}  // namespace runbox::session

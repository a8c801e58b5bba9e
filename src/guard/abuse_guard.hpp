#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace runbox::guard {

struct GuardDecision {
    bool allowed = true;
    long long wait_seconds = 0;
};

// Per-origin failed-authentication counter with a cooldown window.
class AbuseGuard {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    AbuseGuard(int max_failures, std::chrono::seconds cooldown, ClockFn clock = {});

    GuardDecision Check(const std::string& origin);
    void RecordFailure(const std::string& origin);
    void RecordSuccess(const std::string& origin);

    int FailureCount(const std::string& origin) const;
    std::size_t TrackedOrigins() const;

private:
    struct AbuseRecord {
        int count = 0;
        Clock::time_point last_failure{};
    };

    Clock::time_point Now() const;

    int max_failures_;
    std::chrono::seconds cooldown_;
    ClockFn clock_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, AbuseRecord> records_;
};

}  // namespace runbox::guard

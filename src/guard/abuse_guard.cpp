#include "guard/abuse_guard.hpp"

#include <algorithm>

namespace runbox::guard {

AbuseGuard::AbuseGuard(int max_failures, std::chrono::seconds cooldown, ClockFn clock)
    : max_failures_(std::max(1, max_failures))
    , cooldown_(cooldown)
    , clock_(std::move(clock)) {}

AbuseGuard::Clock::time_point AbuseGuard::Now() const {
    return clock_ ? clock_() : Clock::now();
}

GuardDecision AbuseGuard::Check(const std::string& origin) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(origin);
    if (it == records_.end()) {
        return {};
    }
    auto& record = it->second;
    if (record.count < max_failures_) {
        return {};
    }
    const auto elapsed = Now() - record.last_failure;
    if (elapsed < cooldown_) {
        const auto remaining = std::chrono::duration_cast<std::chrono::seconds>(cooldown_ - elapsed);
        return {false, std::max<long long>(1, remaining.count())};
    }
    // Cooldown over: the origin starts from a clean slate.
    records_.erase(it);
    return {};
}

void AbuseGuard::RecordFailure(const std::string& origin) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& record = records_[origin];
    record.count += 1;
    record.last_failure = Now();
}

void AbuseGuard::RecordSuccess(const std::string& origin) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.erase(origin);
}

int AbuseGuard::FailureCount(const std::string& origin) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(origin);
    return it == records_.end() ? 0 : it->second.count;
}

std::size_t AbuseGuard::TrackedOrigins() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

}  // namespace runbox::guard

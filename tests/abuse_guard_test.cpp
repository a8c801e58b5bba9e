#include <chrono>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "guard/abuse_guard.hpp"

namespace runbox::guard {
namespace {

class AbuseGuardTest : public ::testing::Test {
protected:
    AbuseGuard MakeGuard(int max_failures = 3, std::chrono::seconds cooldown = std::chrono::seconds(600)) {
        return AbuseGuard(max_failures, cooldown, [this]() { return now_; });
    }

    AbuseGuard::Clock::time_point now_ = AbuseGuard::Clock::time_point{} + std::chrono::hours(10);
};

TEST_F(AbuseGuardTest, UnknownOriginIsAllowed) {
    auto guard = MakeGuard();
    const auto decision = guard.Check("198.51.100.1");
    EXPECT_TRUE(decision.allowed);
    EXPECT_EQ(decision.wait_seconds, 0);
}

TEST_F(AbuseGuardTest, BlocksAtThresholdWithRemainingWait) {
    auto guard = MakeGuard(3, std::chrono::seconds(600));
    for (int i = 0; i < 2; ++i) {
        guard.RecordFailure("a");
        EXPECT_TRUE(guard.Check("a").allowed);
    }
    guard.RecordFailure("a");

    now_ += std::chrono::seconds(100);
    const auto decision = guard.Check("a");
    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.wait_seconds, 500);
}

TEST_F(AbuseGuardTest, WaitIsAtLeastOneSecond) {
    auto guard = MakeGuard(1, std::chrono::seconds(10));
    guard.RecordFailure("a");
    now_ += std::chrono::milliseconds(9900);
    const auto decision = guard.Check("a");
    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.wait_seconds, 1);
}

TEST_F(AbuseGuardTest, CooldownResetsCounter) {
    auto guard = MakeGuard(2, std::chrono::seconds(60));
    guard.RecordFailure("a");
    guard.RecordFailure("a");
    EXPECT_FALSE(guard.Check("a").allowed);

    now_ += std::chrono::seconds(60);
    EXPECT_TRUE(guard.Check("a").allowed);
    EXPECT_EQ(guard.FailureCount("a"), 0);

    // A single new failure must not block again.
    guard.RecordFailure("a");
    EXPECT_TRUE(guard.Check("a").allowed);
}

TEST_F(AbuseGuardTest, SuccessClearsRecord) {
    auto guard = MakeGuard(3);
    guard.RecordFailure("a");
    guard.RecordFailure("a");
    guard.RecordSuccess("a");
    EXPECT_EQ(guard.FailureCount("a"), 0);
    EXPECT_EQ(guard.TrackedOrigins(), 0u);
}

TEST_F(AbuseGuardTest, OriginsAreIndependent) {
    auto guard = MakeGuard(1);
    guard.RecordFailure("a");
    EXPECT_FALSE(guard.Check("a").allowed);
    EXPECT_TRUE(guard.Check("b").allowed);
}

TEST_F(AbuseGuardTest, ConcurrentFailuresAreAllCounted) {
    auto guard = MakeGuard(1000);
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&guard]() {
            for (int i = 0; i < 50; ++i) {
                guard.RecordFailure("burst");
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(guard.FailureCount("burst"), 400);
}

}  // namespace
}  // namespace runbox::guard

#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "sandbox/sandbox.hpp"
#include "session/client_channel.hpp"
#include "session/io_bridge.hpp"
#include "session/session_error.hpp"

namespace runbox::session {

enum class WatchState {
    kRunning,
    kTimedOut,
    kNaturallyExited,
    kClientGone,
    kReported
};

const char* ToString(WatchState state);

struct WatchdogOptions {
    std::chrono::seconds timeout{300};
    std::chrono::milliseconds poll_interval{200};
    std::chrono::milliseconds drain_grace{2000};
    int memory_mb = 48;
};

struct Outcome {
    int exit_code = -1;
    std::optional<ErrorKind> kind;
    std::string notice;
};

// Maps the final container state to the client-facing outcome.
Outcome ClassifyOutcome(const sandbox::ExitState& state, bool timed_out, int memory_mb);

class Watchdog {
public:
    Watchdog(sandbox::Sandbox& sandbox,
             ClientChannel& channel,
             IoBridge& bridge,
             WatchdogOptions options,
             std::string user);

    // Supervises until the program exits, times out or the client leaves, then
    // reports the outcome unless the client is gone.
    WatchState Run();

    WatchState State() const { return state_; }
    int ExitCode() const { return exit_code_; }

private:
    WatchState Supervise();
    void Report(bool timed_out);

    sandbox::Sandbox& sandbox_;
    ClientChannel& channel_;
    IoBridge& bridge_;
    WatchdogOptions options_;
    std::string user_;
    WatchState state_ = WatchState::kRunning;
    int exit_code_ = -1;
};

}  // namespace runbox::session

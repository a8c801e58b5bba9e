#include "session/watchdog.hpp"

#include "session/protocol.hpp"
#include "utils/logging.hpp"

namespace runbox::session {

const char* ToString(WatchState state) {
    switch (state) {
        case WatchState::kRunning: return "running";
        case WatchState::kTimedOut: return "timed_out";
        case WatchState::kNaturallyExited: return "exited";
        case WatchState::kClientGone: return "client_gone";
        case WatchState::kReported: return "reported";
    }
    return "unknown";
}

Outcome ClassifyOutcome(const sandbox::ExitState& state, bool timed_out, int memory_mb) {
    Outcome outcome;
    outcome.exit_code = state.exit_code;
    if (state.oom_killed) {
        outcome.kind = ErrorKind::kResourceLimitExceeded;
        outcome.notice = OutOfMemoryNotice(memory_mb);
    } else if (state.exit_code == 137) {
        // SIGKILL that did not come from the timeout: the pids limit is the usual cause.
        if (timed_out) {
            outcome.kind = ErrorKind::kExecutionTimeout;
        } else {
            outcome.kind = ErrorKind::kResourceLimitExceeded;
            outcome.notice = ProcessLimitNotice();
        }
    } else if (timed_out) {
        outcome.kind = ErrorKind::kExecutionTimeout;
    }
    return outcome;
}

Watchdog::Watchdog(sandbox::Sandbox& sandbox,
                   ClientChannel& channel,
                   IoBridge& bridge,
                   WatchdogOptions options,
                   std::string user)
    : sandbox_(sandbox)
    , channel_(channel)
    , bridge_(bridge)
    , options_(options)
    , user_(std::move(user)) {}

WatchState Watchdog::Supervise() {
    const auto start = std::chrono::steady_clock::now();
    while (true) {
        if (!sandbox_.IsRunning()) {
            return WatchState::kNaturallyExited;
        }
        sandbox_.FlushInput();

        if (std::chrono::steady_clock::now() - start > options_.timeout) {
            utils::LogWarn(user_, "MISBEHAVIOR: Execution timeout after "
                                      + std::to_string(options_.timeout.count()) + "s");
            sandbox_.Kill();
            channel_.Send(MakeNotice(TimeoutNotice(options_.timeout.count())));
            return WatchState::kTimedOut;
        }

        const auto received = channel_.Receive(options_.poll_interval);
        switch (received.status) {
            case ReceiveStatus::kTimeout:
                break;
            case ReceiveStatus::kClosed:
                return WatchState::kClientGone;
            case ReceiveStatus::kMessage: {
                auto input = ParseInputMessage(received.text);
                if (input) {
                    bridge_.ForwardInput(*input);
                } else {
                    utils::LogDebug(user_, "Ignoring non-input message");
                }
                break;
            }
        }
    }
}

void Watchdog::Report(bool timed_out) {
    if (!bridge_.WaitDrained(options_.drain_grace)) {
        utils::LogDebug(user_, "Output relay still busy, cancelling");
        bridge_.Cancel();
    }

    const auto final_state = sandbox_.Inspect();
    const auto outcome = ClassifyOutcome(final_state, timed_out, options_.memory_mb);
    exit_code_ = outcome.exit_code;

    if (outcome.kind == ErrorKind::kResourceLimitExceeded) {
        if (final_state.oom_killed) {
            utils::LogWarn(user_, "MISBEHAVIOR: OOM killed (memory limit "
                                      + std::to_string(options_.memory_mb) + "m)");
        } else {
            utils::LogWarn(user_, "MISBEHAVIOR: Container killed (likely pids limit or fork bomb)");
        }
    } else if (exit_code_ != 0) {
        utils::LogInfo(user_, "Execution finished with error (exit code " + std::to_string(exit_code_) + ")");
    } else {
        utils::LogInfo(user_, "Execution finished successfully");
    }

    if (!outcome.notice.empty()) {
        channel_.Send(MakeNotice(outcome.notice));
    }

    // A program that dies before printing (syntax error, import failure) still
    // leaves its traceback in the container log.
    if (!bridge_.HasOutput() && exit_code_ != 0) {
        try {
            const auto logs = sandbox_.FetchLogs();
            if (!logs.empty()) {
                channel_.Send(MakeOutputMessage(SanitizeUtf8(logs)));
            }
        } catch (const std::exception& ex) {
            utils::LogError(user_, std::string("Failed to fetch logs: ") + ex.what());
        }
    }

    channel_.Send(MakeEndMessage(exit_code_));
}

WatchState Watchdog::Run() {
    state_ = Supervise();
    utils::LogDebug(user_, std::string("Watchdog stopped: ") + ToString(state_));
    if (state_ == WatchState::kClientGone) {
        try {
            sandbox_.Kill();
        } catch (const std::exception& ex) {
            utils::LogDebug(user_, std::string("Kill after disconnect failed: ") + ex.what());
        }
        bridge_.Cancel();
        return state_;
    }
    Report(state_ == WatchState::kTimedOut);
    state_ = WatchState::kReported;
    return state_;
}

}  // namespace runbox::session

#include "session/io_bridge.hpp"

#include "session/protocol.hpp"
#include "utils/logging.hpp"

namespace runbox::session {

IoBridge::IoBridge(sandbox::Sandbox& sandbox, ClientChannel& channel, std::string user)
    : sandbox_(sandbox)
    , channel_(channel)
    , user_(std::move(user)) {}

IoBridge::~IoBridge() {
    Cancel();
}

void IoBridge::Start() {
    if (relay_.joinable()) {
        return;
    }
    relay_ = std::thread([this]() { Relay(); });
}

void IoBridge::Relay() {
    Utf8Sanitizer sanitizer;
    char buffer[kChunkSize];
    try {
        while (true) {
            const auto n = sandbox_.ReadOutput(buffer, sizeof(buffer));
            if (n == 0) {
                break;
            }
            const auto text = sanitizer.Feed(std::string(buffer, n));
            if (text.empty()) {
                continue;
            }
            has_output_ = true;
            channel_.Send(MakeOutputMessage(text));
        }
        const auto tail = sanitizer.Flush();
        if (!tail.empty()) {
            has_output_ = true;
            channel_.Send(MakeOutputMessage(tail));
        }
    } catch (const std::exception& ex) {
        utils::LogDebug(user_, std::string("Output relay stopped: ") + ex.what());
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        finished_ = true;
    }
    cv_.notify_all();
}

void IoBridge::ForwardInput(const std::string& data) {
    sandbox_.WriteInput(data);
}

bool IoBridge::WaitDrained(std::chrono::milliseconds grace) {
    if (!relay_.joinable()) {
        return true;
    }
    bool finished = false;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        finished = cv_.wait_for(lock, grace, [this] { return finished_; });
    }
    if (finished) {
        Join();
    }
    return finished;
}

void IoBridge::Cancel() {
    if (!relay_.joinable()) {
        return;
    }
    try {
        sandbox_.CloseStream();
    } catch (const std::exception& ex) {
        utils::LogWarn(user_, std::string("Failed to close output stream: ") + ex.what());
    }
    Join();
}

void IoBridge::Join() {
    if (relay_.joinable() && relay_.get_id() != std::this_thread::get_id()) {
        relay_.join();
    }
}

}  // namespace runbox::session

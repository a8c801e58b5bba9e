#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

#include "sandbox/sandbox.hpp"
#include "session/client_channel.hpp"

namespace runbox::session {

// Relays sandbox output to the client on a dedicated thread and forwards
// client input to the sandbox.
class IoBridge {
public:
    static constexpr std::size_t kChunkSize = 1024;

    IoBridge(sandbox::Sandbox& sandbox, ClientChannel& channel, std::string user);
    IoBridge(const IoBridge&) = delete;
    IoBridge& operator=(const IoBridge&) = delete;
    ~IoBridge();

    void Start();
    void ForwardInput(const std::string& data);

    bool HasOutput() const { return has_output_; }
    // False when the relay is still running after grace.
    bool WaitDrained(std::chrono::milliseconds grace);
    void Cancel();

private:
    void Relay();
    void Join();

    sandbox::Sandbox& sandbox_;
    ClientChannel& channel_;
    std::string user_;
    std::thread relay_;
    std::atomic<bool> has_output_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
    bool finished_ = false;
};

}  // namespace runbox::session

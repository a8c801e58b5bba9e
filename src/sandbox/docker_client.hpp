#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/beast/http/verb.hpp>

#include "nlohmann/json.hpp"

namespace runbox::sandbox {

class DockerError : public std::runtime_error {
public:
    DockerError(int status, const std::string& message)
        : std::runtime_error(message), status_(status) {}

    // HTTP status from the engine, 0 when the socket itself failed.
    int Status() const { return status_; }

private:
    int status_;
};

struct DockerResponse {
    int status = 0;
    std::string body;
};

// Raw duplex stream obtained by hijacking an attach request.
class AttachedStream {
public:
    AttachedStream(int fd, std::string pending);
    AttachedStream(const AttachedStream&) = delete;
    AttachedStream& operator=(const AttachedStream&) = delete;
    ~AttachedStream();

    static constexpr std::size_t kMaxPendingInput = 1024 * 1024;

    std::size_t Read(char* buffer, std::size_t size);

    // Queues data behind any unsent input and sends for at most budget; never
    // blocks longer. Input that would grow the backlog past kMaxPendingInput is
    // dropped. Returns the number of bytes accepted.
    std::size_t Write(const std::string& data, std::chrono::milliseconds budget);
    // Sends queued input for at most budget. False once the peer is gone.
    bool Flush(std::chrono::milliseconds budget);
    std::size_t PendingInput() const;

    // Wakes a blocked Read. The descriptor stays open until destruction.
    void Shutdown();

private:
    bool FlushLocked(std::chrono::milliseconds budget);

    int fd_;
    std::string pending_;
    std::mutex pending_mutex_;
    std::string outgoing_;
    mutable std::mutex write_mutex_;
    bool broken_ = false;
    std::atomic<bool> shut_{false};
};

// Docker Engine API over the local UNIX socket, one connection per request.
class DockerClient {
public:
    DockerClient(std::string socket_path, std::string api_version);

    bool Ping();

    std::string CreateContainer(const std::string& name, const nlohmann::json& body);
    std::unique_ptr<AttachedStream> Attach(const std::string& id);
    void StartContainer(const std::string& id);
    nlohmann::json InspectContainer(const std::string& id);
    void KillContainer(const std::string& id);
    void RemoveContainer(const std::string& id, bool force);
    std::string ContainerLogs(const std::string& id);
    std::vector<std::string> ListContainers(const std::string& label);

    bool ImageExists(const std::string& image);
    void PullImage(const std::string& image);

    const std::string& SocketPath() const { return socket_path_; }

private:
    DockerResponse Request(boost::beast::http::verb method,
                           const std::string& path,
                           const std::string& body = {});
    std::string Target(const std::string& path) const;

    std::string socket_path_;
    std::string api_version_;
};

std::string UrlEncode(const std::string& value);
// Removes the 8-byte stream headers from a non-TTY log body; TTY logs pass through.
std::string StripStreamFrames(const std::string& data);
std::string DockerErrorMessage(const DockerResponse& response);

}  // namespace runbox::sandbox

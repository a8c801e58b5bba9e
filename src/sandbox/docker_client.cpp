#include "sandbox/docker_client.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <iomanip>
#include <sstream>

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "utils/logging.hpp"

namespace runbox::sandbox {
namespace {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using Socket = net::local::stream_protocol::socket;

constexpr std::uint64_t kBodyLimit = 64ULL * 1024 * 1024;
constexpr const char* kHostHeader = "docker";
constexpr const char* kUserAgent = "runbox";

void Connect(Socket& socket, const std::string& path) {
    socket.connect(net::local::stream_protocol::endpoint(path));
}

std::pair<std::string, std::string> SplitImageTag(const std::string& image) {
    const auto colon = image.rfind(':');
    const auto slash = image.rfind('/');
    if (colon == std::string::npos || (slash != std::string::npos && slash > colon)) {
        return {image, "latest"};
    }
    return {image.substr(0, colon), image.substr(colon + 1)};
}

// Multiplexed log frames: 1 byte stream id, 3 zero bytes, 4 byte big-endian length.
bool LooksMultiplexed(const std::string& data) {
    return data.size() >= 8 && static_cast<unsigned char>(data[0]) <= 2
        && data[1] == '\0' && data[2] == '\0' && data[3] == '\0';
}

}  // namespace

std::string StripStreamFrames(const std::string& data) {
    if (!LooksMultiplexed(data)) {
        return data;
    }
    std::string out;
    std::size_t pos = 0;
    while (pos + 8 <= data.size()) {
        std::size_t length = 0;
        for (std::size_t k = 4; k < 8; ++k) {
            length = (length << 8) | static_cast<unsigned char>(data[pos + k]);
        }
        pos += 8;
        const auto take = std::min(length, data.size() - pos);
        out.append(data, pos, take);
        pos += take;
    }
    return out;
}

std::string UrlEncode(const std::string& value) {
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << std::setfill('0')
                    << static_cast<int>(c);
        }
    }
    return encoded.str();
}

std::string DockerErrorMessage(const DockerResponse& response) {
    auto json = nlohmann::json::parse(response.body, nullptr, false);
    if (json.is_object() && json.contains("message") && json["message"].is_string()) {
        return json["message"].get<std::string>();
    }
    if (!response.body.empty()) {
        return response.body;
    }
    return "HTTP " + std::to_string(response.status);
}

AttachedStream::AttachedStream(int fd, std::string pending)
    : fd_(fd)
    , pending_(std::move(pending)) {}

AttachedStream::~AttachedStream() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

std::size_t AttachedStream::Read(char* buffer, std::size_t size) {
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (!pending_.empty()) {
            const auto take = std::min(size, pending_.size());
            std::memcpy(buffer, pending_.data(), take);
            pending_.erase(0, take);
            return take;
        }
    }
    if (shut_) {
        return 0;
    }
    while (true) {
        const auto n = ::read(fd_, buffer, size);
        if (n > 0) {
            return static_cast<std::size_t>(n);
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        return 0;
    }
}

std::size_t AttachedStream::Write(const std::string& data, std::chrono::milliseconds budget) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (shut_ || broken_) {
        return 0;
    }
    const auto room = kMaxPendingInput - std::min(kMaxPendingInput, outgoing_.size());
    const auto accepted = std::min(room, data.size());
    outgoing_.append(data, 0, accepted);
    FlushLocked(budget);
    return accepted;
}

bool AttachedStream::Flush(std::chrono::milliseconds budget) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    return FlushLocked(budget);
}

std::size_t AttachedStream::PendingInput() const {
    std::lock_guard<std::mutex> lock(write_mutex_);
    return outgoing_.size();
}

bool AttachedStream::FlushLocked(std::chrono::milliseconds budget) {
    const auto deadline = std::chrono::steady_clock::now() + budget;
    while (!outgoing_.empty()) {
        if (shut_ || broken_) {
            outgoing_.clear();
            return false;
        }
        const auto n = ::send(fd_, outgoing_.data(), outgoing_.size(), MSG_NOSIGNAL | MSG_DONTWAIT);
        if (n > 0) {
            outgoing_.erase(0, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                return true;
            }
            pollfd pfd{};
            pfd.fd = fd_;
            pfd.events = POLLOUT;
            if (::poll(&pfd, 1, static_cast<int>(remaining.count())) < 0 && errno != EINTR) {
                broken_ = true;
            }
            continue;
        }
        broken_ = true;
    }
    return !broken_;
}

void AttachedStream::Shutdown() {
    if (shut_.exchange(true)) {
        return;
    }
    ::shutdown(fd_, SHUT_RDWR);
}

DockerClient::DockerClient(std::string socket_path, std::string api_version)
    : socket_path_(std::move(socket_path))
    , api_version_(std::move(api_version)) {}

std::string DockerClient::Target(const std::string& path) const {
    if (api_version_.empty()) {
        return path;
    }
    return "/" + api_version_ + path;
}

DockerResponse DockerClient::Request(http::verb method,
                                     const std::string& path,
                                     const std::string& body) {
    try {
        net::io_context ioc;
        Socket socket(ioc);
        Connect(socket, socket_path_);

        http::request<http::string_body> req{method, Target(path), 11};
        req.set(http::field::host, kHostHeader);
        req.set(http::field::user_agent, kUserAgent);
        if (!body.empty()) {
            req.set(http::field::content_type, "application/json");
            req.body() = body;
        }
        req.prepare_payload();
        http::write(socket, req);

        beast::flat_buffer buffer;
        http::response_parser<http::string_body> parser;
        parser.body_limit(kBodyLimit);
        http::read(socket, buffer, parser);

        boost::system::error_code ec;
        socket.shutdown(Socket::shutdown_both, ec);

        DockerResponse response;
        response.status = static_cast<int>(parser.get().result_int());
        response.body = parser.get().body();
        return response;
    } catch (const boost::system::system_error& ex) {
        throw DockerError(0, "docker engine unreachable at " + socket_path_ + ": " + ex.what());
    }
}

bool DockerClient::Ping() {
    try {
        return Request(http::verb::get, "/_ping").status == 200;
    } catch (const DockerError&) {
        return false;
    }
}

std::string DockerClient::CreateContainer(const std::string& name, const nlohmann::json& body) {
    const auto response = Request(http::verb::post,
                                  "/containers/create?name=" + UrlEncode(name),
                                  body.dump());
    if (response.status != 201) {
        throw DockerError(response.status, "create failed: " + DockerErrorMessage(response));
    }
    auto json = nlohmann::json::parse(response.body, nullptr, false);
    if (!json.is_object() || !json.contains("Id") || !json["Id"].is_string()) {
        throw DockerError(response.status, "create returned no container id");
    }
    return json["Id"].get<std::string>();
}

std::unique_ptr<AttachedStream> DockerClient::Attach(const std::string& id) {
    try {
        net::io_context ioc;
        Socket socket(ioc);
        Connect(socket, socket_path_);

        http::request<http::empty_body> req{
            http::verb::post,
            Target("/containers/" + id + "/attach?stream=1&stdin=1&stdout=1&stderr=1"),
            11};
        req.set(http::field::host, kHostHeader);
        req.set(http::field::user_agent, kUserAgent);
        req.set(http::field::connection, "Upgrade");
        req.set(http::field::upgrade, "tcp");
        req.prepare_payload();
        http::write(socket, req);

        beast::flat_buffer buffer;
        http::response_parser<http::empty_body> parser;
        http::read_header(socket, buffer, parser);
        const auto status = static_cast<int>(parser.get().result_int());
        if (status != 101 && status != 200) {
            throw DockerError(status, "attach failed with HTTP " + std::to_string(status));
        }

        // Bytes already buffered past the header belong to the program's output.
        auto pending = beast::buffers_to_string(buffer.data());
        const int fd = ::dup(socket.native_handle());
        if (fd < 0) {
            throw DockerError(0, "dup failed: " + std::string(std::strerror(errno)));
        }
        return std::make_unique<AttachedStream>(fd, std::move(pending));
    } catch (const boost::system::system_error& ex) {
        throw DockerError(0, "attach failed: " + std::string(ex.what()));
    }
}

void DockerClient::StartContainer(const std::string& id) {
    const auto response = Request(http::verb::post, "/containers/" + id + "/start");
    if (response.status != 204 && response.status != 304) {
        throw DockerError(response.status, "start failed: " + DockerErrorMessage(response));
    }
}

nlohmann::json DockerClient::InspectContainer(const std::string& id) {
    const auto response = Request(http::verb::get, "/containers/" + id + "/json");
    if (response.status != 200) {
        throw DockerError(response.status, "inspect failed: " + DockerErrorMessage(response));
    }
    auto json = nlohmann::json::parse(response.body, nullptr, false);
    if (json.is_discarded()) {
        throw DockerError(response.status, "inspect returned invalid JSON");
    }
    return json;
}

void DockerClient::KillContainer(const std::string& id) {
    const auto response = Request(http::verb::post, "/containers/" + id + "/kill");
    // 409: already stopped.
    if (response.status != 204 && response.status != 409) {
        throw DockerError(response.status, "kill failed: " + DockerErrorMessage(response));
    }
}

void DockerClient::RemoveContainer(const std::string& id, bool force) {
    const auto response = Request(http::verb::delete_,
                                  "/containers/" + id + (force ? "?force=true" : ""));
    // 404: already gone. 409: removal already in progress.
    if (response.status != 204 && response.status != 404 && response.status != 409) {
        throw DockerError(response.status, "remove failed: " + DockerErrorMessage(response));
    }
}

std::string DockerClient::ContainerLogs(const std::string& id) {
    const auto response = Request(http::verb::get,
                                  "/containers/" + id + "/logs?stdout=1&stderr=1");
    if (response.status != 200) {
        throw DockerError(response.status, "logs failed: " + DockerErrorMessage(response));
    }
    return StripStreamFrames(response.body);
}

std::vector<std::string> DockerClient::ListContainers(const std::string& label) {
    const nlohmann::json filters = {{"label", nlohmann::json::array({label})}};
    const auto response = Request(http::verb::get,
                                  "/containers/json?all=1&filters=" + UrlEncode(filters.dump()));
    if (response.status != 200) {
        throw DockerError(response.status, "list failed: " + DockerErrorMessage(response));
    }
    std::vector<std::string> ids;
    auto json = nlohmann::json::parse(response.body, nullptr, false);
    if (!json.is_array()) {
        return ids;
    }
    for (const auto& item : json) {
        if (item.contains("Id") && item["Id"].is_string()) {
            ids.push_back(item["Id"].get<std::string>());
        }
    }
    return ids;
}

bool DockerClient::ImageExists(const std::string& image) {
    const auto response = Request(http::verb::get, "/images/" + image + "/json");
    if (response.status == 404) {
        return false;
    }
    if (response.status != 200) {
        throw DockerError(response.status, "image inspect failed: " + DockerErrorMessage(response));
    }
    return true;
}

void DockerClient::PullImage(const std::string& image) {
    const auto parts = SplitImageTag(image);
    const auto response = Request(http::verb::post,
                                  "/images/create?fromImage=" + UrlEncode(parts.first)
                                      + "&tag=" + UrlEncode(parts.second));
    if (response.status != 200) {
        throw DockerError(response.status, "pull failed: " + DockerErrorMessage(response));
    }
    // Progress is streamed as JSON lines; a failure shows up as an "error" entry.
    std::istringstream lines(response.body);
    std::string line;
    while (std::getline(lines, line)) {
        auto json = nlohmann::json::parse(line, nullptr, false);
        if (json.is_object() && json.contains("error") && json["error"].is_string()) {
            throw DockerError(response.status, "pull failed: " + json["error"].get<std::string>());
        }
    }
    utils::LogInfo("system", "Pulled image " + image);
}

}  // namespace runbox::sandbox

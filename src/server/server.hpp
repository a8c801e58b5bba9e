#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include "auth/authenticator.hpp"
#include "config/config_schema.hpp"
#include "server/http_session.hpp"
#include "server/listener.hpp"
#include "server/websocket_channel.hpp"
#include "session/session_handler.hpp"

namespace runbox::server {

// Runs the HTTP/WebSocket gateway on a small I/O pool and one thread per
// open session.
class Server {
public:
    Server(const config::ServerConfig& config,
           auth::Authenticator& authenticator,
           session::SessionHandler& handler);
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    ~Server();

    void Start();
    // Stops accepting, closes every open channel and waits for sessions to tear down.
    void Stop();

    unsigned short Port() const;
    std::size_t LiveSessions() const;

private:
    void OnChannelOpen(std::shared_ptr<WebSocketChannel> channel);
    void RunSession(std::shared_ptr<WebSocketChannel> channel);

    config::ServerConfig config_;
    session::SessionHandler& handler_;
    GatewayRoutes routes_;

    boost::asio::io_context ioc_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
    std::shared_ptr<Listener> listener_;
    std::vector<std::thread> io_threads_;

    mutable std::mutex sessions_mutex_;
    std::condition_variable sessions_cv_;
    std::size_t live_sessions_ = 0;
    std::vector<std::weak_ptr<WebSocketChannel>> channels_;
    bool running_ = false;
    bool stopping_ = false;
};

}  // namespace runbox::server

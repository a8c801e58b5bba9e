#include "server/server.hpp"

#include <algorithm>

#include <boost/asio/ip/address.hpp>

#include "utils/logging.hpp"

namespace runbox::server {

Server::Server(const config::ServerConfig& config,
               auth::Authenticator& authenticator,
               session::SessionHandler& handler)
    : config_(config)
    , handler_(handler)
    , routes_{authenticator, [this](std::shared_ptr<WebSocketChannel> channel) {
                  OnChannelOpen(std::move(channel));
              }}
    , ioc_(std::max(1, config.io_threads)) {}

Server::~Server() {
    Stop();
}

void Server::Start() {
    if (running_) {
        return;
    }
    const auto address = boost::asio::ip::make_address(config_.host);
    const boost::asio::ip::tcp::endpoint endpoint{address, static_cast<unsigned short>(config_.port)};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, routes_);
    work_.emplace(boost::asio::make_work_guard(ioc_));
    listener_->Run();

    const int threads = std::max(1, config_.io_threads);
    io_threads_.reserve(static_cast<std::size_t>(threads));
    for (int i = 0; i < threads; ++i) {
        io_threads_.emplace_back([this]() { ioc_.run(); });
    }
    running_ = true;
    utils::LogInfo("system", "Listening on " + config_.host + ":" + std::to_string(listener_->Port()));
}

void Server::OnChannelOpen(std::shared_ptr<WebSocketChannel> channel) {
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        if (stopping_) {
            channel->Close();
            return;
        }
        ++live_sessions_;
        channels_.erase(std::remove_if(channels_.begin(), channels_.end(),
                                       [](const std::weak_ptr<WebSocketChannel>& item) {
                                           return item.expired();
                                       }),
                        channels_.end());
        channels_.push_back(channel);
    }
    // Sessions block on Docker and on their client; keep them off the I/O threads.
    std::thread([this, channel]() { RunSession(channel); }).detach();
}

void Server::RunSession(std::shared_ptr<WebSocketChannel> channel) {
    handler_.Handle(*channel);
    channel->Close();
    // Notify under the lock: once Stop() sees zero it may destroy the Server.
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    --live_sessions_;
    sessions_cv_.notify_all();
}

void Server::Stop() {
    if (!running_) {
        return;
    }
    running_ = false;

    std::vector<std::shared_ptr<WebSocketChannel>> open;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        stopping_ = true;
        for (const auto& item : channels_) {
            if (auto channel = item.lock()) {
                open.push_back(std::move(channel));
            }
        }
        channels_.clear();
    }
    listener_->Stop();
    for (const auto& channel : open) {
        channel->Close();
    }

    {
        std::unique_lock<std::mutex> lock(sessions_mutex_);
        if (live_sessions_ > 0) {
            utils::LogInfo("system", "Waiting for " + std::to_string(live_sessions_) + " session(s) to finish");
        }
        sessions_cv_.wait(lock, [this] { return live_sessions_ == 0; });
    }

    work_.reset();
    ioc_.stop();
    for (auto& thread : io_threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    io_threads_.clear();
    utils::LogInfo("system", "Server stopped");
}

unsigned short Server::Port() const {
    return listener_ ? listener_->Port() : static_cast<unsigned short>(config_.port);
}

std::size_t Server::LiveSessions() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return live_sessions_;
}

}  // namespace runbox::server

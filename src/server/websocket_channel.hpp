#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "session/client_channel.hpp"

namespace runbox::server {

// ClientChannel over an accepted WebSocket. All socket I/O runs on the
// connection's strand; session threads talk to it through the inbox and the
// write queue.
class WebSocketChannel : public session::ClientChannel,
                         public std::enable_shared_from_this<WebSocketChannel> {
public:
    using OpenHandler = std::function<void(std::shared_ptr<WebSocketChannel>)>;
    using Request = boost::beast::http::request<boost::beast::http::string_body>;

    static constexpr std::size_t kMaxMessageBytes = 1024 * 1024;
    static constexpr std::size_t kMaxQueuedBytes = 1024 * 1024;
    static constexpr std::chrono::milliseconds kSendStall{10000};

    WebSocketChannel(boost::asio::ip::tcp::socket&& socket, std::string origin);

    // Completes the upgrade, then hands the open channel to on_open.
    void Accept(Request request, OpenHandler on_open);

    // Blocks while more than the queue limit waits for the client. A client that
    // stays that far behind for the whole stall period is disconnected.
    void Send(const nlohmann::json& message) override;
    session::ReceiveResult Receive(std::chrono::milliseconds timeout) override;
    std::string Origin() const override { return origin_; }
    void Close() override;

    bool IsClosed() const { return closed_; }
    bool IsClosing() const { return closing_; }

    void SetSendLimits(std::size_t max_queued_bytes, std::chrono::milliseconds stall);
    std::size_t QueuedBytes() const;

private:
    void OnAccept(boost::beast::error_code ec);
    void DoRead();
    void OnRead(boost::beast::error_code ec, std::size_t bytes);
    void QueueWrite(std::shared_ptr<const std::string> text);
    void DoWrite();
    void OnWrite(boost::beast::error_code ec, std::size_t bytes);
    void DoClose();
    void OnClose(boost::beast::error_code ec);
    void MarkClosed();
    bool BeginClosing();
    void Abort();
    void Dequeued(std::size_t bytes);

    boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
    std::string origin_;
    Request upgrade_request_;
    OpenHandler on_open_;
    boost::beast::flat_buffer read_buffer_;

    // Strand-only state.
    std::deque<std::shared_ptr<const std::string>> write_queue_;
    bool close_requested_ = false;
    bool close_started_ = false;

    // Guards the inbox and the byte count of queued writes.
    mutable std::mutex inbox_mutex_;
    std::condition_variable inbox_cv_;
    std::deque<std::string> inbox_;
    std::condition_variable send_cv_;
    std::size_t queued_bytes_ = 0;
    std::size_t max_queued_bytes_ = kMaxQueuedBytes;
    std::chrono::milliseconds send_stall_ = kSendStall;
    std::atomic<bool> closing_{false};
    std::atomic<bool> closed_{false};
};

}  // namespace runbox::server

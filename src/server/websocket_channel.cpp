#include "server/websocket_channel.hpp"

#include <algorithm>

#include <boost/asio/post.hpp>

#include "utils/logging.hpp"

namespace runbox::server {
namespace {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;

}  // namespace

WebSocketChannel::WebSocketChannel(net::ip::tcp::socket&& socket, std::string origin)
    : ws_(std::move(socket))
    , origin_(std::move(origin)) {}

void WebSocketChannel::Accept(Request request, OpenHandler on_open) {
    upgrade_request_ = std::move(request);
    on_open_ = std::move(on_open);

    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
        res.set(http::field::server, "runbox");
    }));
    ws_.read_message_max(kMaxMessageBytes);
    ws_.async_accept(upgrade_request_,
                     beast::bind_front_handler(&WebSocketChannel::OnAccept, shared_from_this()));
}

void WebSocketChannel::OnAccept(beast::error_code ec) {
    if (ec) {
        utils::LogDebug("system", "WebSocket handshake with " + origin_ + " failed: " + ec.message());
        MarkClosed();
        return;
    }
    if (on_open_) {
        on_open_(shared_from_this());
        on_open_ = nullptr;
    }
    DoRead();
}

void WebSocketChannel::DoRead() {
    ws_.async_read(read_buffer_,
                   beast::bind_front_handler(&WebSocketChannel::OnRead, shared_from_this()));
}

void WebSocketChannel::OnRead(beast::error_code ec, std::size_t) {
    if (ec) {
        if (ec != websocket::error::closed) {
            utils::LogDebug("system", "WebSocket read from " + origin_ + " ended: " + ec.message());
        }
        MarkClosed();
        return;
    }
    if (ws_.got_text()) {
        {
            std::lock_guard<std::mutex> lock(inbox_mutex_);
            inbox_.push_back(beast::buffers_to_string(read_buffer_.data()));
        }
        inbox_cv_.notify_all();
    }
    read_buffer_.consume(read_buffer_.size());
    DoRead();
}

void WebSocketChannel::SetSendLimits(std::size_t max_queued_bytes, std::chrono::milliseconds stall) {
    std::lock_guard<std::mutex> lock(inbox_mutex_);
    max_queued_bytes_ = max_queued_bytes;
    send_stall_ = stall;
}

std::size_t WebSocketChannel::QueuedBytes() const {
    std::lock_guard<std::mutex> lock(inbox_mutex_);
    return queued_bytes_;
}

void WebSocketChannel::Send(const nlohmann::json& message) {
    if (closed_ || closing_) {
        return;
    }
    auto text = std::make_shared<const std::string>(
        message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    {
        std::unique_lock<std::mutex> lock(inbox_mutex_);
        const bool has_room = send_cv_.wait_for(lock, send_stall_, [this] {
            return queued_bytes_ < max_queued_bytes_ || closed_ || closing_;
        });
        if (closed_ || closing_) {
            return;
        }
        if (!has_room) {
            lock.unlock();
            utils::LogWarn("system", "MISBEHAVIOR: client " + origin_ + " stopped reading output, disconnecting");
            Abort();
            return;
        }
        queued_bytes_ += text->size();
    }
    net::post(ws_.get_executor(), [self = shared_from_this(), text]() {
        self->QueueWrite(text);
    });
}

void WebSocketChannel::QueueWrite(std::shared_ptr<const std::string> text) {
    if (closed_ || close_started_) {
        Dequeued(text->size());
        return;
    }
    write_queue_.push_back(std::move(text));
    if (write_queue_.size() > 1) {
        return;
    }
    DoWrite();
}

void WebSocketChannel::Dequeued(std::size_t bytes) {
    {
        std::lock_guard<std::mutex> lock(inbox_mutex_);
        queued_bytes_ -= std::min(bytes, queued_bytes_);
    }
    send_cv_.notify_all();
}

void WebSocketChannel::DoWrite() {
    ws_.text(true);
    ws_.async_write(net::buffer(*write_queue_.front()),
                    beast::bind_front_handler(&WebSocketChannel::OnWrite, shared_from_this()));
}

void WebSocketChannel::OnWrite(beast::error_code ec, std::size_t) {
    if (ec) {
        utils::LogDebug("system", "WebSocket write to " + origin_ + " failed: " + ec.message());
        std::size_t dropped = 0;
        for (const auto& text : write_queue_) {
            dropped += text->size();
        }
        write_queue_.clear();
        Dequeued(dropped);
        MarkClosed();
        return;
    }
    Dequeued(write_queue_.front()->size());
    write_queue_.pop_front();
    if (!write_queue_.empty()) {
        DoWrite();
        return;
    }
    if (close_requested_) {
        DoClose();
    }
}

session::ReceiveResult WebSocketChannel::Receive(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(inbox_mutex_);
    inbox_cv_.wait_for(lock, timeout, [this] {
        return !inbox_.empty() || closed_ || closing_;
    });
    if (!inbox_.empty()) {
        session::ReceiveResult result{session::ReceiveStatus::kMessage, std::move(inbox_.front())};
        inbox_.pop_front();
        return result;
    }
    if (closed_ || closing_) {
        return {session::ReceiveStatus::kClosed, {}};
    }
    return {session::ReceiveStatus::kTimeout, {}};
}

bool WebSocketChannel::BeginClosing() {
    {
        std::lock_guard<std::mutex> lock(inbox_mutex_);
        if (closing_) {
            return false;
        }
        closing_ = true;
    }
    inbox_cv_.notify_all();
    send_cv_.notify_all();
    return true;
}

void WebSocketChannel::Close() {
    if (!BeginClosing()) {
        return;
    }
    // Posted after every earlier Send, so queued messages go out first.
    net::post(ws_.get_executor(), [self = shared_from_this()]() {
        self->close_requested_ = true;
        if (self->write_queue_.empty()) {
            self->DoClose();
        }
    });
}

// Drops the connection without waiting for queued output.
void WebSocketChannel::Abort() {
    BeginClosing();
    net::post(ws_.get_executor(), [self = shared_from_this()]() {
        if (self->closed_) {
            return;
        }
        self->close_started_ = true;
        beast::get_lowest_layer(self->ws_).close();
    });
}

void WebSocketChannel::DoClose() {
    if (closed_ || close_started_) {
        return;
    }
    close_started_ = true;
    ws_.async_close(websocket::close_code::normal,
                    beast::bind_front_handler(&WebSocketChannel::OnClose, shared_from_this()));
}

void WebSocketChannel::OnClose(beast::error_code ec) {
    if (ec) {
        utils::LogDebug("system", "WebSocket close with " + origin_ + ": " + ec.message());
    }
    MarkClosed();
}

void WebSocketChannel::MarkClosed() {
    {
        std::lock_guard<std::mutex> lock(inbox_mutex_);
        closed_ = true;
    }
    inbox_cv_.notify_all();
    send_cv_.notify_all();
}

}  // namespace runbox::server

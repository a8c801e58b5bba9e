#pragma once

#include <memory>
#include <optional>
#include <string>

#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "auth/authenticator.hpp"
#include "nlohmann/json.hpp"
#include "server/websocket_channel.hpp"

namespace runbox::server {

struct GatewayRoutes {
    auth::Authenticator& authenticator;
    WebSocketChannel::OpenHandler on_channel_open;
};

using JsonResponse = boost::beast::http::response<boost::beast::http::string_body>;

JsonResponse MakeJsonResponse(boost::beast::http::status status,
                              const nlohmann::json& body,
                              unsigned version,
                              bool keep_alive);

// One plain HTTP connection: serves /login and hands /ws upgrades over to a
// WebSocketChannel.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    static constexpr std::uint64_t kMaxBodyBytes = 64 * 1024;

    HttpSession(boost::asio::ip::tcp::socket&& socket, std::string origin, GatewayRoutes& routes);

    void Run();

private:
    void DoRead();
    void OnRead(boost::beast::error_code ec, std::size_t bytes);
    void HandleRequest(WebSocketChannel::Request&& request);
    void HandleLogin(const WebSocketChannel::Request& request);
    void Respond(std::shared_ptr<JsonResponse> response);
    void RespondAfter(std::chrono::milliseconds delay, std::shared_ptr<JsonResponse> response);
    void OnWrite(bool close, boost::beast::error_code ec, std::size_t bytes);
    void DoClose();

    boost::beast::tcp_stream stream_;
    std::string origin_;
    GatewayRoutes& routes_;
    boost::beast::flat_buffer buffer_;
    std::optional<boost::beast::http::request_parser<boost::beast::http::string_body>> parser_;
    std::shared_ptr<JsonResponse> response_;
    boost::asio::steady_timer delay_timer_;
};

}  // namespace runbox::server

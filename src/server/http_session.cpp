#include "server/http_session.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/beast/websocket.hpp>

#include "session/protocol.hpp"
#include "utils/logging.hpp"

namespace runbox::server {
namespace {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;

constexpr std::chrono::seconds kReadTimeout{30};

std::string PathOf(beast::string_view target) {
    std::string path(target.data(), target.size());
    const auto query = path.find('?');
    if (query != std::string::npos) {
        path.resize(query);
    }
    return path;
}

}  // namespace

JsonResponse MakeJsonResponse(http::status status,
                              const nlohmann::json& body,
                              unsigned version,
                              bool keep_alive) {
    JsonResponse response{status, version};
    response.set(http::field::server, "runbox");
    response.set(http::field::content_type, "application/json");
    response.keep_alive(keep_alive);
    response.body() = body.dump();
    response.prepare_payload();
    return response;
}

HttpSession::HttpSession(net::ip::tcp::socket&& socket, std::string origin, GatewayRoutes& routes)
    : stream_(std::move(socket))
    , origin_(std::move(origin))
    , routes_(routes)
    , delay_timer_(stream_.get_executor()) {}

void HttpSession::Run() {
    net::dispatch(stream_.get_executor(),
                  beast::bind_front_handler(&HttpSession::DoRead, shared_from_this()));
}

void HttpSession::DoRead() {
    parser_.emplace();
    parser_->body_limit(kMaxBodyBytes);
    stream_.expires_after(kReadTimeout);
    http::async_read(stream_, buffer_, *parser_,
                     beast::bind_front_handler(&HttpSession::OnRead, shared_from_this()));
}

void HttpSession::OnRead(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
        DoClose();
        return;
    }
    if (ec) {
        if (ec != beast::error::timeout) {
            utils::LogDebug("system", "HTTP read from " + origin_ + " failed: " + ec.message());
        }
        return;
    }

    auto request = parser_->release();
    if (websocket::is_upgrade(request) && PathOf(request.target()) == "/ws") {
        stream_.expires_never();
        auto channel = std::make_shared<WebSocketChannel>(stream_.release_socket(), origin_);
        channel->Accept(std::move(request), routes_.on_channel_open);
        return;
    }
    HandleRequest(std::move(request));
}

void HttpSession::HandleRequest(WebSocketChannel::Request&& request) {
    const auto path = PathOf(request.target());
    const auto version = request.version();
    const bool keep_alive = request.keep_alive();

    if (path == "/login") {
        if (request.method() != http::verb::post) {
            Respond(std::make_shared<JsonResponse>(MakeJsonResponse(
                http::status::method_not_allowed, {{"error", "method not allowed"}}, version, keep_alive)));
            return;
        }
        HandleLogin(request);
        return;
    }
    if (path == "/ws") {
        Respond(std::make_shared<JsonResponse>(MakeJsonResponse(
            http::status::upgrade_required, {{"error", "websocket upgrade required"}}, version, keep_alive)));
        return;
    }
    Respond(std::make_shared<JsonResponse>(MakeJsonResponse(
        http::status::not_found, {{"error", "not found"}}, version, keep_alive)));
}

void HttpSession::HandleLogin(const WebSocketChannel::Request& request) {
    const auto version = request.version();
    const bool keep_alive = request.keep_alive();
    const auto login = session::ParseLoginRequest(request.body());
    if (!login) {
        Respond(std::make_shared<JsonResponse>(MakeJsonResponse(
            http::status::bad_request, {{"error", "invalid JSON body"}}, version, keep_alive)));
        return;
    }

    const auto result = routes_.authenticator.Authenticate(origin_, login->identity, login->secret);
    const auto user = login->identity.empty() ? std::string("unknown") : login->identity;
    switch (result.status) {
        case auth::AuthStatus::kGranted:
            utils::LogInfo(user, "Login successful");
            Respond(std::make_shared<JsonResponse>(MakeJsonResponse(
                http::status::ok, {{"success", true}}, version, keep_alive)));
            return;
        case auth::AuthStatus::kRateLimited: {
            const auto message = "Wait " + std::to_string(result.wait_seconds) + "s before trying again.";
            Respond(std::make_shared<JsonResponse>(MakeJsonResponse(
                http::status::ok, {{"success", false}, {"msg", message}}, version, keep_alive)));
            return;
        }
        case auth::AuthStatus::kRejected:
            RespondAfter(routes_.authenticator.FailureDelay(),
                         std::make_shared<JsonResponse>(MakeJsonResponse(
                             http::status::ok, {{"success", false}}, version, keep_alive)));
            return;
    }
}

void HttpSession::RespondAfter(std::chrono::milliseconds delay, std::shared_ptr<JsonResponse> response) {
    delay_timer_.expires_after(delay);
    delay_timer_.async_wait([self = shared_from_this(), response](beast::error_code ec) {
        if (ec) {
            return;
        }
        self->Respond(response);
    });
}

void HttpSession::Respond(std::shared_ptr<JsonResponse> response) {
    response_ = std::move(response);
    const bool close = response_->need_eof();
    http::async_write(stream_, *response_,
                      beast::bind_front_handler(&HttpSession::OnWrite, shared_from_this(), close));
}

void HttpSession::OnWrite(bool close, beast::error_code ec, std::size_t) {
    if (ec) {
        utils::LogDebug("system", "HTTP write to " + origin_ + " failed: " + ec.message());
        return;
    }
    response_.reset();
    if (close) {
        DoClose();
        return;
    }
    DoRead();
}

void HttpSession::DoClose() {
    beast::error_code ec;
    stream_.socket().shutdown(net::ip::tcp::socket::shutdown_send, ec);
}

}  // namespace runbox::server

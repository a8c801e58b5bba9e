#include "server/listener.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

#include "utils/logging.hpp"

namespace runbox::server {
namespace {

namespace net = boost::asio;
namespace beast = boost::beast;
using tcp = boost::asio::ip::tcp;

}  // namespace

Listener::Listener(net::io_context& ioc, const tcp::endpoint& endpoint, GatewayRoutes& routes)
    : ioc_(ioc)
    , acceptor_(net::make_strand(ioc))
    , routes_(routes) {
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(net::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(net::socket_base::max_listen_connections);
    port_ = acceptor_.local_endpoint().port();
}

void Listener::Run() {
    DoAccept();
}

void Listener::Stop() {
    net::post(acceptor_.get_executor(), [self = shared_from_this()]() {
        beast::error_code ec;
        self->acceptor_.close(ec);
    });
}

void Listener::DoAccept() {
    acceptor_.async_accept(net::make_strand(ioc_),
                           beast::bind_front_handler(&Listener::OnAccept, shared_from_this()));
}

void Listener::OnAccept(beast::error_code ec, tcp::socket socket) {
    if (ec == net::error::operation_aborted) {
        return;
    }
    if (ec) {
        utils::LogWarn("system", "Accept failed: " + ec.message());
    } else {
        beast::error_code endpoint_ec;
        const auto remote = socket.remote_endpoint(endpoint_ec);
        const auto origin = endpoint_ec ? std::string("unknown") : remote.address().to_string();
        std::make_shared<HttpSession>(std::move(socket), origin, routes_)->Run();
    }
    if (acceptor_.is_open()) {
        DoAccept();
    }
}

}  // namespace runbox::server

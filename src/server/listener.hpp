#pragma once

#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/error.hpp>

#include "server/http_session.hpp"

namespace runbox::server {

// Accepts TCP connections and starts an HttpSession on a fresh strand for each.
class Listener : public std::enable_shared_from_this<Listener> {
public:
    // Throws boost::system::system_error when the endpoint cannot be bound.
    Listener(boost::asio::io_context& ioc,
             const boost::asio::ip::tcp::endpoint& endpoint,
             GatewayRoutes& routes);

    void Run();
    void Stop();
    unsigned short Port() const { return port_; }

private:
    void DoAccept();
    void OnAccept(boost::beast::error_code ec, boost::asio::ip::tcp::socket socket);

    boost::asio::io_context& ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    GatewayRoutes& routes_;
    unsigned short port_ = 0;
};

}  // namespace runbox::server

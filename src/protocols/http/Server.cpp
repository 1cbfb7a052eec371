#include "protocols/http/Server.hpp"
#include "protocols/http/Session.hpp"
#include "log/Registry.hpp"

#include <boost/beast/core.hpp>

using namespace mh::protocols::http;
using namespace mh::log;

namespace beast = boost::beast;

Server::Server(net::io_context& ioc, const tcp::endpoint& endpoint,
               std::shared_ptr<const Router> router, const Surface surface)
    : acceptor_(ioc), router_(std::move(router)), surface_(surface) {
    beast::error_code ec;
    acceptor_.open(endpoint.protocol(), ec);
    if (ec) throw beast::system_error(ec);
    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) throw beast::system_error(ec);
    acceptor_.bind(endpoint, ec);
    if (ec) throw beast::system_error(ec);
    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) throw beast::system_error(ec);
}

void Server::run() {
    const auto ep = acceptor_.local_endpoint();
    Registry::http()->info("[HttpServer] Listening on {}:{} ({})", ep.address().to_string(), ep.port(),
                           surface_ == Surface::Admin ? "admin" : "public");
    do_accept();
}

void Server::do_accept() {
    acceptor_.async_accept([self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted) return;

        if (!ec) std::make_shared<Session>(std::move(socket), self->router_, self->surface_)->run();
        else Registry::http()->warn("[HttpServer] Accept failed: {}", ec.message());

        self->do_accept();
    });
}

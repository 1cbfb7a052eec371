#pragma once

#include "protocols/http/Router.hpp"

#include <boost/asio.hpp>
#include <memory>

namespace mh::protocols::http {

namespace net = boost::asio;
using tcp = net::ip::tcp;

class Server : public std::enable_shared_from_this<Server> {
public:
    // Binds and listens immediately; throws boost::system::system_error on failure.
    Server(net::io_context& ioc, const tcp::endpoint& endpoint,
           std::shared_ptr<const Router> router, Surface surface);

    void run();

    [[nodiscard]] tcp::endpoint localEndpoint() const { return acceptor_.local_endpoint(); }

private:
    void do_accept();

    tcp::acceptor acceptor_;
    std::shared_ptr<const Router> router_;
    Surface surface_;
};

}

#pragma once

#include "protocols/http/Router.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio.hpp>
#include <memory>

namespace mh::protocols::http {

namespace beast = boost::beast;
using tcp = boost::asio::ip::tcp;

class Session : public std::enable_shared_from_this<Session> {
public:
    Session(tcp::socket socket, std::shared_ptr<const Router> router, Surface surface);

    void run();

private:
    static constexpr size_t MAX_BODY = 1024 * 1024;

    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes);
    void on_write(bool close, beast::error_code ec, std::size_t bytes);
    void do_close();

    tcp::socket socket_;
    beast::flat_buffer buffer_;
    std::unique_ptr<beast::http::request_parser<beast::http::string_body>> parser_;
    std::shared_ptr<const Router> router_;
    Surface surface_;
};

}

#include "protocols/http/Session.hpp"
#include "log/Registry.hpp"

using namespace mh::protocols::http;
using namespace mh::log;

Session::Session(tcp::socket socket, std::shared_ptr<const Router> router, const Surface surface)
    : socket_(std::move(socket)), router_(std::move(router)), surface_(surface) {}

void Session::run() {
    do_read();
}

void Session::do_read() {
    parser_ = std::make_unique<beast::http::request_parser<beast::http::string_body>>();
    parser_->body_limit(MAX_BODY);

    beast::http::async_read(socket_, buffer_, *parser_,
                            [self = shared_from_this()](beast::error_code ec, std::size_t bytes) {
                                self->on_read(ec, bytes);
                            });
}

void Session::on_read(beast::error_code ec, std::size_t bytes) {
    if (ec == beast::http::error::end_of_stream) return do_close();

    if (ec) {
        Registry::http()->debug("[HttpSession] Read error: {}", ec.message());
        return do_close();
    }

    Registry::http()->trace("[HttpSession] Read {} bytes", bytes);

    const auto req = parser_->release();
    auto msg = std::make_shared<response>(router_->route(req, surface_));
    const bool close = msg->need_eof();

    beast::http::async_write(socket_, *msg,
                             [self = shared_from_this(), msg, close](beast::error_code ec, std::size_t bytes) {
                                 self->on_write(close, ec, bytes);
                             });
}

void Session::on_write(const bool close, beast::error_code ec, const std::size_t bytes) {
    (void)bytes; // unused

    if (ec) {
        Registry::http()->debug("[HttpSession] Write error: {}", ec.message());
        return;
    }

    if (close) {
        do_close();
        return;
    }

    do_read();
}

void Session::do_close() {
    beast::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_send, ec);
    if (ec && ec != beast::errc::not_connected)
        Registry::http()->trace("[HttpSession] Shutdown: {}", ec.message());
}

#pragma once

#include "services/AsyncService.hpp"
#include "config/Config.hpp"

#include <boost/asio/io_context.hpp>
#include <memory>

namespace mh::protocols::http { class Router; class Server; }

namespace mh::services {

// Runs the public webhook listener and the admin listener on one io_context.
class HttpService final : public AsyncService {
public:
    HttpService(config::ServerConfig cfg, std::shared_ptr<const protocols::http::Router> router);
    ~HttpService() override;

    void start() override;

protected:
    void runLoop() override;
    void wake() override;

private:
    config::ServerConfig cfg_;
    std::shared_ptr<const protocols::http::Router> router_;
    boost::asio::io_context ioc_;
};

}

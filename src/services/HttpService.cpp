#include "services/HttpService.hpp"
#include "protocols/http/Router.hpp"
#include "protocols/http/Server.hpp"
#include "log/Registry.hpp"

#include <boost/asio/ip/address.hpp>

using namespace mh::services;
using namespace mh::protocols::http;
using namespace mh::log;

HttpService::HttpService(config::ServerConfig cfg, std::shared_ptr<const Router> router)
    : AsyncService("HttpService"), cfg_(std::move(cfg)), router_(std::move(router)) {}

HttpService::~HttpService() {
    stop();
}

void HttpService::start() {
    if (isRunning()) return;
    ioc_.restart();
    AsyncService::start();
}

void HttpService::wake() {
    ioc_.stop();
}

void HttpService::runLoop() {
    const auto address = boost::asio::ip::make_address(cfg_.host);

    const auto publicServer = std::make_shared<Server>(ioc_, tcp::endpoint(address, cfg_.port), router_, Surface::Public);
    publicServer->run();

    if (cfg_.admin_port == cfg_.port) {
        Registry::http()->warn("[HttpService] Admin port equals the public port, admin endpoints are disabled");
    } else {
        const auto adminServer = std::make_shared<Server>(ioc_, tcp::endpoint(address, cfg_.admin_port), router_, Surface::Admin);
        adminServer->run();
    }

    ioc_.run();
    Registry::http()->debug("[HttpService] io_context stopped");
}

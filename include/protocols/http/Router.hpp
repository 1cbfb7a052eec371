#pragma once

#include "config/Config.hpp"
#include "sync/model/Trigger.hpp"

#include <boost/beast/http.hpp>
#include <nlohmann/json_fwd.hpp>
#include <functional>
#include <string>
#include <unordered_map>

namespace mh::protocols::http {

using request = boost::beast::http::request<boost::beast::http::string_body>;
using response = boost::beast::http::response<boost::beast::http::string_body>;

using field = boost::beast::http::field;
using verb = boost::beast::http::verb;
using status = boost::beast::http::status;

// Which listener a request arrived on. The admin routes are only served on
// the admin port.
enum class Surface { Public, Admin };

struct RouterContext {
    config::ServerConfig server;
    std::function<bool(sync::model::Trigger)> enqueue;
    std::function<nlohmann::json()> status;
};

class Router {
public:
    explicit Router(RouterContext ctx);

    [[nodiscard]] response route(const request& req, Surface surface) const;

    static std::unordered_map<std::string, std::string> parseQuery(std::string_view target);
    static std::string urlDecode(std::string_view value);

private:
    RouterContext ctx_;

    [[nodiscard]] response routePublic(const request& req, std::string_view path) const;
    [[nodiscard]] response routeAdmin(const request& req, std::string_view path) const;

    [[nodiscard]] response handleChallenge(const request& req) const;
    [[nodiscard]] response handleNotification(const request& req) const;
    [[nodiscard]] response handleAdminSync(const request& req) const;
    [[nodiscard]] response handleStatus(const request& req) const;

    static response makeResponse(const request& req, status s, std::string body,
                                 const std::string& contentType = "text/plain");
    static response makeJsonResponse(const request& req, const nlohmann::json& j, status s = status::ok);
    static response makeErrorResponse(const request& req, const std::string& msg, status s = status::not_found);
};

}

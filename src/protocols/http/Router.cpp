#include "protocols/http/Router.hpp"
#include "crypto/Hmac.hpp"
#include "log/Registry.hpp"

#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

using namespace mh::protocols::http;
using namespace mh::sync::model;
using namespace mh::log;

namespace {

constexpr auto SIGNATURE_HEADER = "X-Dropbox-Signature";

std::string_view view(const boost::beast::string_view s) { return {s.data(), s.size()}; }

int hexValue(const char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}

Router::Router(RouterContext ctx) : ctx_(std::move(ctx)) {
    if (!ctx_.enqueue) throw std::invalid_argument("Router requires an enqueue callback");
}

std::string Router::urlDecode(const std::string_view value) {
    std::string result;
    result.reserve(value.size());
    for (size_t i = 0; i < value.length(); ++i) {
        if (value[i] == '%') {
            const bool complete = i + 2 < value.length();
            const int hi = complete ? hexValue(value[i + 1]) : -1;
            const int lo = complete ? hexValue(value[i + 2]) : -1;
            if (hi < 0 || lo < 0) throw std::runtime_error("Invalid percent-encoding in URL");
            result += static_cast<char>(hi * 16 + lo);
            i += 2;
        }
        else if (value[i] == '+') result += ' ';
        else result += value[i];
    }
    return result;
}

std::unordered_map<std::string, std::string> Router::parseQuery(const std::string_view target) {
    std::unordered_map<std::string, std::string> params;

    const auto pos = target.find('?');
    if (pos == std::string_view::npos) return params;

    std::istringstream stream{std::string(target.substr(pos + 1))};
    std::string pair;

    while (std::getline(stream, pair, '&')) {
        if (pair.empty()) continue;
        const auto eq = pair.find('=');
        if (eq == std::string::npos) params[urlDecode(pair)] = "";
        else params[urlDecode(pair.substr(0, eq))] = urlDecode(pair.substr(eq + 1));
    }

    return params;
}

response Router::route(const request& req, const Surface surface) const {
    const auto target = view(req.target());
    const auto path = target.substr(0, target.find('?'));

    Registry::http()->debug("[Router] {} {} ({})", std::string(view(req.method_string())), std::string(target),
                            surface == Surface::Admin ? "admin" : "public");

    try {
        return surface == Surface::Admin ? routeAdmin(req, path) : routePublic(req, path);
    } catch (const std::exception& e) {
        Registry::http()->error("[Router] {} {} failed: {}", std::string(view(req.method_string())), std::string(target), e.what());
        return makeErrorResponse(req, "Internal server error", status::internal_server_error);
    }
}

response Router::routePublic(const request& req, const std::string_view path) const {
    if (path == ctx_.server.webhook_path) {
        if (req.method() == verb::get) return handleChallenge(req);
        if (req.method() == verb::post) return handleNotification(req);
        return makeErrorResponse(req, "Method not allowed", status::method_not_allowed);
    }

    if (path == "/health") {
        if (req.method() != verb::get) return makeErrorResponse(req, "Method not allowed", status::method_not_allowed);
        return makeJsonResponse(req, {{"status", "ok"}});
    }

    return makeErrorResponse(req, "Not found");
}

response Router::routeAdmin(const request& req, const std::string_view path) const {
    if (path == "/admin/sync") {
        if (req.method() != verb::post) return makeErrorResponse(req, "Method not allowed", status::method_not_allowed);
        return handleAdminSync(req);
    }

    if (path == "/admin/status") {
        if (req.method() != verb::get) return makeErrorResponse(req, "Method not allowed", status::method_not_allowed);
        return handleStatus(req);
    }

    if (path == "/admin/health") {
        if (req.method() != verb::get) return makeErrorResponse(req, "Method not allowed", status::method_not_allowed);
        return makeJsonResponse(req, {{"status", "ok"}});
    }

    return makeErrorResponse(req, "Not found");
}

// ##########################################
// ############### Handlers #################
// ##########################################

response Router::handleChallenge(const request& req) const {
    std::unordered_map<std::string, std::string> params;
    try {
        params = parseQuery(view(req.target()));
    } catch (const std::exception& e) {
        return makeErrorResponse(req, e.what(), status::bad_request);
    }

    const auto it = params.find("challenge");
    if (it == params.end() || it->second.empty())
        return makeErrorResponse(req, "Missing challenge parameter", status::bad_request);

    auto res = makeResponse(req, status::ok, it->second);
    res.set("X-Content-Type-Options", "nosniff");
    res.prepare_payload();
    Registry::http()->info("[Router] Answered webhook verification challenge");
    return res;
}

response Router::handleNotification(const request& req) const {
    if (!ctx_.server.app_secret.empty()) {
        const auto header = req.find(SIGNATURE_HEADER);
        if (header == req.end()) {
            Registry::http()->warn("[Router] Webhook notification without {} header", SIGNATURE_HEADER);
            return makeErrorResponse(req, "Missing signature", status::forbidden);
        }

        const auto expected = crypto::hmacSha256Hex(ctx_.server.app_secret, req.body());
        if (!crypto::hexDigestEquals(view(header->value()), expected)) {
            Registry::http()->warn("[Router] Webhook notification with invalid signature");
            return makeErrorResponse(req, "Invalid signature", status::forbidden);
        }
    }

    const bool queued = ctx_.enqueue(Trigger::remoteChanged());
    Registry::http()->info("[Router] Webhook notification {}", queued ? "queued a sync" : "merged into a queued sync");
    return makeResponse(req, status::ok, "");
}

response Router::handleAdminSync(const request& req) const {
    std::unordered_map<std::string, std::string> params;
    try {
        params = parseQuery(view(req.target()));
    } catch (const std::exception& e) {
        return makeErrorResponse(req, e.what(), status::bad_request);
    }

    Trigger trigger = Trigger::forceFullSync();
    if (const auto it = params.find("cursor"); it != params.end()) {
        if (it->second.empty()) return makeErrorResponse(req, "Empty cursor", status::bad_request);
        trigger = Trigger::remoteChangedWithCursor(it->second);
    }

    const bool queued = ctx_.enqueue(trigger);
    Registry::http()->info("[Router] Admin requested {}", to_string(trigger));
    return makeJsonResponse(req, {{"queued", queued}, {"trigger", to_string(trigger.type)}}, status::accepted);
}

response Router::handleStatus(const request& req) const {
    auto j = ctx_.status ? ctx_.status() : nlohmann::json::object();
    j["server"] = ctx_.server;
    return makeJsonResponse(req, j);
}

// ##########################################
// ############### Responses ################
// ##########################################

response Router::makeResponse(const request& req, const status s, std::string body, const std::string& contentType) {
    response res{s, req.version()};
    res.set(field::content_type, contentType);
    res.keep_alive(req.keep_alive());
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

response Router::makeJsonResponse(const request& req, const nlohmann::json& j, const status s) {
    return makeResponse(req, s, j.dump(), "application/json");
}

response Router::makeErrorResponse(const request& req, const std::string& msg, const status s) {
    return makeJsonResponse(req, {{"error", msg}}, s);
}

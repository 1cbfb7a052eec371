#include "remote/DropboxSource.hpp"
#include "auth/TokenProvider.hpp"
#include "util/curlWrappers.hpp"
#include "log/Registry.hpp"

#include <cstdio>
#include <fstream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace mh::remote;
using namespace mh::sync::model;
using namespace mh::util;
using namespace mh::log;
using json = nlohmann::json;

namespace fs = std::filesystem;

namespace {

std::string snippet(const std::string& body) {
    return body.size() > 512 ? body.substr(0, 512) + "..." : body;
}

struct FileCloser {
    void operator()(std::FILE* f) const { if (f) std::fclose(f); }
};

}

DropboxSource::DropboxSource(config::RemoteConfig cfg, std::shared_ptr<auth::TokenProvider> tokens)
    : cfg_(std::move(cfg)), tokens_(std::move(tokens)) {
    if (!tokens_) throw std::invalid_argument("DropboxSource requires a token provider");
}

std::string DropboxSource::apiPath(const std::string& path) {
    if (path.empty() || path == "/") return "";
    auto p = path.front() == '/' ? path : "/" + path;
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    return p;
}

Page DropboxSource::listFolder(const std::string& root, const bool recursive) {
    const json req = {
        {"path", apiPath(root)},
        {"recursive", recursive},
        {"include_deleted", false},
        {"include_media_info", false},
        {"include_has_explicit_shared_members", false}
    };
    Registry::remote()->debug("[Dropbox] list_folder '{}' recursive={}", apiPath(root), recursive);
    return parsePage(rpc("/files/list_folder", req.dump()));
}

Page DropboxSource::listContinue(const std::string& cursor) {
    const json req = {{"cursor", cursor}};
    return parsePage(rpc("/files/list_folder/continue", req.dump()));
}

std::string DropboxSource::rpc(const std::string& endpoint, const std::string& body) const {
    const auto url = cfg_.api_url + endpoint;
    const auto token = tokens_->token();

    SList headers;
    headers.add("Authorization: Bearer " + token);
    headers.add("Content-Type: application/json");

    const auto res = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(cfg_.timeout_seconds));
    });

    if (res.curl != CURLE_OK)
        throw std::runtime_error(fmt::format("{} failed: {}", endpoint, curl_easy_strerror(res.curl)));
    if (!res.ok())
        throw std::runtime_error(fmt::format("{} returned HTTP {}: {}", endpoint, res.http, snippet(res.body)));

    return res.body;
}

Page DropboxSource::parsePage(const std::string_view body) {
    const auto j = json::parse(body.begin(), body.end(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) throw std::runtime_error("Malformed list_folder response");

    Page page;
    page.cursor = j.value("cursor", "");
    page.has_more = j.value("has_more", false);

    if (!j.contains("entries") || !j["entries"].is_array()) return page;

    for (const auto& e : j["entries"]) {
        RemoteEntry entry;
        const auto tag = e.value(".tag", "");
        entry.path = e.value("path_display", e.value("path_lower", ""));
        entry.is_file = tag == "file";
        entry.modified = e.value("server_modified", "");
        if (entry.is_file) {
            entry.size = e.value("size", uint64_t{0});
            if (e.contains("content_hash") && e["content_hash"].is_string())
                entry.content_hash = e["content_hash"].get<std::string>();
        }
        if (entry.path.empty()) continue;
        page.entries.push_back(std::move(entry));
    }

    return page;
}

void DropboxSource::download(const std::string& remotePath, const fs::path& dest) {
    if (dest.has_parent_path()) fs::create_directories(dest.parent_path());

    const fs::path part = dest.string() + ".part";
    const auto url = cfg_.content_url + "/files/download";
    const auto token = tokens_->token();
    const json arg = {{"path", apiPath(remotePath)}};

    std::unique_ptr<std::FILE, FileCloser> out(std::fopen(part.c_str(), "wb"));
    if (!out) throw std::runtime_error(fmt::format("Cannot open {} for writing", part.string()));

    SList headers;
    headers.add("Authorization: Bearer " + token);
    headers.add("Dropbox-API-Arg: " + arg.dump());
    headers.add("Content-Type:");

    std::string errorBody;
    CurlEasy h;
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(h, CURLOPT_POST, 1L);
    curl_easy_setopt(h, CURLOPT_POSTFIELDS, "");
    curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, 0L);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, appendToFile);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, out.get());
    curl_easy_setopt(h, CURLOPT_TIMEOUT, 0L);
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, static_cast<long>(cfg_.timeout_seconds));

    const CURLcode rc = curl_easy_perform(h);
    long status = 0;
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &status);
    const bool flushed = std::fflush(out.get()) == 0;
    out.reset();

    const auto discard = [&] {
        std::error_code ec;
        fs::remove(part, ec);
    };

    if (rc != CURLE_OK) {
        discard();
        throw std::runtime_error(fmt::format("Download of {} failed: {}", remotePath, curl_easy_strerror(rc)));
    }
    if (status / 100 != 2) {
        std::ifstream in(part, std::ios::binary);
        errorBody.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        errorBody = snippet(errorBody);
        discard();
        throw std::runtime_error(fmt::format("Download of {} returned HTTP {}: {}", remotePath, status, errorBody));
    }
    if (!flushed) {
        discard();
        throw std::runtime_error(fmt::format("Failed to write {}", part.string()));
    }

    std::error_code ec;
    fs::rename(part, dest, ec);
    if (ec) {
        discard();
        throw std::runtime_error(fmt::format("Failed to move {} into place: {}", dest.string(), ec.message()));
    }

    Registry::remote()->debug("[Dropbox] Downloaded {} -> {}", remotePath, dest.string());
}

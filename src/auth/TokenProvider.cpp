#include "auth/TokenProvider.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <cstdlib>
#include <stdexcept>
#include <fmt/core.h>

using namespace mh::auth;
using namespace mh::log;

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

}

StaticTokenProvider::StaticTokenProvider(std::string token) : token_(trim(token)) {
    if (token_.empty()) throw std::invalid_argument("Access token is empty");
}

std::string StaticTokenProvider::token() const { return token_; }

FileTokenProvider::FileTokenProvider(std::filesystem::path file) : file_(std::move(file)) {
    if (file_.empty()) throw std::invalid_argument("Access token file path is empty");
}

std::string FileTokenProvider::token() const {
    auto token = trim(util::readFileToString(file_));
    if (token.empty()) throw std::runtime_error(fmt::format("Access token file {} is empty", file_.string()));
    return token;
}

std::shared_ptr<TokenProvider> mh::auth::makeTokenProvider(const config::RemoteConfig& cfg) {
    if (!cfg.access_token_file.empty()) {
        Registry::remote()->debug("[TokenProvider] Using token file {}", cfg.access_token_file);
        return std::make_shared<FileTokenProvider>(cfg.access_token_file);
    }

    if (!cfg.access_token.empty()) return std::make_shared<StaticTokenProvider>(cfg.access_token);

    if (!cfg.access_token_env.empty()) {
        if (const char* env = std::getenv(cfg.access_token_env.c_str()); env && *env) {
            Registry::remote()->debug("[TokenProvider] Using token from ${}", cfg.access_token_env);
            return std::make_shared<StaticTokenProvider>(env);
        }
    }

    throw std::runtime_error(fmt::format(
        "No access token configured: set remote.access_token, remote.access_token_file or ${}",
        cfg.access_token_env));
}

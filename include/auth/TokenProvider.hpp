#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace mh::auth {

// Supplies a bearer credential on demand. Refresh and expiry are the
// provider's business; callers ask again for every request.
class TokenProvider {
public:
    virtual ~TokenProvider() = default;

    // Throws std::runtime_error when no usable token is available.
    [[nodiscard]] virtual std::string token() const = 0;
};

class StaticTokenProvider final : public TokenProvider {
public:
    explicit StaticTokenProvider(std::string token);

    [[nodiscard]] std::string token() const override;

private:
    std::string token_;
};

// Re-reads the file on every call so an external refresher can rotate it.
class FileTokenProvider final : public TokenProvider {
public:
    explicit FileTokenProvider(std::filesystem::path file);

    [[nodiscard]] std::string token() const override;

private:
    std::filesystem::path file_;
};

// access_token_file wins over access_token, which wins over access_token_env.
std::shared_ptr<TokenProvider> makeTokenProvider(const config::RemoteConfig& cfg);

}

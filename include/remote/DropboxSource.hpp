#pragma once

#include "remote/Source.hpp"
#include "config/Config.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace mh::auth { class TokenProvider; }

namespace mh::remote {

// Source over the Dropbox v2 HTTP API.
class DropboxSource final : public Source {
public:
    DropboxSource(config::RemoteConfig cfg, std::shared_ptr<auth::TokenProvider> tokens);

    [[nodiscard]] std::string name() const override { return "dropbox"; }

    Page listFolder(const std::string& root, bool recursive) override;
    Page listContinue(const std::string& cursor) override;
    void download(const std::string& remotePath, const std::filesystem::path& dest) override;

    // Parses a list_folder or list_folder/continue response body.
    static Page parsePage(std::string_view body);

    // Dropbox addresses the root folder as "", everything else with a leading '/'.
    static std::string apiPath(const std::string& path);

private:
    config::RemoteConfig cfg_;
    std::shared_ptr<auth::TokenProvider> tokens_;

    std::string rpc(const std::string& endpoint, const std::string& body) const;
};

}

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace mh::sync::model {

struct RemoteEntry {
    std::string path;                         // as displayed by the remote, leading '/'
    uint64_t size{0};
    std::optional<std::string> content_hash;  // 64 hex chars when the remote knows it
    std::string modified;                     // informational only
    bool is_file{true};
};

using RemoteEntries = std::vector<RemoteEntry>;

void to_json(nlohmann::json& j, const RemoteEntry& e);

}

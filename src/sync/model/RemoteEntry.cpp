#include "sync/model/RemoteEntry.hpp"

#include <nlohmann/json.hpp>

namespace mh::sync::model {

void to_json(nlohmann::json& j, const RemoteEntry& e) {
    j = {
        {"path", e.path},
        {"size", e.size},
        {"modified", e.modified},
        {"is_file", e.is_file}
    };
    if (e.content_hash) j["content_hash"] = *e.content_hash;
    else j["content_hash"] = nullptr;
}

}

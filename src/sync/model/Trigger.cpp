#include "sync/model/Trigger.hpp"

namespace mh::sync::model {

std::string to_string(const Trigger::Type t) {
    switch (t) {
    case Trigger::Type::RemoteChanged: return "remote_changed";
    case Trigger::Type::RemoteChangedWithCursor: return "remote_changed_with_cursor";
    case Trigger::Type::ForceFullSync: return "force_full_sync";
    }
    return "unknown";
}

std::string to_string(const Trigger& t) {
    if (t.type == Trigger::Type::RemoteChangedWithCursor) return to_string(t.type) + "(" + t.cursor + ")";
    return to_string(t.type);
}

}

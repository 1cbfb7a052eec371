#pragma once

#include <string>
#include <utility>

namespace mh::sync::model {

struct Trigger {
    enum class Type {
        RemoteChanged,            // incremental when a cursor is stored, full otherwise
        RemoteChangedWithCursor,  // incremental from an explicit cursor
        ForceFullSync
    };

    Type type{Type::RemoteChanged};
    std::string cursor;  // RemoteChangedWithCursor only

    static Trigger remoteChanged() { return {Type::RemoteChanged, {}}; }
    static Trigger remoteChangedWithCursor(std::string token) { return {Type::RemoteChangedWithCursor, std::move(token)}; }
    static Trigger forceFullSync() { return {Type::ForceFullSync, {}}; }

    friend bool operator==(const Trigger&, const Trigger&) = default;
};

std::string to_string(const Trigger& t);
std::string to_string(Trigger::Type t);

}

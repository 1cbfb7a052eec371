#pragma once

#include "sync/model/RemoteEntry.hpp"

#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace mh::sync::model {

enum class Mode { Full, Incremental };

// Outcome of comparing one remote entry against its local target. Produced by
// Reconciler::compare and consumed only by shouldFetch.
enum class Comparison {
    Absent,        // no local file
    HashMatch,
    HashMismatch,
    SizeMatch,     // remote had no hash, or local hashing failed
    SizeMismatch,
};

[[nodiscard]] constexpr bool shouldFetch(const Comparison c) {
    switch (c) {
    case Comparison::Absent:
    case Comparison::HashMismatch:
    case Comparison::SizeMismatch:
        return true;
    case Comparison::HashMatch:
    case Comparison::SizeMatch:
        return false;
    }
    return true;
}

struct Fetch {
    RemoteEntry entry;
    std::filesystem::path local;
    Comparison reason{Comparison::Absent};
};

struct Plan {
    Mode mode{Mode::Full};
    std::vector<Fetch> to_fetch;                  // listing order
    std::set<std::filesystem::path> expected_paths;
    uint64_t unchanged{0};
    uint64_t rejected{0};                         // entries mapping outside the local base
};

std::string to_string(Mode mode);
std::string to_string(Comparison c);

}

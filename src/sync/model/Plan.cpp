#include "sync/model/Plan.hpp"

namespace mh::sync::model {

std::string to_string(const Mode mode) {
    switch (mode) {
    case Mode::Full: return "full";
    case Mode::Incremental: return "incremental";
    }
    return "unknown";
}

std::string to_string(const Comparison c) {
    switch (c) {
    case Comparison::Absent: return "absent";
    case Comparison::HashMatch: return "hash_match";
    case Comparison::HashMismatch: return "hash_mismatch";
    case Comparison::SizeMatch: return "size_match";
    case Comparison::SizeMismatch: return "size_mismatch";
    }
    return "unknown";
}

}

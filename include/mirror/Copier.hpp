#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace mh::mirror {

struct RuleResult {
    std::string pattern;
    uint64_t matched{0};
    uint64_t copied{0};
    bool ok{true};
    std::string error;
};

/**
 * Applies copy rules: every glob match of a rule's pattern is copied into the
 * rule's destination directory. Matched files keep their file name; matched
 * directories are merged into the destination, but only when the rule is
 * recursive. Destinations are created on demand.
 *
 * A failing rule is logged and reported, the remaining rules still run.
 */
class Copier {
public:
    virtual ~Copier() = default;

    virtual std::vector<RuleResult> apply(const std::vector<config::CopyRule>& rules);

    RuleResult applyRule(const config::CopyRule& rule);

    // Paths matching `pattern`, sorted. No match is an empty result; a bad
    // pattern or read error throws.
    static std::vector<std::filesystem::path> expand(const std::string& pattern);
};

}

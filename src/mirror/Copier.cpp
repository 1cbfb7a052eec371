#include "mirror/Copier.hpp"
#include "log/Registry.hpp"

#include <glob.h>
#include <stdexcept>
#include <system_error>
#include <fmt/core.h>

using namespace mh::mirror;
using namespace mh::config;
using namespace mh::log;

namespace fs = std::filesystem;

namespace {

struct GlobResult {
    glob_t g{};
    ~GlobResult() { globfree(&g); }
};

}

std::vector<fs::path> Copier::expand(const std::string& pattern) {
    if (pattern.empty()) throw std::invalid_argument("Copy rule has an empty source pattern");

    GlobResult res;
    const int rc = glob(pattern.c_str(), GLOB_ERR, nullptr, &res.g);

    std::vector<fs::path> out;
    if (rc == GLOB_NOMATCH) return out;
    if (rc == GLOB_NOSPACE) throw std::runtime_error(fmt::format("Out of memory expanding '{}'", pattern));
    if (rc == GLOB_ABORTED) throw std::runtime_error(fmt::format("Read error expanding '{}'", pattern));
    if (rc != 0) throw std::runtime_error(fmt::format("Failed to expand '{}' (glob error {})", pattern, rc));

    out.reserve(res.g.gl_pathc);
    for (size_t i = 0; i < res.g.gl_pathc; ++i) out.emplace_back(res.g.gl_pathv[i]);
    return out;
}

std::vector<RuleResult> Copier::apply(const std::vector<CopyRule>& rules) {
    std::vector<RuleResult> results;
    results.reserve(rules.size());
    for (const auto& rule : rules) results.push_back(applyRule(rule));
    return results;
}

RuleResult Copier::applyRule(const CopyRule& rule) {
    RuleResult result;
    result.pattern = rule.source_pattern;

    try {
        if (rule.destination.empty()) throw std::invalid_argument("Copy rule has no destination");

        const auto matches = expand(rule.source_pattern);
        result.matched = matches.size();
        if (matches.empty()) {
            Registry::mirror()->warn("[Copier] '{}' matched nothing", rule.source_pattern);
            return result;
        }

        fs::create_directories(rule.destination);

        for (const auto& src : matches) {
            if (fs::is_directory(src)) {
                if (!rule.recursive) {
                    Registry::mirror()->debug("[Copier] Skipping directory {} (rule is not recursive)", src.string());
                    continue;
                }
                fs::copy(src, rule.destination,
                         fs::copy_options::recursive | fs::copy_options::overwrite_existing);
            } else {
                fs::copy_file(src, rule.destination / src.filename(), fs::copy_options::overwrite_existing);
            }
            ++result.copied;
            Registry::mirror()->debug("[Copier] {} -> {}", src.string(), rule.destination.string());
        }

        Registry::mirror()->info("[Copier] '{}': copied {} of {} match(es) into {}",
                                 rule.source_pattern, result.copied, result.matched, rule.destination.string());
    } catch (const std::exception& e) {
        result.ok = false;
        result.error = e.what();
        Registry::mirror()->error("[Copier] Rule '{}' -> {} failed: {}",
                                  rule.source_pattern, rule.destination.string(), e.what());
    }

    return result;
}

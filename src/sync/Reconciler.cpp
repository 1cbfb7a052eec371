#include "sync/Reconciler.hpp"
#include "crypto/ContentHasher.hpp"
#include "remote/Source.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <system_error>
#include <unordered_map>

using namespace mh::sync;
using namespace mh::sync::model;
using namespace mh::crypto;
using namespace mh::log;

namespace fs = std::filesystem;

namespace {

fs::path normalizeBase(const fs::path& base) {
    auto p = fs::absolute(base).lexically_normal();
    if (!p.has_filename() && p.has_parent_path() && p != p.root_path()) p = p.parent_path();
    return p;
}

bool startsWithIgnoreCase(const std::string& s, const std::string& prefix) {
    if (prefix.size() > s.size()) return false;
    return std::equal(prefix.begin(), prefix.end(), s.begin(), [](const char a, const char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    });
}

std::string stripSlashes(std::string s) {
    const auto first = s.find_first_not_of('/');
    if (first == std::string::npos) return {};
    s.erase(0, first);
    while (!s.empty() && s.back() == '/') s.pop_back();
    return s;
}

}

Reconciler::Reconciler(const fs::path& localBase, std::string remoteRoot, const std::vector<fs::path>& preserved)
    : base_(normalizeBase(localBase)), remoteRoot_(stripSlashes(std::move(remoteRoot))) {
    if (localBase.empty()) throw std::invalid_argument("Reconciler requires a local base path");
    for (const auto& p : preserved) preserved_.insert(fs::absolute(p).lexically_normal());
}

// ##########################################
// ############### Planning #################
// ##########################################

Plan Reconciler::plan(const RemoteEntries& entries, const Mode mode) const {
    Plan plan;
    plan.mode = mode;

    // One decision per local target, in first-seen order. A later entry for
    // the same target replaces the earlier decision.
    std::vector<Fetch> decisions;
    std::unordered_map<std::string, size_t> slot;

    for (const auto& entry : entries) {
        if (!entry.is_file) continue;

        const auto local = localPathFor(entry.path);
        if (!local) {
            Registry::sync()->warn("[Reconciler] Skipping '{}': maps outside {} or onto a reserved file",
                                   entry.path, base_.string());
            ++plan.rejected;
            continue;
        }

        plan.expected_paths.insert(*local);

        const auto cmp = compare(entry, *local);
        Registry::sync()->trace("[Reconciler] {} -> {} ({})", entry.path, local->string(), to_string(cmp));

        if (const auto it = slot.find(local->string()); it != slot.end()) {
            Registry::sync()->debug("[Reconciler] '{}' listed again, later entry wins", entry.path);
            decisions[it->second] = {entry, *local, cmp};
            continue;
        }

        slot.emplace(local->string(), decisions.size());
        decisions.push_back({entry, *local, cmp});
    }

    for (auto& d : decisions) {
        if (shouldFetch(d.reason)) plan.to_fetch.push_back(std::move(d));
        else ++plan.unchanged;
    }

    Registry::sync()->debug("[Reconciler] {} plan: {} to fetch, {} unchanged, {} expected, {} rejected",
                            to_string(mode), plan.to_fetch.size(), plan.unchanged,
                            plan.expected_paths.size(), plan.rejected);
    return plan;
}

std::string Reconciler::relativeRemotePath(const std::string& remotePath) const {
    const auto path = stripSlashes(remotePath);
    if (remoteRoot_.empty()) return path;

    if (startsWithIgnoreCase(path, remoteRoot_) &&
        (path.size() == remoteRoot_.size() || path[remoteRoot_.size()] == '/'))
        return stripSlashes(path.substr(remoteRoot_.size()));

    Registry::sync()->debug("[Reconciler] '{}' is not under remote root '/{}', mapping as-is", remotePath, remoteRoot_);
    return path;
}

std::optional<fs::path> Reconciler::localPathFor(const std::string& remotePath) const {
    const auto rel = relativeRemotePath(remotePath);
    if (rel.empty()) return std::nullopt;

    const auto local = (base_ / fs::path(rel)).lexically_normal();
    if (!util::isWithin(base_, local) || isPreserved(local)) return std::nullopt;
    return local;
}

bool Reconciler::isPreserved(const fs::path& p) const {
    return preserved_.contains(p.lexically_normal());
}

Comparison Reconciler::compare(const RemoteEntry& remote, const fs::path& local) {
    return compare(remote, local, &ContentHasher::hashFile);
}

Comparison Reconciler::compare(const RemoteEntry& remote, const fs::path& local, const FileHasher& hasher) {
    std::error_code ec;
    if (!fs::is_regular_file(local, ec)) return Comparison::Absent;

    if (remote.content_hash && !remote.content_hash->empty()) {
        try {
            return hasher(local) == *remote.content_hash
                       ? Comparison::HashMatch
                       : Comparison::HashMismatch;
        } catch (const std::exception& e) {
            Registry::sync()->warn("[Reconciler] Hashing {} failed, falling back to size: {}", local.string(), e.what());
        }
    }

    const auto localSize = fs::file_size(local, ec);
    if (ec) return Comparison::SizeMismatch;
    return localSize == remote.size ? Comparison::SizeMatch : Comparison::SizeMismatch;
}

// ##########################################
// ############### Applying #################
// ##########################################

FetchResult Reconciler::fetch(const Plan& plan, remote::Source& source) const {
    FetchResult result;

    for (const auto& [entry, local, reason] : plan.to_fetch) {
        try {
            Registry::sync()->debug("[Reconciler] Fetching {} -> {} ({})", entry.path, local.string(), to_string(reason));
            source.download(entry.path, local);
            ++result.fetched;
            Registry::sync()->info("[Reconciler] Downloaded {}", entry.path);
        } catch (const std::exception& e) {
            ++result.failed;
            Registry::sync()->warn("[Reconciler] Failed to fetch {}: {}", entry.path, e.what());
        }
    }

    return result;
}

std::vector<fs::path> Reconciler::staleFiles(const Plan& plan) const {
    std::vector<fs::path> stale;

    std::error_code ec;
    if (!fs::is_directory(base_, ec)) return stale;

    fs::recursive_directory_iterator it(base_, fs::directory_options::skip_permission_denied, ec);
    if (ec) throw std::runtime_error("Failed to enumerate " + base_.string() + ": " + ec.message());

    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            Registry::sync()->warn("[Reconciler] Enumeration error under {}: {}", base_.string(), ec.message());
            ec.clear();
            continue;
        }

        const auto& entry = *it;
        std::error_code typeEc;
        if (!entry.is_symlink(typeEc) && entry.is_directory(typeEc)) continue;

        const auto p = entry.path().lexically_normal();
        if (plan.expected_paths.contains(p) || isPreserved(p)) continue;
        stale.push_back(p);
    }

    std::ranges::sort(stale);
    return stale;
}

PruneResult Reconciler::prune(const Plan& plan) const {
    if (plan.mode != Mode::Full)
        throw std::logic_error("Refusing to prune from an incremental plan");

    PruneResult result;

    for (const auto& file : staleFiles(plan)) {
        std::error_code ec;
        if (fs::remove(file, ec)) {
            ++result.deleted;
            Registry::sync()->info("[Reconciler] Removed stale file {}", file.string());
        } else if (ec) {
            ++result.failed;
            Registry::sync()->warn("[Reconciler] Failed to remove {}: {}", file.string(), ec.message());
        }
    }

    result.directories_removed = removeEmptyDirectories();

    if (result.deleted > 0 || result.directories_removed > 0)
        Registry::sync()->info("[Reconciler] Pruned {} file(s) and {} empty director{}",
                               result.deleted, result.directories_removed,
                               result.directories_removed == 1 ? "y" : "ies");
    return result;
}

uint64_t Reconciler::removeEmptyDirectories() const {
    std::vector<fs::path> dirs;

    std::error_code ec;
    if (!fs::is_directory(base_, ec)) return 0;

    fs::recursive_directory_iterator it(base_, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        Registry::sync()->warn("[Reconciler] Cannot enumerate directories under {}: {}", base_.string(), ec.message());
        return 0;
    }

    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            ec.clear();
            continue;
        }
        std::error_code typeEc;
        if (!it->is_symlink(typeEc) && it->is_directory(typeEc)) dirs.push_back(it->path().lexically_normal());
    }

    // Deepest first so a parent emptied by its children goes in the same pass
    std::ranges::sort(dirs, [](const fs::path& a, const fs::path& b) {
        return util::pathDepth(a) > util::pathDepth(b);
    });

    uint64_t removed = 0;
    for (const auto& dir : dirs) {
        if (dir == base_) continue;

        std::error_code emptyEc;
        if (!fs::is_empty(dir, emptyEc) || emptyEc) continue;

        std::error_code rmEc;
        if (fs::remove(dir, rmEc)) {
            ++removed;
            Registry::sync()->debug("[Reconciler] Removed empty directory {}", dir.string());
        } else if (rmEc) {
            Registry::sync()->debug("[Reconciler] Failed to remove empty directory {}: {}", dir.string(), rmEc.message());
        }
    }

    return removed;
}

#pragma once

#include "sync/model/Plan.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace mh::remote {
class Source;
}

namespace mh::sync {

struct FetchResult {
    uint64_t fetched{0};
    uint64_t failed{0};
};

struct PruneResult {
    uint64_t deleted{0};
    uint64_t failed{0};
    uint64_t directories_removed{0};
};

/**
 * Decides which remote files must be downloaded and which local files are
 * stale, and applies those decisions to the local tree.
 *
 * Remote paths are mapped under the local base by stripping the remote root.
 * Full plans carry the complete set of expected local paths; only they may be
 * pruned. Incremental plans never delete anything.
 */
class Reconciler {
public:
    using FileHasher = std::function<std::string(const std::filesystem::path&)>;

    Reconciler(const std::filesystem::path& localBase,
               std::string remoteRoot,
               const std::vector<std::filesystem::path>& preserved = {});

    [[nodiscard]] model::Plan plan(const model::RemoteEntries& entries, model::Mode mode) const;

    // Local target for a remote path, or nullopt when it would land outside
    // the base or on a preserved path.
    [[nodiscard]] std::optional<std::filesystem::path> localPathFor(const std::string& remotePath) const;

    // Hash first when the remote has one, size when it doesn't or hashing fails.
    [[nodiscard]] static model::Comparison compare(const model::RemoteEntry& remote,
                                                   const std::filesystem::path& local);

    [[nodiscard]] static model::Comparison compare(const model::RemoteEntry& remote,
                                                   const std::filesystem::path& local,
                                                   const FileHasher& hasher);

    // Sequential, best-effort. A failed download is logged and counted.
    FetchResult fetch(const model::Plan& plan, remote::Source& source) const;

    // Local files under the base that a full plan does not expect.
    [[nodiscard]] std::vector<std::filesystem::path> staleFiles(const model::Plan& plan) const;

    // Deletes stale files then empty directories, deepest first. Full plans only.
    PruneResult prune(const model::Plan& plan) const;

    uint64_t removeEmptyDirectories() const;

    [[nodiscard]] const std::filesystem::path& localBase() const { return base_; }

private:
    std::filesystem::path base_;
    std::string remoteRoot_;
    std::set<std::filesystem::path> preserved_;

    [[nodiscard]] std::string relativeRemotePath(const std::string& remotePath) const;
    [[nodiscard]] bool isPreserved(const std::filesystem::path& p) const;
};

}

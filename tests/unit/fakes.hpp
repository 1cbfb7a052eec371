#pragma once

#include "remote/Source.hpp"
#include "build/Executor.hpp"
#include "crypto/ContentHasher.hpp"

#include <filesystem>
#include <algorithm>
#include <fstream>
#include <iterator>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace mh::test {

namespace fs = std::filesystem;

inline void writeFile(const fs::path& path, const std::string& content) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

// In-memory remote tree. Paths carry a leading '/'. Every listing hands out a
// cursor "c<N>"; changesSince returns whatever was queued with setChanges().
class FakeSource final : public remote::Source {
public:
    std::map<std::string, std::string> files;
    std::set<std::string> failingDownloads;
    bool failListing{false};
    bool withHashes{true};
    size_t pageSize{0};  // 0 means one page

    std::vector<std::string> downloads;
    std::vector<std::string> continuedFrom;
    unsigned int listCalls{0};

    void put(const std::string& path, const std::string& content) { files[path] = content; }

    void setChanges(std::vector<std::string> paths, std::string terminal) {
        changes_ = std::move(paths);
        terminal_ = std::move(terminal);
    }

    [[nodiscard]] std::string name() const override { return "fake"; }

    remote::Page listFolder(const std::string&, bool) override {
        ++listCalls;
        if (failListing) throw std::runtime_error("listing unavailable");

        pending_.clear();
        for (const auto& [path, content] : files) pending_.push_back(entryFor(path));
        pending_.push_back({"/folder", 0, std::nullopt, "", false});
        return nextPage("c" + std::to_string(++cursorSeq_));
    }

    remote::Page listContinue(const std::string& cursor) override {
        continuedFrom.push_back(cursor);
        if (failListing) throw std::runtime_error("change feed unavailable");

        if (cursor.rfind("page:", 0) == 0) return nextPage(cursor.substr(5));

        pending_.clear();
        for (const auto& path : changes_)
            if (files.contains(path)) pending_.push_back(entryFor(path));
        return nextPage(terminal_);
    }

    void download(const std::string& remotePath, const fs::path& dest) override {
        downloads.push_back(remotePath);
        if (failingDownloads.contains(remotePath)) throw std::runtime_error("download failed: " + remotePath);
        const auto it = files.find(remotePath);
        if (it == files.end()) throw std::runtime_error("not found: " + remotePath);
        writeFile(dest, it->second);
    }

private:
    sync::model::RemoteEntries pending_;
    std::vector<std::string> changes_;
    std::string terminal_;
    unsigned int cursorSeq_{0};

    sync::model::RemoteEntry entryFor(const std::string& path) const {
        const auto& content = files.at(path);
        sync::model::RemoteEntry e;
        e.path = path;
        e.size = content.size();
        if (withHashes) e.content_hash = crypto::ContentHasher::hashBytes(content);
        e.modified = "2024-01-01T00:00:00Z";
        return e;
    }

    // Pages carry "page:<terminal>" until the last one, which carries the terminal cursor.
    remote::Page nextPage(const std::string& terminal) {
        remote::Page page;
        const size_t n = pageSize == 0 ? pending_.size() : std::min(pageSize, pending_.size());
        page.entries.assign(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(n));
        pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(n));
        page.has_more = !pending_.empty();
        page.cursor = page.has_more ? "page:" + terminal : terminal;
        return page;
    }
};

class FakeExecutor final : public build::Executor {
public:
    int exitCode{0};
    bool throwOnRun{false};
    std::vector<std::pair<std::string, fs::path>> calls;

    build::Result run(const std::string& command, const fs::path& workingDirectory) override {
        calls.emplace_back(command, workingDirectory);
        if (throwOnRun) throw std::runtime_error("cannot spawn");
        return {exitCode, exitCode == 0 ? "ok\n" : "boom\n"};
    }
};

}

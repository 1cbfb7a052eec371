#pragma once

#include "sync/model/RemoteEntry.hpp"

#include <filesystem>
#include <string>

namespace mh::remote {

struct Page {
    sync::model::RemoteEntries entries;
    std::string cursor;
    bool has_more{false};
};

struct Listing {
    sync::model::RemoteEntries entries;
    std::string cursor;  // terminal cursor after the last page
};

/**
 * A remote hierarchical file store that can enumerate a folder, page through
 * the enumeration with a cursor, and download individual files.
 *
 * Implementations throw std::runtime_error on transport or protocol failures.
 */
class Source {
public:
    virtual ~Source() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    // First page of a listing rooted at `root`.
    virtual Page listFolder(const std::string& root, bool recursive) = 0;

    // Next page after `cursor`. For a cursor saved from a completed listing
    // this returns the entries changed since that listing.
    virtual Page listContinue(const std::string& cursor) = 0;

    // Writes the remote file to `dest`, creating parent directories.
    virtual void download(const std::string& remotePath, const std::filesystem::path& dest) = 0;

    // Complete listing of `root`, following pagination to the end.
    Listing list(const std::string& root, bool recursive);

    // Entries changed since `cursor`, following pagination to the end.
    Listing changesSince(const std::string& cursor);

private:
    Listing drain(Page first);
};

}

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace mh::sync {

/**
 * Single-slot durable storage for the remote change cursor.
 *
 * The token is kept as an opaque text file inside the local sync root. A
 * missing, unreadable or blank file reads as "no cursor", which forces the next
 * cycle to do a full listing. Writes replace the whole file.
 *
 * Single process, single writer. Nothing here locks.
 */
class CursorStore {
public:
    explicit CursorStore(std::filesystem::path file);

    [[nodiscard]] std::optional<std::string> load() const;

    // Throws std::runtime_error when the token cannot be written.
    void save(const std::string& cursor) const;

    void clear() const;

    [[nodiscard]] const std::filesystem::path& path() const { return file_; }

private:
    std::filesystem::path file_;
};

}

#include "sync/CursorStore.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <stdexcept>
#include <system_error>
#include <utility>

using namespace mh::sync;
using namespace mh::log;

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

}

CursorStore::CursorStore(std::filesystem::path file) : file_(std::move(file)) {
    if (file_.empty()) throw std::invalid_argument("CursorStore requires a file path");
}

std::optional<std::string> CursorStore::load() const {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file_, ec)) {
        Registry::sync()->debug("[CursorStore] No cursor at {}", file_.string());
        return std::nullopt;
    }

    try {
        auto cursor = trim(util::readFileToString(file_));
        if (cursor.empty()) {
            Registry::sync()->warn("[CursorStore] Cursor file {} is empty, ignoring", file_.string());
            return std::nullopt;
        }
        return cursor;
    } catch (const std::exception& e) {
        Registry::sync()->warn("[CursorStore] Failed to read cursor, treating as absent: {}", e.what());
        return std::nullopt;
    }
}

void CursorStore::save(const std::string& cursor) const {
    if (trim(cursor).empty()) throw std::invalid_argument("Refusing to persist an empty cursor");
    util::writeFileAtomic(file_, cursor);
    Registry::sync()->debug("[CursorStore] Saved cursor to {}", file_.string());
}

void CursorStore::clear() const {
    std::error_code ec;
    std::filesystem::remove(file_, ec);
    if (ec) Registry::sync()->warn("[CursorStore] Failed to remove {}: {}", file_.string(), ec.message());
}

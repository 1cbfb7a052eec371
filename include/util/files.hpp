#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace mh::util {

std::string readFileToString(const std::filesystem::path& path);

// Writes to a sibling temp file and renames it over the target.
void writeFileAtomic(const std::filesystem::path& path, std::string_view contents);

std::string generate_random_suffix(size_t length = 8);

// Number of path components, used to order directories deepest-first.
std::size_t pathDepth(const std::filesystem::path& path);

// True when `path`, after lexical normalization, stays inside `base`.
bool isWithin(const std::filesystem::path& base, const std::filesystem::path& path);

}

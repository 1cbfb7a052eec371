#pragma once

#include <string>
#include <string_view>

namespace mh::crypto {

// Lowercase hex HMAC-SHA256 of `data` keyed by `key`.
std::string hmacSha256Hex(std::string_view key, std::string_view data);

// Case-insensitive constant-time comparison of two hex digests.
bool hexDigestEquals(std::string_view a, std::string_view b);

}

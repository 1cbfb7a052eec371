#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

struct evp_md_ctx_st;

namespace mh::crypto {

/**
 * Chunked content digest matching the "content_hash" field of the remote store.
 *
 * Input is split into 4 MiB blocks. Each block is hashed with SHA-256, the
 * 32-byte block digests are concatenated and hashed again with SHA-256. The
 * result is the lowercase hex encoding of that outer digest. An empty input
 * yields the SHA-256 of the empty message.
 *
 * finalize() consumes the hasher; calling update() or finalize() afterwards
 * throws std::logic_error.
 */
class ContentHasher {
public:
    static constexpr std::size_t BLOCK_SIZE = 4 * 1024 * 1024;
    static constexpr std::size_t HEX_LENGTH = 64;

    ContentHasher();
    ~ContentHasher();

    ContentHasher(ContentHasher&&) noexcept;
    ContentHasher& operator=(ContentHasher&&) noexcept;
    ContentHasher(const ContentHasher&) = delete;
    ContentHasher& operator=(const ContentHasher&) = delete;

    void update(const void* data, std::size_t len);
    void update(std::string_view data) { update(data.data(), data.size()); }

    [[nodiscard]] std::string finalize();

    [[nodiscard]] bool finalized() const { return finalized_; }

    // Throws std::runtime_error when the file cannot be opened or read.
    static std::string hashFile(const std::filesystem::path& path);

    static std::string hashBytes(std::string_view data);

    static bool filesMatch(const std::filesystem::path& path, const std::string& expectedHex);

private:
    struct CtxDeleter { void operator()(evp_md_ctx_st* ctx) const; };
    using CtxPtr = std::unique_ptr<evp_md_ctx_st, CtxDeleter>;

    CtxPtr overall_;
    CtxPtr block_;
    std::size_t blockPos_{0};
    bool finalized_{false};

    void flushBlock();
    void ensureOpen() const;
};

}

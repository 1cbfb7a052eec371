#include "crypto/ContentHasher.hpp"

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace mh::crypto {

namespace {

constexpr std::size_t READ_BUFFER_SIZE = 64 * 1024;

evp_md_ctx_st* newSha256() {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) throw std::runtime_error("EVP_MD_CTX_new failed");
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
    }
    return ctx;
}

std::string toHex(const unsigned char* digest, const std::size_t len) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < len; ++i)
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    return oss.str();
}

}

void ContentHasher::CtxDeleter::operator()(evp_md_ctx_st* ctx) const { EVP_MD_CTX_free(ctx); }

ContentHasher::ContentHasher() : overall_(newSha256()), block_(newSha256()) {}

ContentHasher::~ContentHasher() = default;

ContentHasher::ContentHasher(ContentHasher&&) noexcept = default;

ContentHasher& ContentHasher::operator=(ContentHasher&&) noexcept = default;

void ContentHasher::update(const void* data, std::size_t len) {
    ensureOpen();

    const auto* in = static_cast<const unsigned char*>(data);
    while (len > 0) {
        const std::size_t take = std::min(len, BLOCK_SIZE - blockPos_);
        if (EVP_DigestUpdate(block_.get(), in, take) != 1)
            throw std::runtime_error("EVP_DigestUpdate failed on block digest");

        blockPos_ += take;
        in += take;
        len -= take;

        if (blockPos_ == BLOCK_SIZE) flushBlock();
    }
}

std::string ContentHasher::finalize() {
    ensureOpen();

    // A partial trailing block is folded in exactly once. A stream ending on a
    // block boundary was already flushed by update().
    if (blockPos_ > 0) flushBlock();

    unsigned char digest[SHA256_DIGEST_LENGTH];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(overall_.get(), digest, &len) != 1)
        throw std::runtime_error("EVP_DigestFinal_ex failed on overall digest");

    finalized_ = true;
    return toHex(digest, len);
}

void ContentHasher::flushBlock() {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(block_.get(), digest, &len) != 1)
        throw std::runtime_error("EVP_DigestFinal_ex failed on block digest");
    if (EVP_DigestUpdate(overall_.get(), digest, len) != 1)
        throw std::runtime_error("EVP_DigestUpdate failed on overall digest");
    if (EVP_DigestInit_ex(block_.get(), EVP_sha256(), nullptr) != 1)
        throw std::runtime_error("EVP_DigestInit_ex failed resetting block digest");
    blockPos_ = 0;
}

void ContentHasher::ensureOpen() const {
    if (finalized_ || !overall_) throw std::logic_error("ContentHasher used after finalize()");
}

std::string ContentHasher::hashFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) throw std::runtime_error("Failed to open file for hashing: " + path.string());

    ContentHasher hasher;
    std::vector<char> buffer(READ_BUFFER_SIZE);

    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        if (const auto n = file.gcount(); n > 0) hasher.update(buffer.data(), static_cast<std::size_t>(n));
    }

    if (file.bad()) throw std::runtime_error("Failed to read file for hashing: " + path.string());

    return hasher.finalize();
}

std::string ContentHasher::hashBytes(const std::string_view data) {
    ContentHasher hasher;
    hasher.update(data);
    return hasher.finalize();
}

bool ContentHasher::filesMatch(const std::filesystem::path& path, const std::string& expectedHex) {
    return hashFile(path) == expectedHex;
}

}

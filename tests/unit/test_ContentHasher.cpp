#include <gtest/gtest.h>
#include "crypto/ContentHasher.hpp"
#include "fakes.hpp"

#include <openssl/sha.h>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;
using mh::crypto::ContentHasher;

namespace {

std::string toHex(const unsigned char* d, const size_t n) {
    std::ostringstream oss;
    for (size_t i = 0; i < n; ++i) oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(d[i]);
    return oss.str();
}

// SHA256 over the concatenated SHA256 digests of each 4 MiB block.
std::string referenceHash(const std::string& data) {
    std::string blockDigests;
    for (size_t off = 0; off < data.size(); off += ContentHasher::BLOCK_SIZE) {
        const auto len = std::min(ContentHasher::BLOCK_SIZE, data.size() - off);
        unsigned char d[SHA256_DIGEST_LENGTH];
        SHA256(reinterpret_cast<const unsigned char*>(data.data() + off), len, d);
        blockDigests.append(reinterpret_cast<const char*>(d), SHA256_DIGEST_LENGTH);
    }
    unsigned char out[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(blockDigests.data()), blockDigests.size(), out);
    return toHex(out, SHA256_DIGEST_LENGTH);
}

std::string patterned(const size_t n) {
    std::string s(n, '\0');
    for (size_t i = 0; i < n; ++i) s[i] = static_cast<char>((i * 31 + 7) % 251);
    return s;
}

}

class ContentHasherTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "mirrorhall_hasher_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override { fs::remove_all(test_dir); }
};

TEST_F(ContentHasherTest, EmptyInputIsDigestOfEmptyMessage) {
    EXPECT_EQ(ContentHasher::hashBytes(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    ContentHasher h;
    EXPECT_EQ(h.finalize(), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(ContentHasherTest, SmallInputIsHashOfSingleBlockDigest) {
    const auto hex = ContentHasher::hashBytes("abc");
    EXPECT_EQ(hex.size(), ContentHasher::HEX_LENGTH);
    EXPECT_EQ(hex, referenceHash("abc"));
    EXPECT_NE(hex, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(ContentHasherTest, OutputIsLowercaseHex) {
    const auto hex = ContentHasher::hashBytes("mirrorhall");
    ASSERT_EQ(hex.size(), 64u);
    for (const char c : hex) EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')) << c;
}

TEST_F(ContentHasherTest, ExactBlockMultipleHasNoTrailingEmptyBlock) {
    const auto data = patterned(2 * ContentHasher::BLOCK_SIZE);
    EXPECT_EQ(ContentHasher::hashBytes(data), referenceHash(data));
}

TEST_F(ContentHasherTest, PartialTrailingBlockIsIncluded) {
    const auto data = patterned(ContentHasher::BLOCK_SIZE + 1234);
    EXPECT_EQ(ContentHasher::hashBytes(data), referenceHash(data));
}

TEST_F(ContentHasherTest, ChunkingDoesNotChangeDigest) {
    const auto data = patterned(2 * ContentHasher::BLOCK_SIZE);
    const auto whole = ContentHasher::hashBytes(data);

    for (const size_t chunk : {size_t{1} << 10, size_t{1000003}, ContentHasher::BLOCK_SIZE - 1,
                               ContentHasher::BLOCK_SIZE, ContentHasher::BLOCK_SIZE + 17}) {
        ContentHasher h;
        for (size_t off = 0; off < data.size(); off += chunk)
            h.update(std::string_view(data).substr(off, chunk));
        EXPECT_EQ(h.finalize(), whole) << "chunk size " << chunk;
    }
}

TEST_F(ContentHasherTest, OrderSensitive) {
    EXPECT_NE(ContentHasher::hashBytes("ab"), ContentHasher::hashBytes("ba"));
}

TEST_F(ContentHasherTest, UseAfterFinalizeThrows) {
    ContentHasher h;
    h.update("x");
    (void)h.finalize();
    EXPECT_TRUE(h.finalized());
    EXPECT_THROW(h.update("y"), std::logic_error);
    EXPECT_THROW((void)h.finalize(), std::logic_error);
}

TEST_F(ContentHasherTest, HashFileMatchesHashBytes) {
    const auto data = patterned(ContentHasher::BLOCK_SIZE + 99);
    const auto file = test_dir / "blob.bin";
    mh::test::writeFile(file, data);

    EXPECT_EQ(ContentHasher::hashFile(file), ContentHasher::hashBytes(data));
    EXPECT_TRUE(ContentHasher::filesMatch(file, ContentHasher::hashBytes(data)));
    EXPECT_FALSE(ContentHasher::filesMatch(file, ContentHasher::hashBytes("other")));
}

TEST_F(ContentHasherTest, HashFileOnMissingFileThrows) {
    EXPECT_THROW((void)ContentHasher::hashFile(test_dir / "nope"), std::runtime_error);
}

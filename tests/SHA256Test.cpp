#include <gtest/gtest.h>

#include <hash/sha256.hpp>
#include <string>
#include <string_view>

#include "TempDirectory.hpp"

using ChunkXfer::SHA256;

namespace {

constexpr std::string_view kEmptyDigest =
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
constexpr std::string_view kAbcDigest =
    "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

std::string hexOf(std::string_view data) {
    return SHA256::toHex(SHA256::compute(
        reinterpret_cast<const uint8_t*>(data.data()), data.size()));
}

}  // namespace

TEST(SHA256Test, KnownVectors) {
    EXPECT_EQ(hexOf(""), kEmptyDigest);
    EXPECT_EQ(hexOf("abc"), kAbcDigest);
}

TEST(SHA256Test, HexIsLowercaseAndFullLength) {
    const auto hex = hexOf("chunk");
    EXPECT_EQ(hex.size(), SHA256::kHexLength);
    for (char c : hex) {
        EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')) << c;
    }
}

TEST(SHA256Test, SplitUpdatesMatchOneShot) {
    const std::string data = "The quick brown fox jumps over the lazy dog";
    ChunkXfer::SHA256 sha;
    sha.update(std::string_view(data).substr(0, 3));
    sha.update(std::string_view(data).substr(3, 20));
    sha.update(std::string_view(data).substr(23));
    EXPECT_EQ(SHA256::toHex(sha.finalize()), hexOf(data));
}

TEST(SHA256Test, FinalizeStartsOver) {
    ChunkXfer::SHA256 sha;
    sha.update("garbage");
    (void)sha.finalize();
    sha.update("abc");
    EXPECT_EQ(SHA256::toHex(sha.finalize()), kAbcDigest);
}

TEST(SHA256Test, ComputeFile) {
    TempDirectory dir;
    // Larger than one read block
    std::string content(200 * 1024, 'x');
    content += "tail";
    const auto file = dir.write("payload.bin", content);

    auto digest = SHA256::computeFile(file);
    ASSERT_TRUE(digest.ok()) << digest.status();
    EXPECT_EQ(SHA256::toHex(*digest), hexOf(content));
}

TEST(SHA256Test, ComputeFileMissing) {
    TempDirectory dir;
    auto digest = SHA256::computeFile(dir / "nope");
    ASSERT_FALSE(digest.ok());
    EXPECT_EQ(digest.status().code(), absl::StatusCode::kNotFound);
}

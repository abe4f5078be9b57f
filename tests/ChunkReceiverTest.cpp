#include <absl/strings/ascii.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <hash/sha256.hpp>
#include <server/ChunkReceiver.hpp>
#include <string>
#include <string_view>
#include <utility>

#include "TempDirectory.hpp"

using ChunkXfer::SHA256;
using ChunkXfer::Server::ChunkReceiver;
using ChunkXfer::Server::ChunkStorage;
using ChunkXfer::Server::ContentFeeder;
using ChunkXfer::Server::ContentSink;

namespace {

std::string hexOf(std::string_view data) {
    return SHA256::toHex(SHA256::compute(
        reinterpret_cast<const uint8_t*>(data.data()), data.size()));
}

// Feeds `body` in blocks of `block` bytes.
ContentFeeder feed(std::string body, size_t block = 3) {
    return [body = std::move(body), block](const ContentSink& sink) {
        for (size_t offset = 0; offset < body.size(); offset += block) {
            const auto length = std::min(block, body.size() - offset);
            if (!sink(body.data() + offset, length)) {
                return false;
            }
        }
        return true;
    };
}

}  // namespace

class ChunkReceiverTest : public ::testing::Test {
   protected:
    size_t filesInChunkDir() const {
        size_t count = 0;
        for (const auto& entry :
             std::filesystem::directory_iterator(dir.path())) {
            (void)entry;
            ++count;
        }
        return count;
    }

    TempDirectory dir;
    ChunkStorage storage{dir.path()};
    ChunkReceiver receiver{&storage};
};

TEST_F(ChunkReceiverTest, StoresMatchingChunk) {
    const auto status = receiver.receive("upload1", "1", hexOf("hello world"),
                                         feed("hello world"));
    ASSERT_TRUE(status.ok()) << status;
    EXPECT_EQ(TempDirectory::read(dir / "upload1_part_1"), "hello world");
    EXPECT_EQ(filesInChunkDir(), 1);
}

TEST_F(ChunkReceiverTest, DigestComparisonIgnoresCase) {
    const auto status = receiver.receive(
        "upload1", "2", absl::AsciiStrToUpper(hexOf("abcd")), feed("abcd"));
    ASSERT_TRUE(status.ok()) << status;
    EXPECT_TRUE(storage.exists("upload1", 2));
}

TEST_F(ChunkReceiverTest, RejectsTamperedChunk) {
    const auto status =
        receiver.receive("upload1", "1", hexOf("hello"), feed("jello"));
    ASSERT_FALSE(status.ok());
    EXPECT_EQ(status.code(), absl::StatusCode::kDataLoss);
    EXPECT_EQ(status.message(), "Chunk hash mismatch");
    EXPECT_FALSE(storage.exists("upload1", 1));
    EXPECT_EQ(filesInChunkDir(), 0);
}

TEST_F(ChunkReceiverTest, TamperedResendKeepsPreviousCopy) {
    ASSERT_TRUE(
        receiver.receive("upload1", "1", hexOf("good"), feed("good")).ok());
    ASSERT_FALSE(
        receiver.receive("upload1", "1", hexOf("good"), feed("evil")).ok());
    EXPECT_EQ(TempDirectory::read(dir / "upload1_part_1"), "good");
}

TEST_F(ChunkReceiverTest, ResendReplacesChunk) {
    ASSERT_TRUE(
        receiver.receive("upload1", "1", hexOf("first"), feed("first")).ok());
    ASSERT_TRUE(
        receiver.receive("upload1", "1", hexOf("second"), feed("second")).ok());
    EXPECT_EQ(TempDirectory::read(dir / "upload1_part_1"), "second");
    EXPECT_EQ(filesInChunkDir(), 1);
}

TEST_F(ChunkReceiverTest, MissingHashIsClientError) {
    const auto status = receiver.receive("upload1", "1", "", feed("data"));
    EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(status.message(), "Chunk hash is missing");
    EXPECT_EQ(filesInChunkDir(), 0);
}

TEST_F(ChunkReceiverTest, InvalidSequenceIsClientError) {
    for (const char* sequence : {"0", "-1", "abc", "", "1x"}) {
        const auto status =
            receiver.receive("upload1", sequence, hexOf("d"), feed("d"));
        EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument)
            << sequence;
    }
    EXPECT_EQ(filesInChunkDir(), 0);
}

TEST_F(ChunkReceiverTest, InvalidIdIsClientError) {
    for (const char* id : {"", "..", "a.b", "a b", "a%2Fb"}) {
        const auto status = receiver.receive(id, "1", hexOf("d"), feed("d"));
        EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument) << id;
    }
    EXPECT_TRUE(ChunkReceiver::isValidId("Az09_-"));
}

TEST_F(ChunkReceiverTest, UnregisteredIdIsAccepted) {
    EXPECT_TRUE(
        receiver.receive("neverRegistered", "5", hexOf("x"), feed("x")).ok());
    EXPECT_TRUE(storage.exists("neverRegistered", 5));
}

TEST_F(ChunkReceiverTest, BrokenTransferLeavesNothing) {
    const ContentFeeder broken = [](const ContentSink& sink) {
        (void)sink("partial", 7);
        return false;
    };
    const auto status =
        receiver.receive("upload1", "1", hexOf("partial"), broken);
    EXPECT_EQ(status.code(), absl::StatusCode::kInternal);
    EXPECT_FALSE(storage.exists("upload1", 1));
    EXPECT_EQ(filesInChunkDir(), 0);
}

TEST(ChunkStorageTest, OwnerOf) {
    EXPECT_EQ(ChunkStorage::ownerOf("abc_part_1"), "abc");
    EXPECT_EQ(ChunkStorage::ownerOf("a_part_b_part_12"), "a_part_b");
    EXPECT_EQ(ChunkStorage::ownerOf("abc_part_3.tmp5"), "abc");
    EXPECT_EQ(ChunkStorage::ownerOf("fileInfoDB.json"), std::nullopt);
    EXPECT_EQ(ChunkStorage::ownerOf("_part_1"), std::nullopt);
    EXPECT_EQ(ChunkStorage::ownerOf("abc_part_"), std::nullopt);
}

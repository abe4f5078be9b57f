#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <hash/sha256.hpp>
#include <server/ReassemblyService.hpp>
#include <string>
#include <string_view>

#include "TempDirectory.hpp"

using ChunkXfer::ChunkNumber;
using ChunkXfer::SHA256;
using ChunkXfer::UploadMetadata;
using ChunkXfer::Server::ChunkStorage;
using ChunkXfer::Server::CompletionLedger;
using ChunkXfer::Server::InMemoryMetadataStore;
using ChunkXfer::Server::ReassemblyService;
using ChunkXfer::Server::UploadState;
using testing::HasSubstr;

class ReassemblyServiceTest : public ::testing::Test {
   protected:
    static constexpr std::string_view kContent = "abcdefghij";

    void SetUp() override {
        metadata = {.id = "up1",
                    .fileName = "notes.txt",
                    .fileSize = kContent.size(),
                    .fileHash = SHA256::toHex(SHA256::compute(
                        reinterpret_cast<const uint8_t*>(kContent.data()),
                        kContent.size())),
                    .chunkSize = 4,
                    .totalChunks = 3};
        ASSERT_TRUE(store.insert(metadata, InMemoryMetadataStore::Clock::now()));
    }

    void putChunk(ChunkNumber sequence, std::string_view data) {
        chunks.write(ChunkStorage::unitName(metadata.id, sequence), data);
    }

    void putAllChunks() {
        putChunk(1, "abcd");
        putChunk(2, "efgh");
        putChunk(3, "ij");
    }

    size_t ledgerSize() {
        auto records = ledger.readAll();
        EXPECT_TRUE(records.ok()) << records.status();
        return records.ok() ? records->size() : 0;
    }

    TempDirectory chunks;
    TempDirectory output;
    UploadMetadata metadata;
    InMemoryMetadataStore store;
    ChunkStorage storage{chunks.path()};
    CompletionLedger ledger{output / "fileInfoDB.json"};
    ReassemblyService service{&store, &storage, &ledger, output.path()};
};

TEST_F(ReassemblyServiceTest, JoinsChunksInOrder) {
    putAllChunks();

    auto record = service.complete(metadata.id);
    ASSERT_TRUE(record.ok()) << record.status();
    EXPECT_EQ(record->metadata, metadata);
    EXPECT_FALSE(record->completedAt.empty());

    EXPECT_EQ(TempDirectory::read(output / "final_notes.txt"), kContent);
    EXPECT_EQ(ledgerSize(), 1);
    EXPECT_EQ(store.find(metadata.id)->state, UploadState::kCompleted);
    for (ChunkNumber i = 1; i <= metadata.totalChunks; ++i) {
        EXPECT_FALSE(storage.exists(metadata.id, i)) << i;
    }
}

TEST_F(ReassemblyServiceTest, ArrivalOrderDoesNotMatter) {
    putChunk(3, "ij");
    putChunk(2, "efgh");
    putChunk(1, "abcd");

    ASSERT_TRUE(service.complete(metadata.id).ok());
    EXPECT_EQ(TempDirectory::read(output / "final_notes.txt"), kContent);
}

TEST_F(ReassemblyServiceTest, MissingChunkFails) {
    putChunk(1, "abcd");
    putChunk(3, "ij");

    auto record = service.complete(metadata.id);
    ASSERT_FALSE(record.ok());
    EXPECT_EQ(record.status().code(), absl::StatusCode::kFailedPrecondition);
    EXPECT_THAT(std::string(record.status().message()),
                HasSubstr("missing chunk 2"));
    EXPECT_EQ(ledgerSize(), 0);
    // The partial destination is not cleaned up
    EXPECT_TRUE(std::filesystem::exists(output / "final_notes.txt"));
    EXPECT_TRUE(storage.exists(metadata.id, 1));
    EXPECT_EQ(store.find(metadata.id)->state, UploadState::kRegistered);
}

TEST_F(ReassemblyServiceTest, RetryAfterMissingChunk) {
    putChunk(1, "abcd");
    putChunk(3, "ij");
    ASSERT_FALSE(service.complete(metadata.id).ok());

    putChunk(2, "efgh");
    ASSERT_TRUE(service.complete(metadata.id).ok());
    EXPECT_EQ(TempDirectory::read(output / "final_notes.txt"), kContent);
    EXPECT_EQ(ledgerSize(), 1);
}

TEST_F(ReassemblyServiceTest, SecondCompletionFindsNoChunks) {
    putAllChunks();
    ASSERT_TRUE(service.complete(metadata.id).ok());

    auto again = service.complete(metadata.id);
    ASSERT_FALSE(again.ok());
    EXPECT_THAT(std::string(again.status().message()),
                HasSubstr("missing chunk"));
    EXPECT_EQ(ledgerSize(), 1);
}

TEST_F(ReassemblyServiceTest, SecondCompletionKeepsVerifiedFile) {
    putAllChunks();
    ASSERT_TRUE(service.complete(metadata.id).ok());

    ASSERT_FALSE(service.complete(metadata.id).ok());
    EXPECT_EQ(TempDirectory::read(output / "final_notes.txt"), kContent);
    EXPECT_EQ(store.find(metadata.id)->state, UploadState::kCompleted);

    // Chunk 3 alone is not enough to rebuild the file
    putChunk(3, "ij");
    auto again = service.complete(metadata.id);
    ASSERT_FALSE(again.ok());
    EXPECT_THAT(std::string(again.status().message()),
                HasSubstr("missing chunk 1"));
    EXPECT_EQ(TempDirectory::read(output / "final_notes.txt"), kContent);
    EXPECT_EQ(ledgerSize(), 1);
}

TEST_F(ReassemblyServiceTest, ChunksAreGoneOnceCompleted) {
    putAllChunks();
    auto record = service.complete(metadata.id);
    ASSERT_TRUE(record.ok()) << record.status();

    ASSERT_EQ(store.find(metadata.id)->state, UploadState::kCompleted);
    for (ChunkNumber i = 1; i <= metadata.totalChunks; ++i) {
        EXPECT_FALSE(storage.exists(metadata.id, i)) << i;
    }
}

TEST_F(ReassemblyServiceTest, FinalHashMismatchKeepsChunks) {
    putChunk(1, "abcd");
    putChunk(2, "EFGH");
    putChunk(3, "ij");

    auto record = service.complete(metadata.id);
    ASSERT_FALSE(record.ok());
    EXPECT_EQ(record.status().code(), absl::StatusCode::kDataLoss);
    EXPECT_EQ(record.status().message(), "final hash mismatch");
    EXPECT_EQ(ledgerSize(), 0);
    for (ChunkNumber i = 1; i <= metadata.totalChunks; ++i) {
        EXPECT_TRUE(storage.exists(metadata.id, i)) << i;
    }
}

TEST_F(ReassemblyServiceTest, UnknownIdIsNotFound) {
    auto record = service.complete("nobody");
    ASSERT_FALSE(record.ok());
    EXPECT_EQ(record.status().code(), absl::StatusCode::kNotFound);
    EXPECT_EQ(ledgerSize(), 0);
}

TEST_F(ReassemblyServiceTest, CorruptLedgerFailsCompletion) {
    putAllChunks();
    output.write("fileInfoDB.json", "garbage");

    auto record = service.complete(metadata.id);
    ASSERT_FALSE(record.ok());
    EXPECT_EQ(record.status().code(), absl::StatusCode::kDataLoss);
    EXPECT_TRUE(storage.exists(metadata.id, 1));
    EXPECT_EQ(store.find(metadata.id)->state, UploadState::kRegistered);
}

TEST_F(ReassemblyServiceTest, DestinationUsesBaseNameOnly) {
    EXPECT_EQ(service.destinationOf("../../etc/passwd").string(),
              (output / "final_passwd").string());
    EXPECT_EQ(service.destinationOf("plain.bin").string(),
              (output / "final_plain.bin").string());
}

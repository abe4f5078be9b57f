#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <server/MetadataStore.hpp>
#include <string>
#include <utility>

using ChunkXfer::UploadMetadata;
using ChunkXfer::Server::InMemoryMetadataStore;
using ChunkXfer::Server::MetadataStore;
using ChunkXfer::Server::UploadState;
using namespace std::chrono_literals;

class InMemoryMetadataStoreTest : public ::testing::Test {
   protected:
    static UploadMetadata makeMetadata(std::string id) {
        return {.id = std::move(id),
                .fileName = "a.bin",
                .fileSize = 10,
                .fileHash = std::string(64, 'a'),
                .chunkSize = 4,
                .totalChunks = 3};
    }

    InMemoryMetadataStore store;
    const MetadataStore::Clock::time_point now = MetadataStore::Clock::now();
};

TEST_F(InMemoryMetadataStoreTest, InsertAndFind) {
    ASSERT_TRUE(store.insert(makeMetadata("one"), now));
    auto entry = store.find("one");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->metadata, makeMetadata("one"));
    EXPECT_EQ(entry->state, UploadState::kRegistered);
    EXPECT_EQ(entry->registeredAt, now);
    EXPECT_TRUE(store.contains("one"));
    EXPECT_FALSE(store.contains("two"));
    EXPECT_FALSE(store.find("two").has_value());
}

TEST_F(InMemoryMetadataStoreTest, InsertRejectsTakenId) {
    ASSERT_TRUE(store.insert(makeMetadata("one"), now));
    auto other = makeMetadata("one");
    other.fileName = "b.bin";
    EXPECT_FALSE(store.insert(other, now));
    EXPECT_EQ(store.find("one")->metadata.fileName, "a.bin");
    EXPECT_EQ(store.size(), 1);
}

TEST_F(InMemoryMetadataStoreTest, BeginCompletionUnknownId) {
    auto result = store.beginCompletion("missing");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.status().code(), absl::StatusCode::kNotFound);
    EXPECT_THAT(std::string(result.status().message()),
                testing::HasSubstr("metadata not found"));
}

TEST_F(InMemoryMetadataStoreTest, CompletionIsExclusive) {
    ASSERT_TRUE(store.insert(makeMetadata("one"), now));
    auto first = store.beginCompletion("one");
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(first->state, UploadState::kRegistered);
    EXPECT_EQ(first->metadata.id, "one");
    EXPECT_EQ(store.find("one")->state, UploadState::kCompleting);

    auto second = store.beginCompletion("one");
    ASSERT_FALSE(second.ok());
    EXPECT_EQ(second.status().code(), absl::StatusCode::kFailedPrecondition);

    store.finishCompletion("one", false);
    EXPECT_EQ(store.find("one")->state, UploadState::kRegistered);
    EXPECT_TRUE(store.beginCompletion("one").ok());
}

TEST_F(InMemoryMetadataStoreTest, CompletedUploadStaysCompletedAfterRetry) {
    ASSERT_TRUE(store.insert(makeMetadata("one"), now));
    ASSERT_TRUE(store.beginCompletion("one").ok());
    store.finishCompletion("one", true);
    EXPECT_EQ(store.find("one")->state, UploadState::kCompleted);

    auto retry = store.beginCompletion("one");
    ASSERT_TRUE(retry.ok());
    // Callers see the state the upload had before
    EXPECT_EQ(retry->state, UploadState::kCompleted);
    EXPECT_EQ(store.find("one")->state, UploadState::kCompleting);
    store.finishCompletion("one", false);
    EXPECT_EQ(store.find("one")->state, UploadState::kCompleted);
}

TEST_F(InMemoryMetadataStoreTest, RemoveExpired) {
    ASSERT_TRUE(store.insert(makeMetadata("old"), now - 2h));
    ASSERT_TRUE(store.insert(makeMetadata("busy"), now - 2h));
    ASSERT_TRUE(store.insert(makeMetadata("fresh"), now));
    ASSERT_TRUE(store.beginCompletion("busy").ok());

    auto removed = store.removeExpired(now - 1h);
    EXPECT_THAT(removed, testing::ElementsAre("old"));
    EXPECT_FALSE(store.contains("old"));
    EXPECT_TRUE(store.contains("busy"));
    EXPECT_TRUE(store.contains("fresh"));
}

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <server/UploadReaper.hpp>
#include <string>

#include "TempDirectory.hpp"

using ChunkXfer::UploadMetadata;
using ChunkXfer::Server::ChunkStorage;
using ChunkXfer::Server::InMemoryMetadataStore;
using ChunkXfer::Server::MetadataStore;
using ChunkXfer::Server::UploadReaper;
using namespace std::chrono_literals;

class UploadReaperTest : public ::testing::Test {
   protected:
    static UploadMetadata makeMetadata(const std::string& id) {
        return {.id = id,
                .fileName = id + ".bin",
                .fileSize = 8,
                .fileHash = std::string(64, 'e'),
                .chunkSize = 4,
                .totalChunks = 2};
    }

    // Backdates the modification time of a file in the chunk directory.
    void age(const std::string& name, std::chrono::hours by) {
        std::filesystem::last_write_time(
            dir / name, std::filesystem::file_time_type::clock::now() - by);
    }

    TempDirectory dir;
    InMemoryMetadataStore store;
    ChunkStorage storage{dir.path()};
    UploadReaper reaper{&store, &storage, 1h, 1s};
    const MetadataStore::Clock::time_point now = MetadataStore::Clock::now();
};

TEST_F(UploadReaperTest, ExpiresUploadsPastLease) {
    ASSERT_TRUE(store.insert(makeMetadata("stale"), now - 2h));
    ASSERT_TRUE(store.insert(makeMetadata("fresh"), now - 10min));
    dir.write("stale_part_1", "aaaa");
    dir.write("stale_part_2", "bb");
    dir.write("fresh_part_1", "cccc");

    const auto result = reaper.sweep(now);
    EXPECT_EQ(result.expiredUploads, 1);
    EXPECT_EQ(result.removedFiles, 2);
    EXPECT_FALSE(store.contains("stale"));
    EXPECT_TRUE(store.contains("fresh"));
    EXPECT_FALSE(storage.exists("stale", 1));
    EXPECT_FALSE(storage.exists("stale", 2));
    EXPECT_TRUE(storage.exists("fresh", 1));
}

TEST_F(UploadReaperTest, RemovesOldOrphans) {
    dir.write("ghost_part_1", "old");
    dir.write("ghost_part_2.tmp3", "old");
    dir.write("recent_part_1", "new");
    dir.write("unrelated.txt", "keep me");
    age("ghost_part_1", 2h);
    age("ghost_part_2.tmp3", 2h);
    age("unrelated.txt", 2h);

    const auto result = reaper.sweep(now);
    EXPECT_EQ(result.expiredUploads, 0);
    EXPECT_EQ(result.removedFiles, 2);
    EXPECT_FALSE(std::filesystem::exists(dir / "ghost_part_1"));
    EXPECT_FALSE(std::filesystem::exists(dir / "ghost_part_2.tmp3"));
    EXPECT_TRUE(std::filesystem::exists(dir / "recent_part_1"));
    EXPECT_TRUE(std::filesystem::exists(dir / "unrelated.txt"));
}

TEST_F(UploadReaperTest, KeepsOldChunksOfLiveUploads) {
    ASSERT_TRUE(store.insert(makeMetadata("slow"), now - 30min));
    dir.write("slow_part_1", "aaaa");
    age("slow_part_1", 2h);

    const auto result = reaper.sweep(now);
    EXPECT_EQ(result.removedFiles, 0);
    EXPECT_TRUE(storage.exists("slow", 1));
}

TEST_F(UploadReaperTest, LeavesUploadsBeingCompleted) {
    ASSERT_TRUE(store.insert(makeMetadata("busy"), now - 2h));
    ASSERT_TRUE(store.beginCompletion("busy").ok());
    dir.write("busy_part_1", "aaaa");

    const auto result = reaper.sweep(now);
    EXPECT_EQ(result.expiredUploads, 0);
    EXPECT_TRUE(storage.exists("busy", 1));
}

TEST(UploadReaperThreadTest, RunsUntilStopped) {
    TempDirectory dir;
    InMemoryMetadataStore store;
    ChunkStorage storage{dir.path()};
    ThreadManager manager;

    ASSERT_TRUE(store.insert(
        {.id = "stale",
         .fileName = "stale.bin",
         .fileSize = 1,
         .fileHash = std::string(64, 'e'),
         .chunkSize = 1,
         .totalChunks = 1},
        MetadataStore::Clock::now() - 2h));

    auto* reaper = manager.create<UploadReaper>(
        ThreadManager::Usage::UPLOAD_REAPER_THREAD, &store, &storage, 1h, 1s);
    ASSERT_NE(reaper, nullptr);
    EXPECT_EQ(manager.create<UploadReaper>(
                  ThreadManager::Usage::UPLOAD_REAPER_THREAD, &store, &storage,
                  1h, 1s),
              nullptr);
    reaper->run();

    // The first pass runs right away
    for (int i = 0; i < 100 && store.contains("stale"); ++i) {
        std::this_thread::sleep_for(20ms);
    }
    EXPECT_FALSE(store.contains("stale"));

    manager.destroy();
    for (int i = 0; i < 100 && reaper->running(); ++i) {
        std::this_thread::sleep_for(20ms);
    }
    EXPECT_FALSE(reaper->running());
}

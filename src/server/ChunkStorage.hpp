#pragma once

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include <StructF.hpp>
#include <api/DataStructures.hpp>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace ChunkXfer::Server {

// Streams one chunk into a temporary file and publishes it on commit.
// Anything not committed is removed when the writer goes away.
class ChunkWriter {
   public:
    ChunkWriter(F file, std::filesystem::path tmpPath,
                std::filesystem::path finalPath);
    ~ChunkWriter();

    ChunkWriter(ChunkWriter&& other) noexcept;
    ChunkWriter& operator=(ChunkWriter&&) = delete;
    ChunkWriter(const ChunkWriter&) = delete;
    ChunkWriter& operator=(const ChunkWriter&) = delete;

    absl::Status write(const char* data, size_t length);

    // Atomically replaces any previous copy of the chunk.
    absl::Status commit();

    void discard();

    [[nodiscard]] size_t written() const { return written_; }

   private:
    F file_;
    std::filesystem::path tmpPath_;
    std::filesystem::path finalPath_;
    size_t written_ = 0;
    bool done_ = false;
};

// Chunk files of every upload, kept flat in one directory as <id>_part_<n>.
class ChunkStorage {
   public:
    explicit ChunkStorage(std::filesystem::path directory);

    static std::string unitName(std::string_view id, ChunkNumber sequence);

    // Upload id a file in the chunk directory belongs to, if any.
    static std::optional<std::string> ownerOf(std::string_view fileName);

    [[nodiscard]] std::filesystem::path pathOf(std::string_view id,
                                               ChunkNumber sequence) const;

    absl::StatusOr<ChunkWriter> openWriter(std::string_view id,
                                           ChunkNumber sequence) const;

    [[nodiscard]] bool exists(std::string_view id,
                              ChunkNumber sequence) const;

    // Removes chunk 1..totalChunks, missing ones are skipped.
    void removeChunks(std::string_view id, ChunkNumber totalChunks) const;

    // Removes every file of the upload, whatever its sequence number.
    size_t removeUpload(std::string_view id) const;

    /**
     * @brief Removes files of uploads that are not live any more.
     *
     * @param isLive tells whether an upload id is still registered
     * @param olderThan files modified after this are left alone
     * @return number of files removed
     */
    size_t sweepOrphans(const std::function<bool(std::string_view)>& isLive,
                        std::filesystem::file_time_type olderThan) const;

    [[nodiscard]] const std::filesystem::path& directory() const {
        return directory_;
    }

   private:
    std::filesystem::path directory_;
};

}  // namespace ChunkXfer::Server

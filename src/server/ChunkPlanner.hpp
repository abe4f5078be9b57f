#pragma once

#include <api/DataStructures.hpp>

#include <Random.hpp>

namespace ChunkXfer::Server {

struct ChunkBounds {
    FileSize min;
    FileSize max;
};

// Picks the chunk geometry of a new upload.
class ChunkPlanner {
   public:
    ChunkPlanner(RandomBase* random, ChunkBounds bounds)
        : random_(random), bounds_(bounds) {}

    /**
     * @brief Draws a chunk size uniformly from the configured bounds, clamped
     * to the file size.
     *
     * @param fileSize size of the file in bytes, must be > 0
     * @return chunk size in [1, fileSize]
     */
    [[nodiscard]] FileSize chunkSizeFor(FileSize fileSize) const;

    // ceil(fileSize / chunkSize)
    static ChunkNumber totalChunks(FileSize fileSize, FileSize chunkSize);

    // Length of the chunk numbered `totalChunks`.
    static FileSize lastChunkLength(FileSize fileSize, FileSize chunkSize);

    [[nodiscard]] ChunkBounds bounds() const { return bounds_; }

   private:
    RandomBase* random_;
    ChunkBounds bounds_;
};

}  // namespace ChunkXfer::Server

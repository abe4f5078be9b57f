#include "ChunkPlanner.hpp"

#include <absl/log/check.h>

#include <algorithm>

namespace ChunkXfer::Server {

FileSize ChunkPlanner::chunkSizeFor(FileSize fileSize) const {
    CHECK_GT(fileSize, 0U) << "Planning chunks of an empty file";
    const auto drawn = static_cast<FileSize>(
        random_->generate(static_cast<RandomBase::ret_type>(bounds_.min),
                          static_cast<RandomBase::ret_type>(bounds_.max)));
    return std::clamp<FileSize>(drawn, 1, fileSize);
}

ChunkNumber ChunkPlanner::totalChunks(FileSize fileSize, FileSize chunkSize) {
    // fileSize + chunkSize - 1 would wrap for sizes close to 2^64
    return fileSize / chunkSize + (fileSize % chunkSize != 0 ? 1 : 0);
}

FileSize ChunkPlanner::lastChunkLength(FileSize fileSize, FileSize chunkSize) {
    return fileSize - chunkSize * (totalChunks(fileSize, chunkSize) - 1);
}

}  // namespace ChunkXfer::Server

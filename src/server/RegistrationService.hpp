#pragma once

#include <absl/status/statusor.h>

#include <Random.hpp>
#include <api/DataStructures.hpp>

#include "ChunkPlanner.hpp"
#include "MetadataStore.hpp"

namespace ChunkXfer::Server {

class RegistrationService {
   public:
    // Random bytes in an upload id, hex encoded to twice as many characters
    static constexpr size_t kIdBytes = 16;

    RegistrationService(MetadataStore* store, RandomBase* random,
                        const ChunkPlanner* planner)
        : store_(store), random_(random), planner_(planner) {}

    /**
     * @brief Allocates an upload id and fixes the chunk geometry of a file.
     *
     * @param info what the sender announced
     * @return the stored metadata, or InvalidArgument if `info` can't be
     * uploaded.
     */
    absl::StatusOr<UploadMetadata> registerFile(const FileInfo& info);

   private:
    MetadataStore* store_;
    RandomBase* random_;
    const ChunkPlanner* planner_;
};

}  // namespace ChunkXfer::Server

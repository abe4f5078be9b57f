#pragma once

#include <absl/status/statusor.h>

#include <api/DataStructures.hpp>
#include <filesystem>

#include "UploadEndpoint.hpp"

namespace ChunkXfer::Client {

/**
 * @brief Handle chunked file uploads from the sender side
 */
class ChunkedUploader {
   public:
    explicit ChunkedUploader(UploadEndpoint* endpoint) : endpoint_(endpoint) {}

    /**
     * @brief Upload a file: hash it, register it, send every chunk in order
     * and ask the server to reassemble it.
     *
     * Empty files are rejected before anything is sent. The first failing
     * step aborts the upload, nothing is retried.
     *
     * @param path file to upload
     * @return the metadata the server registered the file under
     */
    absl::StatusOr<UploadMetadata> upload(const std::filesystem::path& path);

   private:
    UploadEndpoint* endpoint_;
};

}  // namespace ChunkXfer::Client

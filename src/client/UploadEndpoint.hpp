#pragma once

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include <api/DataStructures.hpp>
#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

// clang-format off
#include <climits>
#include <httplib.h>
// clang-format on

namespace ChunkXfer::Client {

// The three calls of the upload protocol, as seen by a sender.
class UploadEndpoint {
   public:
    virtual ~UploadEndpoint() = default;

    virtual absl::StatusOr<UploadMetadata> registerFile(
        const FileInfo& info) = 0;

    /**
     * @brief Sends one chunk.
     *
     * @param id upload id from registerFile
     * @param sequence 1-based chunk number
     * @param data chunk payload
     * @param size payload length
     * @param digest hex SHA-256 of the payload
     */
    virtual absl::Status sendChunk(std::string_view id, ChunkNumber sequence,
                                   const char* data, size_t size,
                                   std::string_view digest) = 0;

    virtual absl::Status completeUpload(std::string_view id) = 0;
};

// UploadEndpoint talking HTTP to a chunkxfer server.
class HttpUploadEndpoint : public UploadEndpoint {
   public:
    HttpUploadEndpoint(const std::string& host, int port,
                       std::chrono::seconds timeout);
    ~HttpUploadEndpoint() override = default;

    absl::StatusOr<UploadMetadata> registerFile(const FileInfo& info) override;
    absl::Status sendChunk(std::string_view id, ChunkNumber sequence,
                           const char* data, size_t size,
                           std::string_view digest) override;
    absl::Status completeUpload(std::string_view id) override;

   private:
    // Maps transport failures and non-200 answers to a status.
    static absl::Status check(const httplib::Result& result,
                              std::string_view what);

    httplib::Client client_;
};

}  // namespace ChunkXfer::Client

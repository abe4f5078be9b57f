#pragma once

#include <gmock/gmock.h>

#include <client/UploadEndpoint.hpp>

class MockUploadEndpoint : public ChunkXfer::Client::UploadEndpoint {
   public:
    MOCK_METHOD(absl::StatusOr<ChunkXfer::UploadMetadata>, registerFile,
                (const ChunkXfer::FileInfo& info), (override));
    MOCK_METHOD(absl::Status, sendChunk,
                (std::string_view id, ChunkXfer::ChunkNumber sequence,
                 const char* data, size_t size, std::string_view digest),
                (override));
    MOCK_METHOD(absl::Status, completeUpload, (std::string_view id),
                (override));
};

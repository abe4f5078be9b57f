#pragma once

#include <string_view>

namespace ChunkXfer {

// Wire contract shared by the upload server and its clients.
struct Routes {
    static constexpr std::string_view kRegisterNode = "/register_file";
    // /upload_chunk/{id}/{sequenceNumber}
    static constexpr std::string_view kUploadChunkPrefix = "/upload_chunk/";
    static constexpr std::string_view kUploadChunkPattern =
        R"(/upload_chunk/([^/]+)/([^/]+))";
    // /complete_upload/{id}
    static constexpr std::string_view kCompletePrefix = "/complete_upload/";
    static constexpr std::string_view kCompletePattern =
        R"(/complete_upload/([^/]+))";

    static constexpr std::string_view kChunkHashHeader = "Chunk-Hash";
    static constexpr std::string_view kJsonContentType = "application/json";
    static constexpr std::string_view kBinaryContentType =
        "application/octet-stream";
    static constexpr std::string_view kTextContentType = "text/plain";
};

}  // namespace ChunkXfer

#include <absl/log/log.h>
#include <fmt/format.h>

#include <api/HttpStatus.hpp>
#include <api/Routes.hpp>

#include "UploadEndpoint.hpp"

namespace ChunkXfer::Client {

HttpUploadEndpoint::HttpUploadEndpoint(const std::string& host, int port,
                                       std::chrono::seconds timeout)
    : client_(host, port) {
    client_.set_connection_timeout(timeout);
    client_.set_read_timeout(timeout);
    client_.set_write_timeout(timeout);
}

absl::Status HttpUploadEndpoint::check(const httplib::Result& result,
                                       std::string_view what) {
    if (!result) {
        return absl::UnavailableError(fmt::format(
            "{} failed: {}", what, httplib::to_string(result.error())));
    }
    auto status = fromHttpResponse(result->status, result->body);
    if (!status.ok()) {
        return absl::Status(status.code(),
                            fmt::format("{}: {}", what, status.message()));
    }
    return absl::OkStatus();
}

absl::StatusOr<UploadMetadata> HttpUploadEndpoint::registerFile(
    const FileInfo& info) {
    auto result = client_.Post(std::string(Routes::kRegisterNode),
                               toCompactString(info.toJson()),
                               std::string(Routes::kJsonContentType));
    if (auto status = check(result, "register"); !status.ok()) {
        return status;
    }
    auto metadata = UploadMetadata::fromJson(result->body);
    if (!metadata.ok()) {
        return absl::InternalError(fmt::format(
            "register: unexpected response: {}", metadata.status().message()));
    }
    return metadata;
}

absl::Status HttpUploadEndpoint::sendChunk(std::string_view id,
                                           ChunkNumber sequence,
                                           const char* data, size_t size,
                                           std::string_view digest) {
    const httplib::Headers headers{
        {std::string(Routes::kChunkHashHeader), std::string(digest)},
    };
    auto result = client_.Post(
        fmt::format("{}{}/{}", Routes::kUploadChunkPrefix, id, sequence),
        headers, data, size, std::string(Routes::kBinaryContentType));
    return check(result, fmt::format("chunk {}", sequence));
}

absl::Status HttpUploadEndpoint::completeUpload(std::string_view id) {
    auto result =
        client_.Get(fmt::format("{}{}", Routes::kCompletePrefix, id));
    return check(result, "complete");
}

}  // namespace ChunkXfer::Client

#pragma once

#include <absl/status/statusor.h>
#include <json/value.h>

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

namespace ChunkXfer {

using FileSize = std::uint64_t;
using ChunkNumber = std::uint64_t;

/**
 * @brief Parses a JSON object out of a request or response body.
 *
 * @param body raw JSON text
 * @param nodes members the object must carry
 * @return the parsed object, or std::nullopt if the body isn't an object
 * carrying every node.
 */
std::optional<Json::Value> parseAndCheck(
    std::string_view body, std::initializer_list<const char*> nodes);

// Serializes a JSON value on a single line.
std::string toCompactString(const Json::Value& value);

// What the sender announces about a file before transferring it.
struct FileInfo {
    std::string fileName;
    FileSize fileSize{};
    std::string fileHash;

    [[nodiscard]] Json::Value toJson() const;
    static absl::StatusOr<FileInfo> fromJson(std::string_view body);
};

// Registration record of one upload, fixed for its whole lifetime.
struct UploadMetadata {
    std::string id;
    std::string fileName;
    FileSize fileSize{};
    std::string fileHash;
    FileSize chunkSize{};
    ChunkNumber totalChunks{};

    [[nodiscard]] Json::Value toJson() const;
    static absl::StatusOr<UploadMetadata> fromJson(std::string_view body);
    static absl::StatusOr<UploadMetadata> fromJson(const Json::Value& root);

    bool operator==(const UploadMetadata&) const = default;
};

// Ledger entry written once an upload was reassembled and verified.
struct CompletionRecord {
    UploadMetadata metadata;
    // UTC, "YYYY-MM-DD HH:MM:SS"
    std::string completedAt;

    [[nodiscard]] Json::Value toJson() const;
    static absl::StatusOr<CompletionRecord> fromJson(const Json::Value& root);
};

}  // namespace ChunkXfer

#include <absl/log/log.h>
#include <absl/status/status.h>
#include <fmt/format.h>
#include <json/reader.h>
#include <json/writer.h>

#include <string>
#include <utility>

#include "DataStructures.hpp"

namespace ChunkXfer {

namespace {

absl::Status requireString(const Json::Value& root, const char* node) {
    if (!root[node].isString()) {
        return absl::InvalidArgumentError(
            fmt::format("'{}' must be a string", node));
    }
    return absl::OkStatus();
}

absl::Status requireUInt64(const Json::Value& root, const char* node) {
    if (!root[node].isUInt64()) {
        return absl::InvalidArgumentError(
            fmt::format("'{}' must be a non-negative integer", node));
    }
    return absl::OkStatus();
}

absl::Status checkAll(std::initializer_list<absl::Status> statuses) {
    for (const auto& status : statuses) {
        if (!status.ok()) {
            return status;
        }
    }
    return absl::OkStatus();
}

}  // namespace

std::optional<Json::Value> parseAndCheck(
    std::string_view body, std::initializer_list<const char*> nodes) {
    Json::Value root;
    Json::Reader reader;
    if (!reader.parse(body.data(), body.data() + body.size(), root)) {
        LOG(WARNING) << "Failed to parse json: "
                     << reader.getFormattedErrorMessages();
        return std::nullopt;
    }
    if (!root.isObject()) {
        LOG(WARNING) << "Expected an object in json";
        return std::nullopt;
    }
    for (const auto& node : nodes) {
        if (!root.isMember(node)) {
            LOG(WARNING) << fmt::format("Missing node '{}' in json", node);
            return std::nullopt;
        }
    }
    return root;
}

std::string toCompactString(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

Json::Value FileInfo::toJson() const {
    Json::Value root;
    root["fileName"] = fileName;
    root["fileSize"] = Json::UInt64{fileSize};
    root["fileHash"] = fileHash;
    return root;
}

absl::StatusOr<FileInfo> FileInfo::fromJson(std::string_view body) {
    auto _root = parseAndCheck(body, {"fileName", "fileSize", "fileHash"});
    if (!_root) {
        return absl::InvalidArgumentError("Invalid file info");
    }
    const auto& root = _root.value();
    if (auto status = checkAll({requireString(root, "fileName"),
                                requireUInt64(root, "fileSize"),
                                requireString(root, "fileHash")});
        !status.ok()) {
        return status;
    }
    return FileInfo{
        .fileName = root["fileName"].asString(),
        .fileSize = root["fileSize"].asUInt64(),
        .fileHash = root["fileHash"].asString(),
    };
}

Json::Value UploadMetadata::toJson() const {
    Json::Value root;
    root["id"] = id;
    root["fileName"] = fileName;
    root["fileSize"] = Json::UInt64{fileSize};
    root["fileHash"] = fileHash;
    root["chunkSize"] = Json::UInt64{chunkSize};
    root["totalChunks"] = Json::UInt64{totalChunks};
    return root;
}

absl::StatusOr<UploadMetadata> UploadMetadata::fromJson(
    std::string_view body) {
    auto root = parseAndCheck(body, {});
    if (!root) {
        return absl::InvalidArgumentError("Invalid upload metadata");
    }
    return fromJson(*root);
}

absl::StatusOr<UploadMetadata> UploadMetadata::fromJson(
    const Json::Value& root) {
    if (!root.isObject()) {
        return absl::InvalidArgumentError("Upload metadata is not an object");
    }
    if (auto status = checkAll({requireString(root, "id"),
                                requireString(root, "fileName"),
                                requireUInt64(root, "fileSize"),
                                requireString(root, "fileHash"),
                                requireUInt64(root, "chunkSize"),
                                requireUInt64(root, "totalChunks")});
        !status.ok()) {
        return status;
    }
    UploadMetadata metadata{
        .id = root["id"].asString(),
        .fileName = root["fileName"].asString(),
        .fileSize = root["fileSize"].asUInt64(),
        .fileHash = root["fileHash"].asString(),
        .chunkSize = root["chunkSize"].asUInt64(),
        .totalChunks = root["totalChunks"].asUInt64(),
    };
    if (metadata.id.empty() || metadata.chunkSize == 0 ||
        metadata.totalChunks == 0) {
        return absl::InvalidArgumentError(
            "Upload metadata has an empty id or no chunks");
    }
    return metadata;
}

Json::Value CompletionRecord::toJson() const {
    Json::Value root = metadata.toJson();
    root["completedAt"] = completedAt;
    return root;
}

absl::StatusOr<CompletionRecord> CompletionRecord::fromJson(
    const Json::Value& root) {
    auto metadata = UploadMetadata::fromJson(root);
    if (!metadata.ok()) {
        return metadata.status();
    }
    // Entries written by older servers carry no timestamp
    std::string completedAt;
    if (root.isMember("completedAt") && root["completedAt"].isString()) {
        completedAt = root["completedAt"].asString();
    }
    return CompletionRecord{.metadata = std::move(*metadata),
                            .completedAt = std::move(completedAt)};
}

}  // namespace ChunkXfer

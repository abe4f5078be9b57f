#include "RegistrationService.hpp"

#include <absl/log/log.h>
#include <absl/status/status.h>
#include <absl/strings/ascii.h>
#include <fmt/format.h>

#include <algorithm>
#include <filesystem>
#include <hash/sha256.hpp>

namespace ChunkXfer::Server {

namespace {

constexpr int kMaxIdAttempts = 8;

absl::Status validate(const FileInfo& info) {
    if (info.fileSize == 0) {
        return absl::InvalidArgumentError("fileSize must be positive");
    }
    const auto baseName = std::filesystem::path(info.fileName).filename();
    if (baseName.empty() || baseName == "." || baseName == "..") {
        return absl::InvalidArgumentError(
            fmt::format("Unusable fileName '{}'", info.fileName));
    }
    if (info.fileHash.size() != SHA256::kHexLength ||
        !std::ranges::all_of(info.fileHash, [](char c) {
            return absl::ascii_isxdigit(static_cast<unsigned char>(c));
        })) {
        return absl::InvalidArgumentError(
            "fileHash must be a hex encoded SHA-256 digest");
    }
    return absl::OkStatus();
}

}  // namespace

absl::StatusOr<UploadMetadata> RegistrationService::registerFile(
    const FileInfo& info) {
    if (auto status = validate(info); !status.ok()) {
        LOG(WARNING) << "Rejected registration: " << status.message();
        return status;
    }

    UploadMetadata metadata{
        .fileName = info.fileName,
        .fileSize = info.fileSize,
        .fileHash = absl::AsciiStrToLower(info.fileHash),
        .chunkSize = planner_->chunkSizeFor(info.fileSize),
    };
    metadata.totalChunks =
        ChunkPlanner::totalChunks(metadata.fileSize, metadata.chunkSize);

    for (int attempt = 0; attempt < kMaxIdAttempts; ++attempt) {
        metadata.id = random_->token(kIdBytes);
        if (store_->insert(metadata, MetadataStore::Clock::now())) {
            LOG(INFO) << fmt::format(
                "Registered {} as {}: {} bytes in {} chunks of {}",
                metadata.fileName, metadata.id, metadata.fileSize,
                metadata.totalChunks, metadata.chunkSize);
            return metadata;
        }
        LOG(WARNING) << "Upload id collision on " << metadata.id;
    }
    return absl::InternalError("Could not allocate a unique upload id");
}

}  // namespace ChunkXfer::Server

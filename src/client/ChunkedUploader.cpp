#include "ChunkedUploader.hpp"

#include <absl/log/log.h>
#include <absl/status/status.h>
#include <fmt/format.h>

#include <StructF.hpp>
#include <hash/sha256.hpp>
#include <iomanip>
#include <vector>

namespace ChunkXfer::Client {

absl::StatusOr<UploadMetadata> ChunkedUploader::upload(
    const std::filesystem::path& path) {
    F file;
    if (!file.open(path, F::Mode::ReadBinary)) {
        return absl::NotFoundError(
            fmt::format("Cannot open {}", path.string()));
    }
    const auto fileSize = file.size();
    if (fileSize == F::INVALID_SIZE) {
        return absl::InternalError(
            fmt::format("Cannot get the size of {}", path.string()));
    }
    if (fileSize == 0) {
        return absl::InvalidArgumentError(
            fmt::format("{} is empty, nothing to upload", path.string()));
    }

    // Calculate hash
    SHA256 sha;
    {
        std::vector<char> buffer(64 * 1024);
        F::size_type got = 0;
        while ((got = file.readSome(buffer.data(), buffer.size())) > 0) {
            sha.update(buffer.data(), got);
        }
        if (file.error()) {
            return absl::DataLossError(
                fmt::format("Read error on {}", path.string()));
        }
    }
    const FileInfo info{
        .fileName = path.filename().string(),
        .fileSize = fileSize,
        .fileHash = SHA256::toHex(sha.finalize()),
    };

    auto metadata = endpoint_->registerFile(info);
    if (!metadata.ok()) {
        LOG(ERROR) << "Failed to register " << path << ": "
                   << metadata.status().message();
        return metadata.status();
    }
    if (metadata->chunkSize == 0 || metadata->chunkSize > info.fileSize) {
        return absl::InternalError(fmt::format(
            "Server picked an invalid chunk size {}", metadata->chunkSize));
    }
    LOG(INFO) << fmt::format(
        "Starting chunked upload: {} as {} ({} bytes, {} chunks of {})",
        path.string(), metadata->id, info.fileSize, metadata->totalChunks,
        metadata->chunkSize);

    if (!file.rewind()) {
        return absl::InternalError(
            fmt::format("Cannot seek back in {}", path.string()));
    }

    std::vector<char> chunk(metadata->chunkSize);
    ChunkNumber sequence = 0;
    F::size_type got = 0;
    while ((got = file.readSome(chunk.data(), chunk.size())) > 0) {
        ++sequence;
        const auto digest = SHA256::toHex(SHA256::compute(
            reinterpret_cast<const uint8_t*>(chunk.data()), got));
        if (auto status = endpoint_->sendChunk(metadata->id, sequence,
                                               chunk.data(), got, digest);
            !status.ok()) {
            LOG(ERROR) << "Failed to send chunk " << sequence << ": "
                       << status.message();
            return status;
        }

        // Log progress every 10 chunks or on last chunk
        if (sequence % 10 == 0 || sequence == metadata->totalChunks) {
            const float progress = static_cast<float>(sequence) /
                                   metadata->totalChunks * 100.0F;
            LOG(INFO) << "Progress: " << sequence << "/"
                      << metadata->totalChunks << " chunks (" << std::fixed
                      << std::setprecision(1) << progress << "%)";
        }
    }
    if (file.error()) {
        return absl::DataLossError(
            fmt::format("Read error on {}", path.string()));
    }
    LOG_IF(WARNING, sequence != metadata->totalChunks)
        << fmt::format("Sent {} chunks, server expects {}", sequence,
                       metadata->totalChunks);

    if (auto status = endpoint_->completeUpload(metadata->id); !status.ok()) {
        LOG(ERROR) << "Server rejected completion: " << status.message();
        return status;
    }
    LOG(INFO) << "File transfer completed successfully";
    return metadata;
}

}  // namespace ChunkXfer::Client

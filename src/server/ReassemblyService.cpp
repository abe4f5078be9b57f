#include "ReassemblyService.hpp"

#include <absl/log/log.h>
#include <absl/status/status.h>
#include <absl/strings/match.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>
#include <fmt/format.h>

#include <StructF.hpp>
#include <hash/sha256.hpp>
#include <vector>

namespace ChunkXfer::Server {

namespace {

constexpr size_t kCopyBlockSize = 64 * 1024;

// Appends a whole chunk file to `dest`.
absl::Status appendFile(const std::filesystem::path& source, const F& dest,
                        std::vector<char>* buffer) {
    F in;
    if (!in.open(source, F::Mode::ReadBinary)) {
        return absl::InternalError(
            fmt::format("cannot open {}", source.filename().string()));
    }
    F::size_type got = 0;
    while ((got = in.readSome(buffer->data(), buffer->size())) > 0) {
        if (!dest.write(buffer->data(), got)) {
            return absl::InternalError("write to destination failed");
        }
    }
    if (in.error()) {
        return absl::InternalError(
            fmt::format("read error on {}", source.filename().string()));
    }
    return absl::OkStatus();
}

}  // namespace

std::filesystem::path ReassemblyService::destinationOf(
    std::string_view fileName) const {
    const auto baseName = std::filesystem::path(fileName).filename();
    return outputDir_ / fmt::format("{}{}", kFinalPrefix, baseName.string());
}

absl::StatusOr<CompletionRecord> ReassemblyService::complete(
    std::string_view id) {
    auto entry = store_->beginCompletion(id);
    if (!entry.ok()) {
        LOG(WARNING) << "Cannot complete " << id << ": "
                     << entry.status().message();
        return entry.status();
    }
    const UploadMetadata& metadata = entry->metadata;

    auto record = reassemble(metadata,
                             entry->state == UploadState::kCompleted);
    if (!record.ok()) {
        store_->finishCompletion(id, false);
        LOG(WARNING) << "Completion of " << id
                     << " failed: " << record.status().message();
        return record.status();
    }

    // Stays kCompleting until the chunks are gone
    storage_->removeChunks(metadata.id, metadata.totalChunks);
    store_->finishCompletion(id, true);
    LOG(INFO) << fmt::format("Upload {} completed into {}", metadata.id,
                             destinationOf(metadata.fileName).string());
    return record;
}

absl::StatusOr<CompletionRecord> ReassemblyService::reassemble(
    const UploadMetadata& metadata, bool verifiedBefore) {
    const auto destination = destinationOf(metadata.fileName);

    // A verified destination is only rewritten if every chunk is there again
    if (verifiedBefore) {
        for (ChunkNumber sequence = 1; sequence <= metadata.totalChunks;
             ++sequence) {
            if (!storage_->exists(metadata.id, sequence)) {
                return absl::FailedPreconditionError(
                    fmt::format("missing chunk {}", sequence));
            }
        }
    }

    F dest;
    if (!dest.open(destination, F::Mode::WriteBinary)) {
        return absl::InternalError(fmt::format(
            "cannot create {}", destination.filename().string()));
    }

    std::vector<char> buffer(kCopyBlockSize);
    for (ChunkNumber sequence = 1; sequence <= metadata.totalChunks;
         ++sequence) {
        if (!storage_->exists(metadata.id, sequence)) {
            return absl::FailedPreconditionError(
                fmt::format("missing chunk {}", sequence));
        }
        if (auto status = appendFile(storage_->pathOf(metadata.id, sequence),
                                     dest, &buffer);
            !status.ok()) {
            return status;
        }
    }
    if (!dest.sync() || !dest.close()) {
        return absl::InternalError(fmt::format(
            "cannot flush {}", destination.filename().string()));
    }

    auto digest = SHA256::computeFile(destination);
    if (!digest.ok()) {
        return absl::InternalError(digest.status().message());
    }
    const auto actual = SHA256::toHex(*digest);
    if (!absl::EqualsIgnoreCase(actual, metadata.fileHash)) {
        LOG(ERROR) << fmt::format("{}: expected {}, reassembled {}",
                                  metadata.id, metadata.fileHash, actual);
        return absl::DataLossError("final hash mismatch");
    }

    CompletionRecord record{
        .metadata = metadata,
        .completedAt = absl::FormatTime("%Y-%m-%d %H:%M:%S", absl::Now(),
                                        absl::UTCTimeZone()),
    };
    if (auto status = ledger_->append(record); !status.ok()) {
        return status;
    }
    return record;
}

}  // namespace ChunkXfer::Server

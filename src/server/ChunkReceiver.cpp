#include "ChunkReceiver.hpp"

#include <absl/log/log.h>
#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <fmt/format.h>

#include <TryParseStr.hpp>
#include <algorithm>
#include <hash/sha256.hpp>

namespace ChunkXfer::Server {

bool ChunkReceiver::isValidId(std::string_view id) {
    return !id.empty() && std::ranges::all_of(id, [](char c) {
        return absl::ascii_isalnum(static_cast<unsigned char>(c)) ||
               c == '_' || c == '-';
    });
}

absl::Status ChunkReceiver::receive(std::string_view id,
                                    std::string_view sequence,
                                    std::string_view claimedDigest,
                                    const ContentFeeder& feeder) const {
    if (!isValidId(id)) {
        return absl::InvalidArgumentError(
            fmt::format("Invalid upload id '{}'", id));
    }
    ChunkNumber chunkNumber = 0;
    if (!try_parse(sequence, &chunkNumber) || chunkNumber == 0) {
        return absl::InvalidArgumentError(
            fmt::format("Invalid chunk number '{}'", sequence));
    }
    if (claimedDigest.empty()) {
        return absl::InvalidArgumentError("Chunk hash is missing");
    }

    auto writer = storage_->openWriter(id, chunkNumber);
    if (!writer.ok()) {
        return writer.status();
    }

    SHA256 sha;
    absl::Status writeStatus;
    const bool fed = feeder([&](const char* data, size_t length) {
        sha.update(data, length);
        writeStatus = writer->write(data, length);
        return writeStatus.ok();
    });
    if (!writeStatus.ok()) {
        return writeStatus;
    }
    if (!fed) {
        LOG(WARNING) << fmt::format("Body of {} chunk {} was cut short", id,
                                    chunkNumber);
        return absl::InternalError("Failed to read chunk body");
    }

    const auto actual = SHA256::toHex(sha.finalize());
    if (!absl::EqualsIgnoreCase(actual, claimedDigest)) {
        LOG(WARNING) << fmt::format(
            "Chunk {} of {} rejected: expected {}, got {}", chunkNumber, id,
            claimedDigest, actual);
        writer->discard();
        return absl::DataLossError("Chunk hash mismatch");
    }

    if (auto status = writer->commit(); !status.ok()) {
        return status;
    }
    DLOG(INFO) << fmt::format("Stored chunk {} of {} ({} bytes)", chunkNumber,
                              id, writer->written());
    return absl::OkStatus();
}

}  // namespace ChunkXfer::Server

#include "ChunkStorage.hpp"

#include <absl/log/log.h>
#include <fmt/format.h>

#include <atomic>
#include <system_error>
#include <utility>

namespace ChunkXfer::Server {

namespace {

constexpr std::string_view kPartSeparator = "_part_";
constexpr std::string_view kTmpSuffix = ".tmp";

std::atomic_uint64_t tmpCounter{0};

}  // namespace

ChunkWriter::ChunkWriter(F file, std::filesystem::path tmpPath,
                         std::filesystem::path finalPath)
    : file_(std::move(file)),
      tmpPath_(std::move(tmpPath)),
      finalPath_(std::move(finalPath)) {}

ChunkWriter::ChunkWriter(ChunkWriter&& other) noexcept
    : file_(std::move(other.file_)),
      tmpPath_(std::move(other.tmpPath_)),
      finalPath_(std::move(other.finalPath_)),
      written_(other.written_),
      done_(other.done_) {
    other.done_ = true;
}

ChunkWriter::~ChunkWriter() {
    if (!done_) {
        discard();
    }
}

absl::Status ChunkWriter::write(const char* data, size_t length) {
    if (done_) {
        return absl::FailedPreconditionError("Chunk writer already closed");
    }
    if (!file_.write(data, length)) {
        PLOG(ERROR) << "Failed to write to " << tmpPath_;
        return absl::InternalError(
            fmt::format("write failed on {}", tmpPath_.filename().string()));
    }
    written_ += length;
    return absl::OkStatus();
}

absl::Status ChunkWriter::commit() {
    if (done_) {
        return absl::FailedPreconditionError("Chunk writer already closed");
    }
    done_ = true;
    if (!file_.close()) {
        std::error_code ec;
        std::filesystem::remove(tmpPath_, ec);
        return absl::InternalError(
            fmt::format("close failed on {}", tmpPath_.filename().string()));
    }
    std::error_code ec;
    std::filesystem::rename(tmpPath_, finalPath_, ec);
    if (ec) {
        LOG(ERROR) << "Failed to publish " << finalPath_ << ": "
                   << ec.message();
        std::filesystem::remove(tmpPath_, ec);
        return absl::InternalError(
            fmt::format("cannot store {}", finalPath_.filename().string()));
    }
    return absl::OkStatus();
}

void ChunkWriter::discard() {
    done_ = true;
    (void)file_.close();
    std::error_code ec;
    if (!std::filesystem::remove(tmpPath_, ec) && ec) {
        LOG(WARNING) << "Failed to remove " << tmpPath_ << ": "
                     << ec.message();
    }
}

ChunkStorage::ChunkStorage(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

std::string ChunkStorage::unitName(std::string_view id,
                                   ChunkNumber sequence) {
    return fmt::format("{}{}{}", id, kPartSeparator, sequence);
}

std::optional<std::string> ChunkStorage::ownerOf(std::string_view fileName) {
    const auto pos = fileName.rfind(kPartSeparator);
    if (pos == std::string_view::npos || pos == 0) {
        return std::nullopt;
    }
    auto rest = fileName.substr(pos + kPartSeparator.size());
    if (rest.empty() || rest.front() < '0' || rest.front() > '9') {
        return std::nullopt;
    }
    return std::string(fileName.substr(0, pos));
}

std::filesystem::path ChunkStorage::pathOf(std::string_view id,
                                           ChunkNumber sequence) const {
    return directory_ / unitName(id, sequence);
}

absl::StatusOr<ChunkWriter> ChunkStorage::openWriter(
    std::string_view id, ChunkNumber sequence) const {
    auto finalPath = pathOf(id, sequence);
    auto tmpPath = directory_ / fmt::format("{}{}{}", unitName(id, sequence),
                                            kTmpSuffix, ++tmpCounter);
    F file;
    if (!file.open(tmpPath, F::Mode::WriteBinary)) {
        return absl::InternalError(
            fmt::format("cannot create chunk file for {}",
                        unitName(id, sequence)));
    }
    return ChunkWriter(std::move(file), std::move(tmpPath),
                       std::move(finalPath));
}

bool ChunkStorage::exists(std::string_view id, ChunkNumber sequence) const {
    std::error_code ec;
    return std::filesystem::is_regular_file(pathOf(id, sequence), ec);
}

void ChunkStorage::removeChunks(std::string_view id,
                                ChunkNumber totalChunks) const {
    for (ChunkNumber sequence = 1; sequence <= totalChunks; ++sequence) {
        std::error_code ec;
        std::filesystem::remove(pathOf(id, sequence), ec);
        if (ec) {
            LOG(WARNING) << "Failed to remove " << unitName(id, sequence)
                         << ": " << ec.message();
        }
    }
}

size_t ChunkStorage::removeUpload(std::string_view id) const {
    return sweepOrphans(
        [id](std::string_view owner) { return owner != id; },
        std::filesystem::file_time_type::max());
}

size_t ChunkStorage::sweepOrphans(
    const std::function<bool(std::string_view)>& isLive,
    std::filesystem::file_time_type olderThan) const {
    size_t removed = 0;
    std::error_code ec;
    std::filesystem::directory_iterator it(directory_, ec);
    if (ec) {
        LOG(WARNING) << "Cannot list " << directory_ << ": " << ec.message();
        return 0;
    }
    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        const auto owner = ownerOf(entry.path().filename().string());
        if (!owner || isLive(*owner)) {
            continue;
        }
        const auto mtime = entry.last_write_time(ec);
        if (ec || mtime >= olderThan) {
            continue;
        }
        if (std::filesystem::remove(entry.path(), ec)) {
            DLOG(INFO) << "Removed orphan " << entry.path().filename();
            ++removed;
        } else if (ec) {
            LOG(WARNING) << "Failed to remove " << entry.path() << ": "
                         << ec.message();
        }
    }
    return removed;
}

}  // namespace ChunkXfer::Server

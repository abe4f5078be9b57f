#include "UploadReaper.hpp"

#include <absl/log/log.h>
#include <fmt/chrono.h>
#include <fmt/format.h>

#include <filesystem>

namespace ChunkXfer::Server {

UploadReaper::Result UploadReaper::sweep(
    MetadataStore::Clock::time_point now) {
    Result result{};
    const auto expired = store_->removeExpired(now - lease_);
    for (const auto& id : expired) {
        result.removedFiles += storage_->removeUpload(id);
    }
    result.expiredUploads = expired.size();

    // Chunks sent for ids that were never registered
    const auto fileCutoff = std::filesystem::file_time_type::clock::now() -
                            (std::chrono::system_clock::now() - now) - lease_;
    result.removedFiles += storage_->sweepOrphans(
        [this](std::string_view id) { return store_->contains(id); },
        fileCutoff);

    if (result.expiredUploads != 0 || result.removedFiles != 0) {
        LOG(INFO) << fmt::format("Reaper: expired {} uploads, removed {} files",
                                 result.expiredUploads, result.removedFiles);
    }
    return result;
}

void UploadReaper::runFunction(const std::stop_token& token) {
    LOG(INFO) << fmt::format("Reaper running every {}, lease {}", interval_,
                             lease_);
    while (!token.stop_requested()) {
        sweep(MetadataStore::Clock::now());
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, token, interval_, [] { return false; });
    }
    DLOG(INFO) << "Reaper stopped";
}

void UploadReaper::onPreStop() { cv_.notify_all(); }

}  // namespace ChunkXfer::Server

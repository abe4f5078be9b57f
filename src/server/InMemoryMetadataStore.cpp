#include <absl/log/log.h>
#include <absl/status/status.h>
#include <fmt/format.h>

#include "MetadataStore.hpp"

namespace ChunkXfer::Server {

bool InMemoryMetadataStore::insert(const UploadMetadata& metadata,
                                   Clock::time_point registeredAt) {
    const std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = uploads_.try_emplace(
        metadata.id, Slot{.entry = {.metadata = metadata,
                                    .state = UploadState::kRegistered,
                                    .registeredAt = registeredAt}});
    return inserted;
}

std::optional<UploadEntry> InMemoryMetadataStore::find(
    std::string_view id) const {
    const std::lock_guard<std::mutex> lock(mutex_);
    auto it = uploads_.find(std::string(id));
    if (it == uploads_.end()) {
        return std::nullopt;
    }
    return it->second.entry;
}

bool InMemoryMetadataStore::contains(std::string_view id) const {
    const std::lock_guard<std::mutex> lock(mutex_);
    return uploads_.contains(std::string(id));
}

absl::StatusOr<UploadEntry> InMemoryMetadataStore::beginCompletion(
    std::string_view id) {
    const std::lock_guard<std::mutex> lock(mutex_);
    auto it = uploads_.find(std::string(id));
    if (it == uploads_.end()) {
        return absl::NotFoundError(
            fmt::format("metadata not found for {}", id));
    }
    auto& slot = it->second;
    if (slot.entry.state == UploadState::kCompleting) {
        return absl::FailedPreconditionError(
            fmt::format("completion already in progress for {}", id));
    }
    UploadEntry before = slot.entry;
    slot.resumeState = slot.entry.state;
    slot.entry.state = UploadState::kCompleting;
    return before;
}

void InMemoryMetadataStore::finishCompletion(std::string_view id,
                                             bool succeeded) {
    const std::lock_guard<std::mutex> lock(mutex_);
    auto it = uploads_.find(std::string(id));
    if (it == uploads_.end()) {
        LOG(WARNING) << "Finishing completion of unknown upload " << id;
        return;
    }
    auto& slot = it->second;
    slot.entry.state =
        succeeded ? UploadState::kCompleted : slot.resumeState;
}

std::vector<std::string> InMemoryMetadataStore::removeExpired(
    Clock::time_point cutoff) {
    const std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> removed;
    for (auto it = uploads_.begin(); it != uploads_.end();) {
        const auto& entry = it->second.entry;
        if (entry.registeredAt < cutoff &&
            entry.state != UploadState::kCompleting) {
            removed.emplace_back(it->first);
            it = uploads_.erase(it);
        } else {
            ++it;
        }
    }
    return removed;
}

size_t InMemoryMetadataStore::size() const {
    const std::lock_guard<std::mutex> lock(mutex_);
    return uploads_.size();
}

}  // namespace ChunkXfer::Server

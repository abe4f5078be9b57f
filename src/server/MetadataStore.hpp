#pragma once

#include <absl/status/statusor.h>
#include <fruit/macro.h>

#include <api/DataStructures.hpp>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ChunkXfer::Server {

enum class UploadState {
    kRegistered,
    kCompleting,
    kCompleted,
};

struct UploadEntry {
    using Clock = std::chrono::system_clock;

    UploadMetadata metadata;
    UploadState state = UploadState::kRegistered;
    Clock::time_point registeredAt;
};

// Table of registered uploads, keyed by upload id.
class MetadataStore {
   public:
    using Clock = UploadEntry::Clock;

    virtual ~MetadataStore() = default;

    /**
     * @brief Adds a freshly registered upload.
     *
     * @return false if the id is already taken, the table is left untouched.
     */
    virtual bool insert(const UploadMetadata& metadata,
                        Clock::time_point registeredAt) = 0;

    [[nodiscard]] virtual std::optional<UploadEntry> find(
        std::string_view id) const = 0;

    [[nodiscard]] virtual bool contains(std::string_view id) const = 0;

    /**
     * @brief Marks an upload as being reassembled.
     *
     * @return the entry with the state it had before this call, NotFound if
     * the id is unknown, or FailedPrecondition if another completion holds it.
     */
    virtual absl::StatusOr<UploadEntry> beginCompletion(
        std::string_view id) = 0;

    /**
     * @brief Ends what beginCompletion started. On failure the upload goes
     * back to the state it had before.
     */
    virtual void finishCompletion(std::string_view id, bool succeeded) = 0;

    /**
     * @brief Drops uploads registered before `cutoff`. Uploads being
     * reassembled are kept.
     *
     * @return ids of the dropped uploads
     */
    virtual std::vector<std::string> removeExpired(
        Clock::time_point cutoff) = 0;

    [[nodiscard]] virtual size_t size() const = 0;
};

class InMemoryMetadataStore : public MetadataStore {
   public:
    INJECT(InMemoryMetadataStore()) = default;
    ~InMemoryMetadataStore() override = default;

    bool insert(const UploadMetadata& metadata,
                Clock::time_point registeredAt) override;
    [[nodiscard]] std::optional<UploadEntry> find(
        std::string_view id) const override;
    [[nodiscard]] bool contains(std::string_view id) const override;
    absl::StatusOr<UploadEntry> beginCompletion(
        std::string_view id) override;
    void finishCompletion(std::string_view id, bool succeeded) override;
    std::vector<std::string> removeExpired(Clock::time_point cutoff) override;
    [[nodiscard]] size_t size() const override;

   private:
    struct Slot {
        UploadEntry entry;
        // Where a failed completion returns to
        UploadState resumeState = UploadState::kRegistered;
    };
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Slot> uploads_;
};

}  // namespace ChunkXfer::Server

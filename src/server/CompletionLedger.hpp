#pragma once

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include <api/DataStructures.hpp>
#include <filesystem>
#include <mutex>
#include <utility>
#include <vector>

namespace ChunkXfer::Server {

// Append-only JSON array of completed uploads.
class CompletionLedger {
   public:
    explicit CompletionLedger(std::filesystem::path path)
        : path_(std::move(path)) {}

    /**
     * @brief Appends a record, rewriting the file through a temporary copy.
     *
     * A missing ledger counts as empty. A ledger that can't be parsed is
     * left as is and the append fails.
     */
    absl::Status append(const CompletionRecord& record);

    absl::StatusOr<std::vector<CompletionRecord>> readAll() const;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

   private:
    absl::StatusOr<Json::Value> load() const;

    std::filesystem::path path_;
    mutable std::mutex mutex_;
};

}  // namespace ChunkXfer::Server

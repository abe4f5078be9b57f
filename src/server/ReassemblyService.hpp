#pragma once

#include <absl/status/statusor.h>

#include <api/DataStructures.hpp>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

#include "ChunkStorage.hpp"
#include "CompletionLedger.hpp"
#include "MetadataStore.hpp"

namespace ChunkXfer::Server {

class ReassemblyService {
   public:
    static constexpr std::string_view kFinalPrefix = "final_";

    ReassemblyService(MetadataStore* store, const ChunkStorage* storage,
                      CompletionLedger* ledger,
                      std::filesystem::path outputDir)
        : store_(store),
          storage_(storage),
          ledger_(ledger),
          outputDir_(std::move(outputDir)) {}

    // Where the reassembled copy of `fileName` is written.
    [[nodiscard]] std::filesystem::path destinationOf(
        std::string_view fileName) const;

    /**
     * @brief Joins the chunks of an upload and verifies the result.
     *
     * Chunks are folded in order into final_<fileName>, which is then hashed
     * and compared against the registered digest. Only a verified file gets
     * a ledger entry, and only then are its chunks deleted. A failed attempt
     * leaves the partial destination on disk and can be retried. Completing
     * an upload again fails with a missing chunk before its verified
     * destination is touched.
     *
     * @return the ledger entry, or
     * NotFound if the upload isn't registered,
     * FailedPrecondition on a missing chunk or a concurrent completion,
     * DataLoss if the reassembled file doesn't match,
     * Internal on I/O errors.
     */
    absl::StatusOr<CompletionRecord> complete(std::string_view id);

   private:
    // `verifiedBefore` is set when a previous completion of the upload
    // succeeded.
    absl::StatusOr<CompletionRecord> reassemble(const UploadMetadata& metadata,
                                                bool verifiedBefore);

    MetadataStore* store_;
    const ChunkStorage* storage_;
    CompletionLedger* ledger_;
    std::filesystem::path outputDir_;
};

}  // namespace ChunkXfer::Server

#pragma once

#include <absl/status/status.h>

#include <api/DataStructures.hpp>
#include <functional>
#include <string_view>

#include "ChunkStorage.hpp"

namespace ChunkXfer::Server {

// Receives the body of one chunk, block by block.
// A sink returning false stops the feed.
using ContentSink = std::function<bool(const char* data, size_t length)>;
// Pushes every block of the body into the sink, false on transport errors.
using ContentFeeder = std::function<bool(const ContentSink& sink)>;

class ChunkReceiver {
   public:
    explicit ChunkReceiver(const ChunkStorage* storage) : storage_(storage) {}

    // Upload ids end up in file names, so only [A-Za-z0-9_-] is accepted.
    static bool isValidId(std::string_view id);

    /**
     * @brief Stores one chunk after checking it against its digest.
     *
     * The body is hashed while it's written to a temporary file, which only
     * replaces the stored chunk if the digests match.
     *
     * @param id upload id, not checked against the registered uploads
     * @param sequence 1-based chunk number as it appeared in the request
     * @param claimedDigest hex SHA-256 the sender computed, any case
     * @param feeder source of the chunk body
     * @return InvalidArgument on a malformed request, DataLoss on a digest
     * mismatch, Internal on I/O errors.
     */
    absl::Status receive(std::string_view id, std::string_view sequence,
                         std::string_view claimedDigest,
                         const ContentFeeder& feeder) const;

   private:
    const ChunkStorage* storage_;
};

}  // namespace ChunkXfer::Server

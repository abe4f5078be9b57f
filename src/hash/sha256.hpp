#pragma once

#include <absl/status/statusor.h>
#include <openssl/evp.h>
#include <openssl/sha.h>

#include <array>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace ChunkXfer {

// Incremental SHA-256, backed by OpenSSL's EVP digest interface.
class SHA256 {
   public:
    using result_type = std::array<uint8_t, SHA256_DIGEST_LENGTH>;
    // Length of a digest in lowercase hex.
    static constexpr size_t kHexLength = SHA256_DIGEST_LENGTH * 2;

    SHA256();

    void update(const void* data, std::size_t length);
    void update(std::string_view data) { update(data.data(), data.size()); }

    // Returns the digest of everything fed so far, and starts over.
    result_type finalize();

    static result_type compute(const uint8_t* data, std::size_t length);

    /**
     * @brief Hashes the whole content of a file, reading it in blocks.
     *
     * @return the digest, or NotFound / DataLoss if the file can't be read.
     */
    static absl::StatusOr<result_type> computeFile(
        const std::filesystem::path& path);

    static std::string toHex(const result_type& digest);

   private:
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx_;
    void reset();
};

}  // namespace ChunkXfer

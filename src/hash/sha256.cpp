#include "sha256.hpp"

#include <absl/log/check.h>
#include <absl/log/log.h>
#include <absl/status/status.h>
#include <absl/strings/escaping.h>
#include <absl/strings/string_view.h>
#include <fmt/format.h>

#include <StructF.hpp>
#include <system_error>
#include <vector>

namespace ChunkXfer {

namespace {
constexpr size_t kReadBlockSize = 64 * 1024;
}  // namespace

SHA256::SHA256() : ctx_(EVP_MD_CTX_new(), &EVP_MD_CTX_free) {
    CHECK(ctx_ != nullptr) << "Failed to create EVP_MD_CTX";
    reset();
}

void SHA256::reset() {
    CHECK_EQ(EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr), 1)
        << "EVP_DigestInit_ex failed";
}

void SHA256::update(const void* data, std::size_t length) {
    if (length == 0) {
        return;
    }
    CHECK_EQ(EVP_DigestUpdate(ctx_.get(), data, length), 1)
        << "EVP_DigestUpdate failed";
}

SHA256::result_type SHA256::finalize() {
    result_type hash{};
    unsigned int len = 0;
    CHECK_EQ(EVP_DigestFinal_ex(ctx_.get(), hash.data(), &len), 1)
        << "EVP_DigestFinal_ex failed";
    CHECK_EQ(len, hash.size());
    reset();
    return hash;
}

SHA256::result_type SHA256::compute(const uint8_t* data, std::size_t length) {
    SHA256 sha;
    sha.update(data, length);
    return sha.finalize();
}

absl::StatusOr<SHA256::result_type> SHA256::computeFile(
    const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return absl::NotFoundError(
            fmt::format("{} is not a regular file", path.string()));
    }
    F file;
    if (!file.open(path, F::Mode::ReadBinary)) {
        return absl::NotFoundError(
            fmt::format("Cannot open {}", path.string()));
    }

    SHA256 sha;
    std::vector<char> buffer(kReadBlockSize);
    F::size_type got = 0;
    while ((got = file.readSome(buffer.data(), buffer.size())) > 0) {
        sha.update(buffer.data(), got);
    }
    if (file.error()) {
        return absl::DataLossError(
            fmt::format("Read error while hashing {}", path.string()));
    }
    return sha.finalize();
}

std::string SHA256::toHex(const result_type& digest) {
    return absl::BytesToHexString(absl::string_view(
        reinterpret_cast<const char*>(digest.data()), digest.size()));
}

}  // namespace ChunkXfer

#include <Random.hpp>

#include <absl/log/check.h>
#include <absl/log/log.h>
#include <absl/strings/escaping.h>
#include <absl/strings/string_view.h>
#include <fmt/format.h>
#include <openssl/rand.h>

#include <mutex>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::mt19937_64 RNG_std_create_rng() {
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd()};
    return std::mt19937_64(seq);
}

}  // namespace

Random::Random() : engine_(RNG_std_create_rng()) {
    DLOG(INFO) << "Using STD C++ pesudo RNG for sizes, OpenSSL for tokens";
}

Random::ret_type Random::generate(const ret_type min,
                                  const ret_type max) const {
    if (min > max) {
        throw std::invalid_argument(
            fmt::format("Invalid range: min({}) > max({})", min, max));
    }
    if (min == max) {
        return min;
    }
    std::uniform_int_distribution<ret_type> distribution(min, max);
    const std::lock_guard<std::mutex> lock(mutex_);
    return distribution(engine_);
}

std::string Random::token(const size_t bytes) const {
    std::vector<unsigned char> buffer(bytes);
    // Running out of entropy is not something the caller can recover from
    CHECK_EQ(RAND_bytes(buffer.data(), static_cast<int>(buffer.size())), 1)
        << "RAND_bytes failed";
    return absl::BytesToHexString(absl::string_view(
        reinterpret_cast<const char*>(buffer.data()), buffer.size()));
}

#pragma once

#include <fruit/macro.h>

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

// Source of randomness used by the upload server, mockable in tests.
struct RandomBase {
    using ret_type = int64_t;

    virtual ~RandomBase() = default;

    /**
     * @brief Generate a random number in the closed range [min, max].
     *
     * @throws std::invalid_argument if min > max.
     */
    [[nodiscard]] virtual ret_type generate(const ret_type min,
                                            const ret_type max) const = 0;

    /**
     * @brief Generate `bytes` bytes from a cryptographically secure source,
     * hex encoded in lowercase.
     */
    [[nodiscard]] virtual std::string token(const size_t bytes) const = 0;
};

class Random : public RandomBase {
   public:
    INJECT(Random());
    ~Random() override = default;

    [[nodiscard]] ret_type generate(const ret_type min,
                                    const ret_type max) const override;
    [[nodiscard]] std::string token(const size_t bytes) const override;

   private:
    mutable std::mutex mutex_;
    mutable std::mt19937_64 engine_;
};

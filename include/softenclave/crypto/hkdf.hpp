#pragma once

#include "softenclave/core/result.hpp"
#include "softenclave/core/failures.hpp"

#include <span>
#include <vector>
#include <cstdint>

namespace softenclave::channel::crypto {

/**
 * @brief HKDF-SHA256 (RFC 5869) over OpenSSL's EVP_KDF
 *
 * Extract-then-expand in one call. Salt and info may be empty.
 */
class Hkdf {
public:
    /**
     * @brief Fill output with HKDF-SHA256(ikm, salt, info)
     *
     * output may point into guarded memory; nothing is copied elsewhere.
     */
    static Result<Unit, ChannelFailure> DeriveKey(
        std::span<const uint8_t> ikm,
        std::span<uint8_t> output,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static Result<std::vector<uint8_t>, ChannelFailure> DeriveKeyBytes(
        std::span<const uint8_t> ikm,
        size_t output_size,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static constexpr size_t HASH_LEN = 32;
    static constexpr size_t MAX_OUTPUT_LEN = 255 * HASH_LEN;

private:
    Hkdf() = delete;
};

} // namespace softenclave::channel::crypto

#pragma once
#include "softenclave/core/result.hpp"
#include "softenclave/core/failures.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace softenclave::channel::crypto {

/**
 * AES-256-GCM authenticated encryption (OpenSSL EVP).
 *
 * Stateless. A (key, nonce) pair must never be used for two encryptions; the
 * channel guarantees this by deriving every nonce from a strictly increasing
 * per-direction sequence number (see protocol/nonce.hpp).
 *
 * Output layout of Encrypt: ciphertext || 16-byte tag.
 * Decrypt returns an Authentication failure when the tag does not verify,
 * which covers a wrong key, a wrong nonce, altered ciphertext and altered
 * associated data alike.
 */
class AesGcm {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, ChannelFailure>
    Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});
    [[nodiscard]] static Result<std::vector<uint8_t>, ChannelFailure>
    Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext_with_tag,
        std::span<const uint8_t> associated_data = {});
private:
    AesGcm() = delete;
};
}

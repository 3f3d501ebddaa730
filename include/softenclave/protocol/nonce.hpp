#pragma once
#include "softenclave/core/failures.hpp"
#include "softenclave/core/result.hpp"
#include "softenclave/protocol/constants.hpp"
#include <array>
#include <cstdint>
#include <span>

namespace softenclave::channel {

using Nonce = std::array<uint8_t, kAesGcmNonceBytes>;

/// Derives the per-message AES-GCM nonce: base_iv with the big-endian 32-bit
/// sequence XORed into bytes 8..11.
///
/// sequence must lie in [1, 2^32 - 1]; 0 and anything wider than 32 bits is an
/// InvalidSequence failure, so the counter can never wrap onto a used nonce.
[[nodiscard]] Result<Nonce, ChannelFailure> NonceFromSequence(
    std::span<const uint8_t> base_iv,
    uint64_t sequence);

}  // namespace softenclave::channel

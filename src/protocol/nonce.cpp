#include "softenclave/protocol/nonce.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace softenclave::channel {

    namespace {
        static_assert(kNonceSequenceOffset + kNonceSequenceBytes == kAesGcmNonceBytes,
                      "Sequence must occupy the trailing nonce bytes");
    }

    Result<Nonce, ChannelFailure> NonceFromSequence(
        std::span<const uint8_t> base_iv,
        const uint64_t sequence) {
        if (base_iv.size() != kAesGcmNonceBytes) {
            return Result<Nonce, ChannelFailure>::Err(
                ChannelFailure::InvalidInput(
                    fmt::format("Base IV must be {} bytes, got {}", kAesGcmNonceBytes, base_iv.size())));
        }
        if (sequence < kMinSequence || sequence > kMaxSequence) {
            return Result<Nonce, ChannelFailure>::Err(
                ChannelFailure::InvalidSequence(
                    fmt::format("Sequence {} outside [{}, {}]", sequence, kMinSequence, kMaxSequence)));
        }

        Nonce nonce{};
        std::copy(base_iv.begin(), base_iv.end(), nonce.begin());

        const auto sequence32 = static_cast<uint32_t>(sequence);
        for (size_t i = 0; i < kNonceSequenceBytes; ++i) {
            const auto shift = static_cast<uint32_t>((kNonceSequenceBytes - 1 - i) * 8);
            nonce[kNonceSequenceOffset + i] ^= static_cast<uint8_t>((sequence32 >> shift) & 0xFF);
        }
        return Result<Nonce, ChannelFailure>::Ok(nonce);
    }

}

#pragma once
#include "softenclave/core/failures.hpp"
#include "softenclave/core/result.hpp"
#include "softenclave/crypto/sodium_secure_memory_handle.hpp"
#include "softenclave/models/session_context.hpp"
#include "softenclave/models/session_keys.hpp"
#include "softenclave/protocol/constants.hpp"
#include <array>
#include <cstdint>
#include <span>

namespace softenclave::channel {

using TranscriptDigest = std::array<uint8_t, kSha256Bytes>;

/// Turns one X25519 agreement plus a SessionContext into SessionKeys.
///
///   shared = X25519(local_private, remote_public)
///   salt   = SHA-256(local_endpoint_id | remote_endpoint_id | code_identity)
///   for d in {host->enclave, enclave->host}:
///     aead_key_d = HKDF-SHA256(shared, salt, "soft-enclave/v1/aead/" d [transcript], 32)
///     base_iv_d  = HKDF-SHA256(shared, salt, "soft-enclave/v1/iv/"   d [transcript], 12)
///
/// transcript is SHA-256 of the two ephemeral public keys in byte-wise order; pass
/// an empty span to derive context-bound keys only. The shared secret lives in
/// guarded memory and is freed before returning on every path.
class SessionDeriver {
public:
    [[nodiscard]] static Result<models::SessionKeys, ChannelFailure> DeriveSession(
        const crypto::SecureMemoryHandle& local_private_key,
        std::span<const uint8_t> remote_public_key,
        const models::SessionContext& context,
        std::span<const uint8_t> transcript_hash = {});

    [[nodiscard]] static Result<TranscriptDigest, ChannelFailure> TranscriptHash(
        std::span<const uint8_t> public_key_a,
        std::span<const uint8_t> public_key_b);

    [[nodiscard]] static TranscriptDigest ContextSalt(const models::SessionContext& context);

private:
    SessionDeriver() = delete;
};

}  // namespace softenclave::channel

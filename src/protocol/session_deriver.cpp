#include "softenclave/protocol/session_deriver.hpp"
#include "softenclave/crypto/hkdf.hpp"
#include "softenclave/crypto/sodium_interop.hpp"
#include "softenclave/security/validation/dh_validator.hpp"
#include <algorithm>
#include <fmt/format.h>
#include <string_view>
#include <vector>

namespace softenclave::channel {
    using crypto::Hkdf;
    using crypto::SecureMemoryHandle;
    using crypto::SodiumInterop;
    using models::DirectionalKeys;
    using models::SessionContext;
    using models::SessionKeys;
    using security::DhValidator;

    namespace {
        std::vector<uint8_t> BuildInfo(
            std::string_view purpose,
            std::string_view direction,
            std::span<const uint8_t> transcript_hash) {
            std::vector<uint8_t> info;
            info.reserve(kKdfInfoBase.size() + purpose.size() + direction.size() + transcript_hash.size());
            info.insert(info.end(), kKdfInfoBase.begin(), kKdfInfoBase.end());
            info.insert(info.end(), purpose.begin(), purpose.end());
            info.insert(info.end(), direction.begin(), direction.end());
            info.insert(info.end(), transcript_hash.begin(), transcript_hash.end());
            return info;
        }

        Result<DirectionalKeys, ChannelFailure> DeriveDirection(
            std::span<const uint8_t> shared_secret,
            std::span<const uint8_t> salt,
            std::string_view direction,
            std::span<const uint8_t> transcript_hash) {
            auto key_result = SecureMemoryHandle::Allocate(kAesKeyBytes);
            if (key_result.IsErr()) {
                return Result<DirectionalKeys, ChannelFailure>::Err(
                    ChannelFailure::FromSodiumFailure(key_result.UnwrapErr()));
            }
            DirectionalKeys keys{std::move(key_result).Unwrap(), {}};

            const auto aead_info = BuildInfo(kAeadKeyLabel, direction, transcript_hash);
            auto write_result = keys.aead_key.WithWriteAccess([&](std::span<uint8_t> out) {
                return Hkdf::DeriveKey(shared_secret, out, salt, aead_info);
            });
            if (write_result.IsErr()) {
                return Result<DirectionalKeys, ChannelFailure>::Err(
                    ChannelFailure::FromSodiumFailure(write_result.UnwrapErr()));
            }
            if (auto derive_result = std::move(write_result).Unwrap(); derive_result.IsErr()) {
                return Result<DirectionalKeys, ChannelFailure>::Err(
                    ChannelFailure::DeriveKey(
                        fmt::format("AEAD key derivation failed: {}", derive_result.UnwrapErr().message)));
            }

            const auto iv_info = BuildInfo(kBaseIvLabel, direction, transcript_hash);
            if (auto iv_result = Hkdf::DeriveKey(shared_secret, keys.base_iv, salt, iv_info); iv_result.IsErr()) {
                return Result<DirectionalKeys, ChannelFailure>::Err(
                    ChannelFailure::DeriveKey(
                        fmt::format("Base IV derivation failed: {}", iv_result.UnwrapErr().message)));
            }

            return Result<DirectionalKeys, ChannelFailure>::Ok(std::move(keys));
        }

        Result<SessionKeys, ChannelFailure> DeriveBothDirections(
            std::span<const uint8_t> shared_secret,
            std::span<const uint8_t> salt,
            std::span<const uint8_t> transcript_hash) {
            auto host_to_enclave = DeriveDirection(shared_secret, salt, kHostToEnclaveLabel, transcript_hash);
            if (host_to_enclave.IsErr()) {
                return Result<SessionKeys, ChannelFailure>::Err(std::move(host_to_enclave).UnwrapErr());
            }
            auto enclave_to_host = DeriveDirection(shared_secret, salt, kEnclaveToHostLabel, transcript_hash);
            if (enclave_to_host.IsErr()) {
                return Result<SessionKeys, ChannelFailure>::Err(std::move(enclave_to_host).UnwrapErr());
            }
            return Result<SessionKeys, ChannelFailure>::Ok(
                SessionKeys(std::move(host_to_enclave).Unwrap(), std::move(enclave_to_host).Unwrap()));
        }
    }

    Result<SessionKeys, ChannelFailure> SessionDeriver::DeriveSession(
        const SecureMemoryHandle& local_private_key,
        std::span<const uint8_t> remote_public_key,
        const SessionContext& context,
        std::span<const uint8_t> transcript_hash) {
        if (!transcript_hash.empty() && transcript_hash.size() != kSha256Bytes) {
            return Result<SessionKeys, ChannelFailure>::Err(
                ChannelFailure::InvalidInput(
                    fmt::format("Transcript hash must be {} bytes, got {}", kSha256Bytes, transcript_hash.size())));
        }
        if (auto valid = DhValidator::ValidateX25519PublicKey(remote_public_key); valid.IsErr()) {
            return Result<SessionKeys, ChannelFailure>::Err(
                ChannelFailure::KeyAgreement(valid.UnwrapErr().message));
        }

        auto shared_result = SodiumInterop::ComputeX25519SharedSecret(local_private_key, remote_public_key);
        if (shared_result.IsErr()) {
            auto failure = std::move(shared_result).UnwrapErr();
            if (failure.type != ChannelFailureType::KeyAgreement) {
                failure = ChannelFailure::KeyAgreement(failure.message);
            }
            return Result<SessionKeys, ChannelFailure>::Err(std::move(failure));
        }
        SecureMemoryHandle shared = std::move(shared_result).Unwrap();

        const TranscriptDigest salt = ContextSalt(context);
        auto derived = shared.WithReadAccess([&](std::span<const uint8_t> ikm) {
            return DeriveBothDirections(ikm, salt, transcript_hash);
        });
        shared.Reset();

        if (derived.IsErr()) {
            return Result<SessionKeys, ChannelFailure>::Err(
                ChannelFailure::FromSodiumFailure(derived.UnwrapErr()));
        }
        return std::move(derived).Unwrap();
    }

    Result<TranscriptDigest, ChannelFailure> SessionDeriver::TranscriptHash(
        std::span<const uint8_t> public_key_a,
        std::span<const uint8_t> public_key_b) {
        if (public_key_a.size() != kX25519PublicKeyBytes || public_key_b.size() != kX25519PublicKeyBytes) {
            return Result<TranscriptDigest, ChannelFailure>::Err(
                ChannelFailure::InvalidInput("Transcript requires two X25519 public keys"));
        }
        const bool a_first = std::lexicographical_compare(
            public_key_a.begin(), public_key_a.end(),
            public_key_b.begin(), public_key_b.end());
        const auto first = a_first ? public_key_a : public_key_b;
        const auto second = a_first ? public_key_b : public_key_a;

        std::vector<uint8_t> transcript;
        transcript.reserve(first.size() + second.size());
        transcript.insert(transcript.end(), first.begin(), first.end());
        transcript.insert(transcript.end(), second.begin(), second.end());
        return Result<TranscriptDigest, ChannelFailure>::Ok(SodiumInterop::Sha256(transcript));
    }

    TranscriptDigest SessionDeriver::ContextSalt(const SessionContext& context) {
        const std::string salt_input = context.SaltInput();
        return SodiumInterop::Sha256(std::span<const uint8_t>(
            reinterpret_cast<const uint8_t*>(salt_input.data()), salt_input.size()));
    }

}

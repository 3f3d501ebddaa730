#include "softenclave/crypto/sodium_interop.hpp"
#include "softenclave/crypto/sodium_secure_memory_handle.hpp"

#include <fmt/format.h>
#include <string>

namespace softenclave::channel::crypto {

namespace {
    using KeyPair = std::pair<SecureMemoryHandle, std::vector<uint8_t>>;
    using KeyPairResult = Result<KeyPair, ChannelFailure>;
    using SecretResult = Result<SecureMemoryHandle, ChannelFailure>;

    Result<SecureMemoryHandle, ChannelFailure> AllocateGuarded(const size_t size) {
        return SecureMemoryHandle::Allocate(size).MapErr([](SodiumFailure failure) {
            return ChannelFailure::FromSodiumFailure(failure);
        });
    }
}

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, [] {
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });
    if (IsInitialized()) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }
    return Result<Unit, SodiumFailure>::Err(
        SodiumFailure::InitializationFailed(std::string(ErrorMessages::SODIUM_INIT_FAILED)));
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

void SodiumInterop::SecureWipe(std::span<uint8_t> buffer) noexcept {
    if (!buffer.empty()) {
        sodium_memzero(buffer.data(), buffer.size());
    }
}

Result<bool, SodiumFailure> SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) {
    if (!IsInitialized()) {
        return Result<bool, SodiumFailure>::Err(SodiumFailure::ComparisonFailed(
            fmt::format("{}: {}", ErrorMessages::CONSTANT_TIME_COMPARISON_FAILED,
                        ErrorMessages::NOT_INITIALIZED)));
    }
    if (a.size() != b.size()) {
        return Result<bool, SodiumFailure>::Ok(false);
    }
    const bool equal = a.empty() || sodium_memcmp(a.data(), b.data(), a.size()) == 0;
    return Result<bool, SodiumFailure>::Ok(equal);
}

Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ChannelFailure>
SodiumInterop::GenerateX25519KeyPair(std::string_view key_purpose) {
    auto allocated = AllocateGuarded(Constants::X_25519_PRIVATE_KEY_SIZE);
    if (allocated.IsErr()) {
        return KeyPairResult::Err(std::move(allocated).UnwrapErr());
    }
    auto scalar = std::move(allocated).Unwrap();

    std::vector<uint8_t> public_key(Constants::X_25519_PUBLIC_KEY_SIZE);
    auto written = scalar.WithWriteAccess([&public_key](std::span<uint8_t> sk) {
        randombytes_buf(sk.data(), sk.size());
        return crypto_scalarmult_base(public_key.data(), sk.data());
    });
    if (written.IsErr()) {
        return KeyPairResult::Err(ChannelFailure::FromSodiumFailure(written.UnwrapErr()));
    }
    if (written.Unwrap() != SodiumConstants::SUCCESS) {
        return KeyPairResult::Err(ChannelFailure::KeyGeneration(
            fmt::format("Failed to derive {} public key", key_purpose)));
    }
    return KeyPairResult::Ok(KeyPair(std::move(scalar), std::move(public_key)));
}

Result<SecureMemoryHandle, ChannelFailure> SodiumInterop::ComputeX25519SharedSecret(
    const SecureMemoryHandle& private_key,
    std::span<const uint8_t> peer_public_key) {
    if (private_key.Size() != Constants::X_25519_PRIVATE_KEY_SIZE ||
        peer_public_key.size() != Constants::X_25519_PUBLIC_KEY_SIZE) {
        return SecretResult::Err(ChannelFailure::KeyAgreement(fmt::format(
            "X25519 expects {}-byte keys, got private {} and public {}",
            Constants::X_25519_PUBLIC_KEY_SIZE, private_key.Size(), peer_public_key.size())));
    }

    auto allocated = AllocateGuarded(Constants::X_25519_SHARED_SECRET_SIZE);
    if (allocated.IsErr()) {
        return allocated;
    }
    auto shared = std::move(allocated).Unwrap();

    // Outer failure: handle access. Inner int: libsodium's verdict on the point.
    auto agreed = private_key.WithReadAccess([&](std::span<const uint8_t> sk) {
        return shared.WithWriteAccess([&](std::span<uint8_t> out) {
            return crypto_scalarmult(out.data(), sk.data(), peer_public_key.data());
        });
    });
    if (agreed.IsErr()) {
        return SecretResult::Err(ChannelFailure::FromSodiumFailure(agreed.UnwrapErr()));
    }
    if (agreed.Unwrap().IsErr()) {
        return SecretResult::Err(ChannelFailure::FromSodiumFailure(agreed.Unwrap().UnwrapErr()));
    }
    if (agreed.Unwrap().Unwrap() != SodiumConstants::SUCCESS) {
        return SecretResult::Err(
            ChannelFailure::KeyAgreement("X25519 key agreement produced a degenerate shared secret"));
    }
    return SecretResult::Ok(std::move(shared));
}

std::array<uint8_t, Constants::SHA_256_DIGEST_SIZE> SodiumInterop::Sha256(
    std::span<const uint8_t> data) {
    std::array<uint8_t, Constants::SHA_256_DIGEST_SIZE> digest{};
    crypto_hash_sha256(digest.data(), data.data(), data.size());
    return digest;
}

std::vector<uint8_t> SodiumInterop::GetRandomBytes(const size_t size) {
    std::vector<uint8_t> bytes(size);
    if (size > 0) {
        randombytes_buf(bytes.data(), size);
    }
    return bytes;
}

void* SodiumInterop::AllocateSecure(const size_t size) noexcept {
    return IsInitialized() ? sodium_malloc(size) : nullptr;
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

}

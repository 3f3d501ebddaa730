#pragma once
#include "softenclave/core/failures.hpp"
#include "softenclave/core/result.hpp"
#include "softenclave/crypto/sodium_secure_memory_handle.hpp"
#include <vector>
#include <cstdint>
namespace softenclave::channel::models {
/// Single-use X25519 key pair for one handshake attempt.
/// The private scalar stays in guarded memory and is freed by Wipe() or destruction.
class EphemeralKeyPair {
public:
    [[nodiscard]] static Result<EphemeralKeyPair, ChannelFailure> Generate();
    EphemeralKeyPair(EphemeralKeyPair&&) noexcept = default;
    EphemeralKeyPair& operator=(EphemeralKeyPair&&) noexcept = default;
    EphemeralKeyPair(const EphemeralKeyPair&) = delete;
    EphemeralKeyPair& operator=(const EphemeralKeyPair&) = delete;
    ~EphemeralKeyPair() = default;
    [[nodiscard]] const crypto::SecureMemoryHandle& GetPrivateKeyHandle() const noexcept {
        return private_key_handle_;
    }
    [[nodiscard]] const std::vector<uint8_t>& GetPublicKey() const noexcept {
        return public_key_;
    }
    [[nodiscard]] bool IsWiped() const noexcept {
        return private_key_handle_.IsInvalid();
    }
    void Wipe() noexcept;
private:
    EphemeralKeyPair(
        crypto::SecureMemoryHandle private_key_handle,
        std::vector<uint8_t> public_key);
    crypto::SecureMemoryHandle private_key_handle_;
    std::vector<uint8_t> public_key_;
};
}

#pragma once
#include "softenclave/crypto/sodium_secure_memory_handle.hpp"
#include "softenclave/enums/endpoint_role.hpp"
#include "softenclave/protocol/constants.hpp"
#include <array>
#include <chrono>
#include <cstdint>
namespace softenclave::channel::models {
struct DirectionalKeys {
    crypto::SecureMemoryHandle aead_key;
    std::array<uint8_t, kAesGcmNonceBytes> base_iv{};
};
/// Symmetric material for one session, one key/IV pair per traffic direction.
/// Both endpoints derive bit-identical SessionKeys; each sends on its own direction.
class SessionKeys {
public:
    SessionKeys(DirectionalKeys host_to_enclave, DirectionalKeys enclave_to_host);
    SessionKeys(SessionKeys&&) noexcept = default;
    SessionKeys& operator=(SessionKeys&&) noexcept = default;
    SessionKeys(const SessionKeys&) = delete;
    SessionKeys& operator=(const SessionKeys&) = delete;
    ~SessionKeys();

    [[nodiscard]] const DirectionalKeys& HostToEnclave() const noexcept { return host_to_enclave_; }
    [[nodiscard]] const DirectionalKeys& EnclaveToHost() const noexcept { return enclave_to_host_; }

    [[nodiscard]] const DirectionalKeys& SendingKeys(enums::EndpointRole role) const noexcept;
    [[nodiscard]] const DirectionalKeys& ReceivingKeys(enums::EndpointRole role) const noexcept;

    [[nodiscard]] std::chrono::steady_clock::time_point DerivedAt() const noexcept { return derived_at_; }
    [[nodiscard]] std::chrono::steady_clock::duration HeldFor() const noexcept;

    [[nodiscard]] bool IsWiped() const noexcept;
    void Wipe() noexcept;

private:
    DirectionalKeys host_to_enclave_;
    DirectionalKeys enclave_to_host_;
    std::chrono::steady_clock::time_point derived_at_;
};
}

#include "softenclave/models/session_keys.hpp"
#include "softenclave/crypto/sodium_interop.hpp"
namespace softenclave::channel::models {
using crypto::SodiumInterop;
namespace {
    void WipeDirection(DirectionalKeys& keys) noexcept {
        keys.aead_key.Reset();
        SodiumInterop::SecureWipe(std::span<uint8_t>(keys.base_iv));
    }
}
SessionKeys::SessionKeys(DirectionalKeys host_to_enclave, DirectionalKeys enclave_to_host)
    : host_to_enclave_(std::move(host_to_enclave))
    , enclave_to_host_(std::move(enclave_to_host))
    , derived_at_(std::chrono::steady_clock::now()) {
}
SessionKeys::~SessionKeys() {
    Wipe();
}
const DirectionalKeys& SessionKeys::SendingKeys(const enums::EndpointRole role) const noexcept {
    return role == enums::EndpointRole::Host ? host_to_enclave_ : enclave_to_host_;
}
const DirectionalKeys& SessionKeys::ReceivingKeys(const enums::EndpointRole role) const noexcept {
    return SendingKeys(enums::PeerOf(role));
}
std::chrono::steady_clock::duration SessionKeys::HeldFor() const noexcept {
    return std::chrono::steady_clock::now() - derived_at_;
}
bool SessionKeys::IsWiped() const noexcept {
    return host_to_enclave_.aead_key.IsInvalid() && enclave_to_host_.aead_key.IsInvalid();
}
void SessionKeys::Wipe() noexcept {
    WipeDirection(host_to_enclave_);
    WipeDirection(enclave_to_host_);
}
}

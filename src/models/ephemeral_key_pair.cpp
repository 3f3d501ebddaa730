#include "softenclave/models/ephemeral_key_pair.hpp"
#include "softenclave/crypto/sodium_interop.hpp"
#include "softenclave/protocol/constants.hpp"
namespace softenclave::channel::models {
using crypto::SodiumInterop;
EphemeralKeyPair::EphemeralKeyPair(
    crypto::SecureMemoryHandle private_key_handle,
    std::vector<uint8_t> public_key)
    : private_key_handle_(std::move(private_key_handle))
    , public_key_(std::move(public_key)) {
}
Result<EphemeralKeyPair, ChannelFailure> EphemeralKeyPair::Generate() {
    auto generated = SodiumInterop::GenerateX25519KeyPair(kPurposeHandshakeX25519);
    if (generated.IsErr()) {
        return Result<EphemeralKeyPair, ChannelFailure>::Err(std::move(generated).UnwrapErr());
    }
    auto [private_key, public_key] = std::move(generated).Unwrap();
    return Result<EphemeralKeyPair, ChannelFailure>::Ok(
        EphemeralKeyPair(std::move(private_key), std::move(public_key)));
}
void EphemeralKeyPair::Wipe() noexcept {
    private_key_handle_.Reset();
}
}

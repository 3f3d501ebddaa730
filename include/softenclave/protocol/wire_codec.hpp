#pragma once
#include "softenclave/core/failures.hpp"
#include "softenclave/core/result.hpp"
#include "softenclave/protocol/constants.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace softenclave::channel {

/// Sealed message as carried by the transport.
/// nonce is kept as raw bytes so a malformed peer value survives decoding and
/// is rejected by Channel::Open rather than by the codec.
struct WireEnvelope {
    uint32_t version = kProtocolVersion;
    std::vector<uint8_t> nonce;
    std::vector<uint8_t> ciphertext;
};

/// Decrypted contents of WireEnvelope::ciphertext.
struct SealedPayload {
    uint64_t sequence = 0;
    std::vector<uint8_t> body;
};

struct HandshakeHello {
    uint32_t version = kProtocolVersion;
    uint32_t role = 0;
    std::vector<uint8_t> public_key;
    std::string endpoint_id;
    std::string code_identity;
};

struct ChannelMessage {
    uint32_t operation = 0;
    WireEnvelope envelope;
};

using TransportFrame = std::variant<HandshakeHello, ChannelMessage>;

/**
 * @brief Protobuf encoding for everything that crosses the transport
 *
 * Encoding is deterministic, so identical values always produce identical bytes.
 * Decoding never trusts field contents; semantic checks belong to the caller.
 */
class WireCodec {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, ChannelFailure> EncodeEnvelope(
        const WireEnvelope& envelope);
    [[nodiscard]] static Result<WireEnvelope, ChannelFailure> DecodeEnvelope(
        std::span<const uint8_t> bytes);

    [[nodiscard]] static Result<std::vector<uint8_t>, ChannelFailure> EncodePayload(
        uint64_t sequence,
        std::span<const uint8_t> body);
    [[nodiscard]] static Result<SealedPayload, ChannelFailure> DecodePayload(
        std::span<const uint8_t> bytes);

    [[nodiscard]] static Result<std::vector<uint8_t>, ChannelFailure> EncodeHello(
        const HandshakeHello& hello);
    [[nodiscard]] static Result<HandshakeHello, ChannelFailure> DecodeHello(
        std::span<const uint8_t> bytes);

    [[nodiscard]] static Result<std::vector<uint8_t>, ChannelFailure> EncodeFrame(
        const TransportFrame& frame);
    [[nodiscard]] static Result<TransportFrame, ChannelFailure> DecodeFrame(
        std::span<const uint8_t> bytes);

private:
    WireCodec() = delete;
};

}  // namespace softenclave::channel

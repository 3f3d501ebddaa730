#pragma once

#include <catch2/catch_test_macros.hpp>
#include "softenclave/crypto/sodium_interop.hpp"
#include "softenclave/models/ephemeral_key_pair.hpp"
#include "softenclave/models/session_context.hpp"
#include "softenclave/protocol/channel.hpp"
#include "softenclave/protocol/session_deriver.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace softenclave::channel::test_helpers {

using configuration::ChannelConfig;
using models::EphemeralKeyPair;
using models::SessionContext;
using models::SessionKeys;

struct ChannelPair {
    std::unique_ptr<Channel> host;
    std::unique_ptr<Channel> enclave;
};

inline EphemeralKeyPair GenerateKeyPair() {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto generated = EphemeralKeyPair::Generate();
    REQUIRE(generated.IsOk());
    return std::move(generated).Unwrap();
}

inline SessionContext DefaultContext() {
    return SessionContext("host-1", "enclave-1", "code-v1");
}

inline SessionKeys Derive(
    const EphemeralKeyPair& local,
    const EphemeralKeyPair& remote,
    const SessionContext& context,
    const bool transcript_bound = true) {
    std::vector<uint8_t> transcript;
    if (transcript_bound) {
        auto digest = SessionDeriver::TranscriptHash(local.GetPublicKey(), remote.GetPublicKey());
        REQUIRE(digest.IsOk());
        transcript.assign(digest.Unwrap().begin(), digest.Unwrap().end());
    }
    auto keys = SessionDeriver::DeriveSession(
        local.GetPrivateKeyHandle(), remote.GetPublicKey(), context, transcript);
    REQUIRE(keys.IsOk());
    return std::move(keys).Unwrap();
}

/// Host and enclave channels over one fresh key agreement, bypassing the handshake.
inline ChannelPair MakeChannelPair(
    const SessionContext& host_context = DefaultContext(),
    const SessionContext& enclave_context = DefaultContext(),
    const ChannelConfig host_config = ChannelConfig::Default(),
    const ChannelConfig enclave_config = ChannelConfig::Default(),
    interfaces::IChannelEventHandler* host_events = nullptr,
    interfaces::IChannelEventHandler* enclave_events = nullptr) {
    auto host_keys = GenerateKeyPair();
    auto enclave_keys = GenerateKeyPair();

    auto host = Channel::Create(
        Derive(host_keys, enclave_keys, host_context, host_config.IsTranscriptBound()),
        enums::EndpointRole::Host, host_config, host_events);
    REQUIRE(host.IsOk());
    auto enclave = Channel::Create(
        Derive(enclave_keys, host_keys, enclave_context, enclave_config.IsTranscriptBound()),
        enums::EndpointRole::Enclave, enclave_config, enclave_events);
    REQUIRE(enclave.IsOk());
    return {std::move(host).Unwrap(), std::move(enclave).Unwrap()};
}

inline std::vector<uint8_t> Bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

inline std::string Text(const std::vector<uint8_t>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

}

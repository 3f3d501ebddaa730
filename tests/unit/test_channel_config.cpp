#include <catch2/catch_test_macros.hpp>
#include "softenclave/configuration/channel_config.hpp"
#include "softenclave/configuration/handshake_config.hpp"
using namespace softenclave::channel;
using namespace softenclave::channel::configuration;

TEST_CASE("ChannelConfig - Defaults", "[config]") {
    constexpr auto config = ChannelConfig::Default();
    STATIC_REQUIRE(config.IsStrictOrdering());
    STATIC_REQUIRE(config.IsTranscriptBound());
    STATIC_REQUIRE(config.GetReplayCacheCapacity() == kDefaultReplayCacheCapacity);
    STATIC_REQUIRE(config.GetMaxPlaintextBytes() == kMaxPlaintextBytes);
    STATIC_REQUIRE(config.GetMaxCiphertextBytes() == kMaxCiphertextBytes);
    STATIC_REQUIRE(config.GetMaxOutboundSequence() == kMaxSequence);
    STATIC_REQUIRE(config.GetRenegotiationThreshold() == kDefaultRenegotiationThreshold);
    STATIC_REQUIRE(ChannelConfig::Strict() == config);
    REQUIRE(config.Validate().IsOk());
}

TEST_CASE("ChannelConfig - Builders", "[config]") {
    SECTION("Tolerant sets the window") {
        const auto config = ChannelConfig::Tolerant(32);
        REQUIRE_FALSE(config.IsStrictOrdering());
        REQUIRE(config.GetSequenceWindow() == 32);
        REQUIRE(config.Validate().IsOk());
    }
    SECTION("Lowering the ceiling clamps the renegotiation threshold") {
        const auto config = ChannelConfig::Default().WithMaxOutboundSequence(8);
        REQUIRE(config.GetMaxOutboundSequence() == 8);
        REQUIRE(config.GetRenegotiationThreshold() == 8);
        REQUIRE(config.Validate().IsOk());
    }
    SECTION("Context-bound tier") {
        const auto config = ChannelConfig::Default().WithSecurityTier(SecurityTier::ContextBound);
        REQUIRE_FALSE(config.IsTranscriptBound());
    }
    SECTION("Builders leave the original untouched") {
        const auto base = ChannelConfig::Default();
        const auto changed = base.WithReplayCacheCapacity(16);
        REQUIRE(base.GetReplayCacheCapacity() == kDefaultReplayCacheCapacity);
        REQUIRE(changed.GetReplayCacheCapacity() == 16);
        REQUIRE_FALSE(base == changed);
    }
}

TEST_CASE("ChannelConfig - Validation", "[config]") {
    auto expect_invalid = [](const ChannelConfig& config) {
        auto result = config.Validate();
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ChannelFailureType::InvalidInput);
    };
    SECTION("Zero replay cache") {
        expect_invalid(ChannelConfig::Default().WithReplayCacheCapacity(0));
    }
    SECTION("Zero message limits") {
        expect_invalid(ChannelConfig::Default().WithMessageLimits(0, 1024));
        expect_invalid(ChannelConfig::Default().WithMessageLimits(1024, 0));
    }
    SECTION("Ceiling beyond 32 bits") {
        expect_invalid(ChannelConfig::Default().WithMaxOutboundSequence(kMaxSequence + 1));
    }
    SECTION("Zero ceiling") {
        expect_invalid(ChannelConfig::Default().WithMaxOutboundSequence(0));
    }
    SECTION("Threshold above ceiling") {
        expect_invalid(ChannelConfig::Default().WithMaxOutboundSequence(8).WithRenegotiationThreshold(9));
    }
}

TEST_CASE("HandshakeConfig - Role presets", "[config][handshake]") {
    const auto host = HandshakeConfig::ForHost("host-1");
    REQUIRE(host.role == enums::EndpointRole::Host);
    REQUIRE_FALSE(host.code_identity.has_value());

    const auto pinned = HandshakeConfig::ForHost("host-1", "code-v1");
    REQUIRE(pinned.code_identity == "code-v1");

    const auto enclave = HandshakeConfig::ForEnclave("enclave-1", "code-v1");
    REQUIRE(enclave.role == enums::EndpointRole::Enclave);
    REQUIRE(enclave.endpoint_id == "enclave-1");
    REQUIRE(enclave.code_identity == "code-v1");
    REQUIRE(enclave.channel == ChannelConfig::Default());
}

#include <catch2/catch_test_macros.hpp>
#include "helpers/channel_pair.hpp"
#include "helpers/fake_request_handler.hpp"
#include "helpers/loopback_transport.hpp"
#include "helpers/recording_event_handler.hpp"
#include "softenclave/protocol/request_dispatcher.hpp"
using namespace softenclave::channel;
using namespace softenclave::channel::test_helpers;
using enums::OperationKind;
using enums::SecurityEvent;

namespace {
void RequireRejected(Channel& receiver, const WireEnvelope& envelope, const ChannelFailureType expected) {
    auto opened = receiver.Open(envelope, OperationKind::Execute);
    REQUIRE(opened.IsErr());
    REQUIRE(opened.UnwrapErr().type == expected);
}

std::vector<uint8_t> MessageFrame(const uint32_t operation, WireEnvelope envelope) {
    return WireCodec::EncodeFrame(TransportFrame{ChannelMessage{
        .operation = operation,
        .envelope = std::move(envelope)
    }}).Unwrap();
}
}

TEST_CASE("Envelope Attacks - Ciphertext tampering", "[attacks][envelope][critical]") {
    RecordingEventHandler enclave_events;
    auto pair = MakeChannelPair(DefaultContext(), DefaultContext(),
        ChannelConfig::Default(), ChannelConfig::Default(), nullptr, &enclave_events);
    const auto genuine = pair.host->Seal(Bytes("transfer 100 to alice"), OperationKind::Execute).Unwrap();

    SECTION("Every single-bit flip is rejected") {
        for (size_t i = 0; i < genuine.ciphertext.size(); ++i) {
            for (int bit = 0; bit < 8; bit += 3) {
                auto forged = genuine;
                forged.ciphertext[i] ^= static_cast<uint8_t>(1u << bit);
                RequireRejected(*pair.enclave, forged, ChannelFailureType::Authentication);
            }
        }
        REQUIRE(pair.enclave->Metrics().authentication_failures == genuine.ciphertext.size() * 3);
        REQUIRE(pair.enclave->Open(genuine, OperationKind::Execute).IsOk());
    }
    SECTION("Truncation is rejected") {
        for (const size_t length : {size_t{0}, kAesGcmTagBytes - 1, kAesGcmTagBytes, genuine.ciphertext.size() - 1}) {
            auto forged = genuine;
            forged.ciphertext.resize(length);
            RequireRejected(*pair.enclave, forged, ChannelFailureType::Authentication);
        }
    }
    SECTION("Appended bytes are rejected") {
        auto forged = genuine;
        forged.ciphertext.push_back(0x00);
        RequireRejected(*pair.enclave, forged, ChannelFailureType::Authentication);
    }
    SECTION("Rejections are reported as authentication failures") {
        auto forged = genuine;
        forged.ciphertext.back() ^= 0x01;
        RequireRejected(*pair.enclave, forged, ChannelFailureType::Authentication);
        REQUIRE(enclave_events.CountOf(SecurityEvent::AuthenticationFailure) == 1);
    }
}

TEST_CASE("Envelope Attacks - Header tampering", "[attacks][envelope]") {
    auto pair = MakeChannelPair();
    const auto genuine = pair.host->Seal(Bytes("payload"), OperationKind::Execute).Unwrap();

    SECTION("Nonce bit flips break authentication") {
        for (size_t i = 0; i < genuine.nonce.size(); ++i) {
            auto forged = genuine;
            forged.nonce[i] ^= 0x80;
            RequireRejected(*pair.enclave, forged, ChannelFailureType::Authentication);
        }
    }
    SECTION("Nonce of a later message on an earlier ciphertext") {
        auto later = pair.host->Seal(Bytes("payload"), OperationKind::Execute).Unwrap();
        auto forged = genuine;
        forged.nonce = later.nonce;
        RequireRejected(*pair.enclave, forged, ChannelFailureType::Authentication);
    }
    SECTION("Nonce of the wrong length") {
        auto forged = genuine;
        forged.nonce.push_back(0);
        RequireRejected(*pair.enclave, forged, ChannelFailureType::Decode);
        forged.nonce.clear();
        RequireRejected(*pair.enclave, forged, ChannelFailureType::Decode);
    }
    SECTION("Version downgrade and upgrade") {
        for (const uint32_t version : {0u, kProtocolVersion + 1}) {
            auto forged = genuine;
            forged.version = version;
            RequireRejected(*pair.enclave, forged, ChannelFailureType::Decode);
        }
    }
    SECTION("None of the rejections consumed the genuine message") {
        auto forged = genuine;
        forged.nonce[0] ^= 0x01;
        RequireRejected(*pair.enclave, forged, ChannelFailureType::Authentication);
        REQUIRE(pair.enclave->Open(genuine, OperationKind::Execute).IsOk());
    }
}

TEST_CASE("Envelope Attacks - Operation substitution", "[attacks][envelope]") {
    auto pair = MakeChannelPair();

    SECTION("Envelope opened under another operation") {
        const auto envelope = pair.host->Seal(Bytes("tx"), OperationKind::SignTransactionData).Unwrap();
        for (const auto kind : {OperationKind::Execute, OperationKind::SignTransactionKey, OperationKind::Ping}) {
            auto opened = pair.enclave->Open(envelope, kind);
            REQUIRE(opened.IsErr());
            REQUIRE(opened.UnwrapErr().type == ChannelFailureType::Authentication);
        }
        REQUIRE(pair.enclave->Open(envelope, OperationKind::SignTransactionData).IsOk());
    }
    SECTION("Request reflected as its own response") {
        const auto envelope = pair.host->Seal(Bytes("x"), OperationKind::Execute).Unwrap();
        auto opened = pair.host->Open(envelope, OperationKind::ExecuteResult);
        REQUIRE(opened.IsErr());
        REQUIRE(opened.UnwrapErr().type == ChannelFailureType::Authentication);
    }
}

TEST_CASE("Envelope Attacks - Oversized ciphertext", "[attacks][envelope]") {
    RecordingEventHandler enclave_events;
    auto pair = MakeChannelPair(DefaultContext(), DefaultContext(),
        ChannelConfig::Default(), ChannelConfig::Default().WithMessageLimits(64, 128), nullptr, &enclave_events);
    auto envelope = pair.host->Seal(Bytes("ok"), OperationKind::Execute).Unwrap();
    envelope.ciphertext.resize(129, 0xAA);

    RequireRejected(*pair.enclave, envelope, ChannelFailureType::MessageTooLarge);
    REQUIRE(enclave_events.CountOf(SecurityEvent::OversizedMessage) == 1);
    REQUIRE(pair.enclave->Metrics().oversized_messages == 1);
}

TEST_CASE("Envelope Attacks - Frame operation field", "[attacks][envelope][dispatcher]") {
    auto pair = MakeChannelPair();
    LoopbackTransportPair link;
    FakeRequestHandler handler;
    RequestDispatcher dispatcher(*pair.enclave, handler, link.enclave);

    auto ping_body = OperationCodec::EncodeRequest(PingRequest{7}).Unwrap();
    auto envelope = pair.host->Seal(ping_body.front().body, OperationKind::Ping).Unwrap();

    SECTION("Relabelled operation fails authentication and gets no reply") {
        auto handled = dispatcher.HandleFrame(
            MessageFrame(static_cast<uint32_t>(OperationKind::Execute), envelope));
        REQUIRE(handled.IsErr());
        REQUIRE(handled.UnwrapErr().type == ChannelFailureType::Authentication);
        REQUIRE(handler.ExecuteCalls() == 0);
        REQUIRE(dispatcher.HandledRequests() == 0);

        REQUIRE(link.enclave.SentFrames().empty());
        REQUIRE(pair.enclave->OutboundSequence() == 0);

        REQUIRE(dispatcher.HandleFrame(
            MessageFrame(static_cast<uint32_t>(OperationKind::Ping), envelope)).IsOk());
        REQUIRE(dispatcher.HandledRequests() == 1);
    }
    SECTION("Unknown operation numbers are rejected before opening") {
        for (const uint32_t operation : {0u, 11u, 0xFFFFFFFFu}) {
            auto handled = dispatcher.HandleFrame(MessageFrame(operation, envelope));
            REQUIRE(handled.IsErr());
            REQUIRE(handled.UnwrapErr().type == ChannelFailureType::Decode);
        }
        REQUIRE(pair.enclave->Metrics().authentication_failures == 0);
    }
    SECTION("Response kinds are not accepted by the enclave") {
        auto handled = dispatcher.HandleFrame(
            MessageFrame(static_cast<uint32_t>(OperationKind::Pong), envelope));
        REQUIRE(handled.IsErr());
        REQUIRE(handled.UnwrapErr().type == ChannelFailureType::InvalidInput);
        REQUIRE(link.enclave.SentFrames().empty());
    }
    SECTION("Garbage frames are rejected by the codec") {
        const std::vector<uint8_t> garbage = {0xff, 0xff, 0xff, 0xff};
        auto handled = dispatcher.HandleFrame(garbage);
        REQUIRE(handled.IsErr());
        REQUIRE(handled.UnwrapErr().type == ChannelFailureType::Decode);
        REQUIRE(link.enclave.SentFrames().empty());
    }
}

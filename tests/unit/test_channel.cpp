#include <catch2/catch_test_macros.hpp>
#include "helpers/channel_pair.hpp"
#include "helpers/recording_event_handler.hpp"
using namespace softenclave::channel;
using namespace softenclave::channel::test_helpers;
using enums::OperationKind;
using enums::SecurityEvent;

TEST_CASE("Channel - Seal and open", "[channel]") {
    auto pair = MakeChannelPair();

    SECTION("Host to enclave") {
        auto envelope = pair.host->Seal(Bytes("PING"), OperationKind::Ping);
        REQUIRE(envelope.IsOk());
        REQUIRE(envelope.Unwrap().nonce.size() == kAesGcmNonceBytes);
        auto opened = pair.enclave->Open(envelope.Unwrap(), OperationKind::Ping);
        REQUIRE(opened.IsOk());
        REQUIRE(Text(opened.Unwrap()) == "PING");
    }
    SECTION("Enclave to host") {
        auto envelope = pair.enclave->Seal(Bytes("PONG"), OperationKind::Pong).Unwrap();
        REQUIRE(Text(pair.host->Open(envelope, OperationKind::Pong).Unwrap()) == "PONG");
    }
    SECTION("Empty body") {
        auto envelope = pair.host->Seal({}, OperationKind::GetMetrics).Unwrap();
        REQUIRE(pair.enclave->Open(envelope, OperationKind::GetMetrics).Unwrap().empty());
    }
    SECTION("Sequences advance per direction") {
        for (int i = 0; i < 3; ++i) {
            auto envelope = pair.host->Seal(Bytes("x"), OperationKind::Ping).Unwrap();
            REQUIRE(pair.enclave->Open(envelope, OperationKind::Ping).IsOk());
        }
        REQUIRE(pair.host->OutboundSequence() == 3);
        REQUIRE(pair.enclave->LastAcceptedInbound() == 3);
        REQUIRE(pair.enclave->OutboundSequence() == 0);
        REQUIRE(pair.host->LastAcceptedInbound() == 0);
    }
    SECTION("Identical plaintexts produce distinct ciphertexts") {
        auto first = pair.host->Seal(Bytes("same"), OperationKind::Ping).Unwrap();
        auto second = pair.host->Seal(Bytes("same"), OperationKind::Ping).Unwrap();
        REQUIRE(first.nonce != second.nonce);
        REQUIRE(first.ciphertext != second.ciphertext);
    }
    SECTION("Arbitrary associated-data tags") {
        auto envelope = pair.host->Seal(Bytes("custom"), "app/custom/v1").Unwrap();
        REQUIRE(Text(pair.enclave->Open(envelope, "app/custom/v1").Unwrap()) == "custom");
    }
}

TEST_CASE("Channel - Associated data binds the operation", "[channel][security]") {
    RecordingEventHandler enclave_events;
    auto pair = MakeChannelPair(DefaultContext(), DefaultContext(),
        ChannelConfig::Default(), ChannelConfig::Default(), nullptr, &enclave_events);

    auto envelope = pair.host->Seal(Bytes("{}"), OperationKind::Execute).Unwrap();
    auto opened = pair.enclave->Open(envelope, OperationKind::SignTransactionData);
    REQUIRE(opened.IsErr());
    REQUIRE(opened.UnwrapErr().type == ChannelFailureType::Authentication);
    REQUIRE(enclave_events.CountOf(SecurityEvent::AuthenticationFailure) == 1);
    REQUIRE(pair.enclave->Metrics().authentication_failures == 1);

    SECTION("A failed open leaves the session usable") {
        REQUIRE(pair.enclave->LastAcceptedInbound() == 0);
        REQUIRE(Text(pair.enclave->Open(envelope, OperationKind::Execute).Unwrap()) == "{}");
    }
}

TEST_CASE("Channel - Replay and ordering", "[channel][security]") {
    RecordingEventHandler enclave_events;
    auto pair = MakeChannelPair(DefaultContext(), DefaultContext(),
        ChannelConfig::Default(), ChannelConfig::Default(), nullptr, &enclave_events);

    auto first = pair.host->Seal(Bytes("1"), OperationKind::Ping).Unwrap();
    auto second = pair.host->Seal(Bytes("2"), OperationKind::Ping).Unwrap();
    auto third = pair.host->Seal(Bytes("3"), OperationKind::Ping).Unwrap();

    SECTION("Replay of an accepted envelope") {
        REQUIRE(pair.enclave->Open(first, OperationKind::Ping).IsOk());
        auto replayed = pair.enclave->Open(first, OperationKind::Ping);
        REQUIRE(replayed.IsErr());
        REQUIRE(replayed.UnwrapErr().type == ChannelFailureType::ReplayDetected);
        REQUIRE(enclave_events.CountOf(SecurityEvent::ReplayDetected) == 1);
        REQUIRE(pair.enclave->Metrics().replay_rejections == 1);
    }
    SECTION("Gap under strict ordering") {
        REQUIRE(pair.enclave->Open(first, OperationKind::Ping).IsOk());
        auto skipped = pair.enclave->Open(third, OperationKind::Ping);
        REQUIRE(skipped.IsErr());
        REQUIRE(skipped.UnwrapErr().type == ChannelFailureType::SequenceViolation);
        REQUIRE(enclave_events.CountOf(SecurityEvent::SequenceViolation) == 1);
        REQUIRE(pair.enclave->Open(second, OperationKind::Ping).IsOk());
    }
    SECTION("Out-of-order delivery") {
        REQUIRE(pair.enclave->Open(second, OperationKind::Ping).IsErr());
        REQUIRE(pair.enclave->Open(first, OperationKind::Ping).IsOk());
    }
    SECTION("Consecutive failures reset on success") {
        REQUIRE(pair.enclave->Open(third, OperationKind::Ping).IsErr());
        REQUIRE(pair.enclave->Open(second, OperationKind::Ping).IsErr());
        REQUIRE(pair.enclave->ConsecutiveFailures() == 2);
        REQUIRE(pair.enclave->Open(first, OperationKind::Ping).IsOk());
        REQUIRE(pair.enclave->ConsecutiveFailures() == 0);
    }
}

TEST_CASE("Channel - Windowed ordering", "[channel]") {
    auto pair = MakeChannelPair(DefaultContext(), DefaultContext(),
        ChannelConfig::Tolerant(4), ChannelConfig::Tolerant(4));

    std::vector<WireEnvelope> sealed;
    for (int i = 0; i < 8; ++i) {
        sealed.push_back(pair.host->Seal(Bytes("m"), OperationKind::Ping).Unwrap());
    }
    REQUIRE(pair.enclave->Open(sealed[0], OperationKind::Ping).IsOk());
    REQUIRE(pair.enclave->Open(sealed[3], OperationKind::Ping).IsOk());
    REQUIRE(pair.enclave->LastAcceptedInbound() == 4);
    REQUIRE(pair.enclave->Open(sealed[1], OperationKind::Ping).UnwrapErr().type ==
            ChannelFailureType::SequenceViolation);
    REQUIRE(pair.enclave->Open(sealed[7], OperationKind::Ping).IsOk());
}

TEST_CASE("Channel - Sequence exhaustion and renegotiation", "[channel]") {
    RecordingEventHandler host_events;
    const auto config = ChannelConfig::Default().WithMaxOutboundSequence(5).WithRenegotiationThreshold(3);
    auto pair = MakeChannelPair(DefaultContext(), DefaultContext(),
        config, ChannelConfig::Default(), &host_events, nullptr);

    for (uint64_t i = 1; i <= 5; ++i) {
        auto envelope = pair.host->Seal(Bytes("m"), OperationKind::Ping);
        REQUIRE(envelope.IsOk());
        REQUIRE(pair.enclave->Open(envelope.Unwrap(), OperationKind::Ping).IsOk());
    }
    REQUIRE(host_events.Renegotiations() == std::vector<uint64_t>{3});

    auto exhausted = pair.host->Seal(Bytes("m"), OperationKind::Ping);
    REQUIRE(exhausted.IsErr());
    REQUIRE(exhausted.UnwrapErr().type == ChannelFailureType::SequenceExhaustion);
    REQUIRE(pair.host->OutboundSequence() == 5);
    REQUIRE(pair.host->Metrics().sealed == 5);
}

TEST_CASE("Channel - Message size limits", "[channel][security]") {
    RecordingEventHandler enclave_events;
    const auto small = ChannelConfig::Default().WithMessageLimits(64, 128);
    auto pair = MakeChannelPair(DefaultContext(), DefaultContext(),
        small, small, nullptr, &enclave_events);

    SECTION("Oversized plaintext is refused before sealing") {
        auto sealed = pair.host->Seal(std::vector<uint8_t>(65, 0x01), OperationKind::Execute);
        REQUIRE(sealed.IsErr());
        REQUIRE(sealed.UnwrapErr().type == ChannelFailureType::MessageTooLarge);
        REQUIRE(pair.host->OutboundSequence() == 0);
        REQUIRE(pair.host->Metrics().oversized_messages == 1);
    }
    SECTION("Oversized ciphertext is refused before decrypting") {
        auto envelope = pair.host->Seal(Bytes("ok"), OperationKind::Execute).Unwrap();
        envelope.ciphertext.resize(129, 0x00);
        auto opened = pair.enclave->Open(envelope, OperationKind::Execute);
        REQUIRE(opened.IsErr());
        REQUIRE(opened.UnwrapErr().type == ChannelFailureType::MessageTooLarge);
        REQUIRE(enclave_events.CountOf(SecurityEvent::OversizedMessage) == 1);
    }
}

TEST_CASE("Channel - Sealing a multi-envelope request", "[channel]") {
    const auto key = Bytes("key");
    const auto data = Bytes("transaction");
    const OutboundMessage request[] = {
        {.body = key, .operation = OperationKind::SignTransactionKey},
        {.body = data, .operation = OperationKind::SignTransactionData},
    };

    SECTION("Parts get consecutive sequences and open in order") {
        auto pair = MakeChannelPair();
        auto sealed = pair.host->SealAll(request);
        REQUIRE(sealed.IsOk());
        REQUIRE(sealed.Unwrap().size() == 2);
        REQUIRE(pair.host->OutboundSequence() == 2);
        REQUIRE(Text(pair.enclave->Open(sealed.Unwrap()[0], OperationKind::SignTransactionKey).Unwrap()) == "key");
        REQUIRE(Text(pair.enclave->Open(sealed.Unwrap()[1], OperationKind::SignTransactionData).Unwrap()) == "transaction");
    }
    SECTION("An oversized later part refuses the whole request") {
        auto pair = MakeChannelPair(DefaultContext(), DefaultContext(),
            ChannelConfig::Default().WithMessageLimits(8, 1024));
        auto sealed = pair.host->SealAll(request);
        REQUIRE(sealed.IsErr());
        REQUIRE(sealed.UnwrapErr().type == ChannelFailureType::MessageTooLarge);
        REQUIRE(pair.host->OutboundSequence() == 0);
        REQUIRE(pair.host->Metrics().sealed == 0);
    }
    SECTION("Too little sequence headroom refuses the whole request") {
        auto pair = MakeChannelPair(DefaultContext(), DefaultContext(),
            ChannelConfig::Default().WithMaxOutboundSequence(1));
        auto sealed = pair.host->SealAll(request);
        REQUIRE(sealed.IsErr());
        REQUIRE(sealed.UnwrapErr().type == ChannelFailureType::SequenceExhaustion);
        REQUIRE(pair.host->OutboundSequence() == 0);
    }
    SECTION("Closed channel") {
        auto pair = MakeChannelPair();
        pair.host->Close();
        REQUIRE(pair.host->SealAll(request).UnwrapErr().type == ChannelFailureType::ObjectDisposed);
    }
}

TEST_CASE("Channel - Malformed envelopes", "[channel]") {
    auto pair = MakeChannelPair();
    auto envelope = pair.host->Seal(Bytes("x"), OperationKind::Ping).Unwrap();

    SECTION("Unknown version") {
        envelope.version = kProtocolVersion + 1;
        REQUIRE(pair.enclave->Open(envelope, OperationKind::Ping).UnwrapErr().type == ChannelFailureType::Decode);
    }
    SECTION("Short nonce") {
        envelope.nonce.pop_back();
        REQUIRE(pair.enclave->Open(envelope, OperationKind::Ping).UnwrapErr().type == ChannelFailureType::Decode);
    }
}

TEST_CASE("Channel - Lifecycle", "[channel]") {
    SECTION("Close wipes keys and disables the channel") {
        auto pair = MakeChannelPair();
        auto envelope = pair.host->Seal(Bytes("x"), OperationKind::Ping).Unwrap();
        pair.enclave->Close();
        REQUIRE(pair.enclave->IsClosed());
        auto opened = pair.enclave->Open(envelope, OperationKind::Ping);
        REQUIRE(opened.UnwrapErr().type == ChannelFailureType::ObjectDisposed);
        REQUIRE(pair.enclave->ConsecutiveFailures() == 0);
        REQUIRE(pair.enclave->Seal(Bytes("y"), OperationKind::Pong).UnwrapErr().type ==
                ChannelFailureType::ObjectDisposed);
        pair.enclave->Close();
    }
    SECTION("Create rejects an invalid config") {
        auto host = GenerateKeyPair();
        auto enclave = GenerateKeyPair();
        auto created = Channel::Create(Derive(host, enclave, DefaultContext()), enums::EndpointRole::Host,
            ChannelConfig::Default().WithReplayCacheCapacity(0));
        REQUIRE(created.IsErr());
        REQUIRE(created.UnwrapErr().type == ChannelFailureType::InvalidInput);
    }
    SECTION("Create rejects wiped keys") {
        auto host = GenerateKeyPair();
        auto enclave = GenerateKeyPair();
        auto keys = Derive(host, enclave, DefaultContext());
        keys.Wipe();
        REQUIRE(Channel::Create(std::move(keys), enums::EndpointRole::Host).IsErr());
    }
    SECTION("Role and config are exposed") {
        auto pair = MakeChannelPair();
        REQUIRE(pair.host->Role() == enums::EndpointRole::Host);
        REQUIRE(pair.enclave->Role() == enums::EndpointRole::Enclave);
        REQUIRE(pair.host->Config() == ChannelConfig::Default());
    }
}

TEST_CASE("Channel - Metrics", "[channel][metrics]") {
    auto pair = MakeChannelPair();
    for (int i = 0; i < 2; ++i) {
        auto envelope = pair.host->Seal(Bytes("x"), OperationKind::Ping).Unwrap();
        REQUIRE(pair.enclave->Open(envelope, OperationKind::Ping).IsOk());
    }
    pair.enclave->RecordOperation(std::chrono::microseconds(40));
    pair.enclave->RecordOperation(std::chrono::microseconds(2));

    const auto host_metrics = pair.host->Metrics();
    const auto enclave_metrics = pair.enclave->Metrics();
    REQUIRE(host_metrics.sealed == 2);
    REQUIRE(enclave_metrics.opened == 2);
    REQUIRE(enclave_metrics.operations == 2);
    REQUIRE(enclave_metrics.total_key_exposure == std::chrono::microseconds(42));
    REQUIRE(enclave_metrics.key_material_held >= std::chrono::microseconds(0));

    pair.enclave->Close();
    const auto frozen = pair.enclave->Metrics().key_material_held;
    REQUIRE(pair.enclave->Metrics().key_material_held == frozen);
}

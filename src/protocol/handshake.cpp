#include "softenclave/protocol/handshake.hpp"
#include "softenclave/crypto/sodium_interop.hpp"
#include "softenclave/debug/channel_logger.hpp"
#include "softenclave/protocol/session_deriver.hpp"
#include "softenclave/security/validation/dh_validator.hpp"
#include <fmt/format.h>
#include <variant>

namespace softenclave::channel {
    using crypto::SodiumInterop;
    using enums::EndpointRole;
    using enums::HandshakeFailureReason;
    using enums::HandshakeState;
    using models::EphemeralKeyPair;
    using models::SessionContext;
    using security::DhValidator;

    HandshakeOrchestrator::HandshakeOrchestrator(
        configuration::HandshakeConfig config,
        interfaces::ITransport& transport,
        interfaces::IChannelEventHandler* event_handler)
        : config_(std::move(config))
        , transport_(transport)
        , event_handler_(event_handler) {
        subscription_ = transport_.Subscribe([this](std::span<const uint8_t> frame) {
            OnFrame(frame);
        });
    }

    HandshakeOrchestrator::~HandshakeOrchestrator() {
        subscription_.reset();
    }

    void HandshakeOrchestrator::OnFrame(std::span<const uint8_t> frame) {
        auto decoded = WireCodec::DecodeFrame(frame);
        std::lock_guard<std::mutex> lock(mutex_);
        if (peer_hello_.has_value() ||
            state_ == HandshakeState::Ready || state_ == HandshakeState::Failed) {
            return;
        }
        if (decoded.IsErr()) {
            peer_hello_ = Result<HandshakeHello, ChannelFailure>::Err(std::move(decoded).UnwrapErr());
        } else if (auto* hello = std::get_if<HandshakeHello>(&decoded.Unwrap())) {
            peer_hello_ = Result<HandshakeHello, ChannelFailure>::Ok(std::move(*hello));
        } else {
            return;
        }
        hello_arrived_.notify_all();
    }

    Result<Unit, ChannelFailure> HandshakeOrchestrator::Start() {
        std::vector<uint8_t> hello_frame;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != HandshakeState::Idle) {
                return Result<Unit, ChannelFailure>::Err(ChannelFailure::InvalidState(
                    fmt::format("Handshake cannot start from state {}", enums::ToString(state_))));
            }
            if (config_.endpoint_id.empty()) {
                return Result<Unit, ChannelFailure>::Err(Fail(
                    HandshakeFailureReason::InvalidState,
                    ChannelFailure::InvalidInput("Local endpoint id must not be empty")));
            }
            if (auto valid = config_.channel.Validate(); valid.IsErr()) {
                return Result<Unit, ChannelFailure>::Err(
                    Fail(HandshakeFailureReason::InvalidState, valid.UnwrapErr()));
            }

            auto generated = EphemeralKeyPair::Generate();
            if (generated.IsErr()) {
                return Result<Unit, ChannelFailure>::Err(Fail(
                    HandshakeFailureReason::KeyGeneration,
                    ChannelFailure::KeyGeneration(generated.UnwrapErr().message)));
            }
            key_pair_.emplace(std::move(generated).Unwrap());
            local_public_key_ = key_pair_->GetPublicKey();
            TransitionTo(HandshakeState::KeysGenerated);

            auto encoded = WireCodec::EncodeFrame(HandshakeHello{
                .version = kProtocolVersion,
                .role = static_cast<uint32_t>(config_.role),
                .public_key = local_public_key_,
                .endpoint_id = config_.endpoint_id,
                .code_identity = config_.role == EndpointRole::Enclave
                    ? config_.code_identity.value_or("")
                    : std::string()
            });
            if (encoded.IsErr()) {
                return Result<Unit, ChannelFailure>::Err(
                    Fail(HandshakeFailureReason::Transport, std::move(encoded).UnwrapErr()));
            }
            hello_frame = std::move(encoded).Unwrap();
        }

        auto sent = transport_.Send(hello_frame);

        std::lock_guard<std::mutex> lock(mutex_);
        if (sent.IsErr()) {
            return Result<Unit, ChannelFailure>::Err(Fail(
                HandshakeFailureReason::Transport,
                ChannelFailure::Transport(fmt::format("Failed to announce hello: {}", sent.UnwrapErr().message))));
        }
        TransitionTo(HandshakeState::LocalAnnounced);
        return Result<Unit, ChannelFailure>::Ok(unit);
    }

    Result<std::unique_ptr<Channel>, ChannelFailure> HandshakeOrchestrator::Complete(
        const std::chrono::milliseconds timeout) {
        using ChannelResult = Result<std::unique_ptr<Channel>, ChannelFailure>;

        std::unique_lock<std::mutex> lock(mutex_);
        if (state_ != HandshakeState::LocalAnnounced) {
            auto failure = ChannelFailure::InvalidState(
                fmt::format("Handshake cannot complete from state {}", enums::ToString(state_)));
            if (state_ == HandshakeState::Idle) {
                return ChannelResult::Err(Fail(HandshakeFailureReason::InvalidState, std::move(failure)));
            }
            return ChannelResult::Err(std::move(failure));
        }

        if (!hello_arrived_.wait_for(lock, timeout, [this] { return peer_hello_.has_value(); })) {
            return ChannelResult::Err(Fail(
                HandshakeFailureReason::Timeout,
                ChannelFailure::HandshakeTimeout(
                    fmt::format("No peer hello within {} ms", timeout.count()))));
        }

        auto validated = ValidatePeerHello(std::move(*peer_hello_));
        if (validated.IsErr()) {
            return ChannelResult::Err(std::move(validated).UnwrapErr());
        }
        const HandshakeHello peer = std::move(validated).Unwrap();
        TransitionTo(HandshakeState::PeerKeyReceived);

        std::string code_identity;
        if (config_.code_identity.has_value()) {
            code_identity = *config_.code_identity;
        } else if (config_.role == EndpointRole::Host) {
            code_identity = peer.code_identity;
        }
        const auto context = SessionContext::Canonical(
            config_.role, config_.endpoint_id, peer.endpoint_id, code_identity);

        std::optional<TranscriptDigest> transcript;
        if (config_.channel.IsTranscriptBound()) {
            auto transcript_result = SessionDeriver::TranscriptHash(local_public_key_, peer.public_key);
            if (transcript_result.IsErr()) {
                return ChannelResult::Err(
                    Fail(HandshakeFailureReason::KeyAgreement, std::move(transcript_result).UnwrapErr()));
            }
            transcript = transcript_result.Unwrap();
        }

        auto keys = SessionDeriver::DeriveSession(
            key_pair_->GetPrivateKeyHandle(),
            peer.public_key,
            context,
            transcript.has_value() ? std::span<const uint8_t>(*transcript) : std::span<const uint8_t>());
        if (keys.IsErr()) {
            auto failure = std::move(keys).UnwrapErr();
            if (failure.type != ChannelFailureType::KeyAgreement) {
                failure = ChannelFailure::KeyAgreement(failure.message);
            }
            return ChannelResult::Err(Fail(HandshakeFailureReason::KeyAgreement, std::move(failure)));
        }
        debug::LogSessionDerived(config_.role, local_public_key_, peer.public_key, context.SaltInput());
        TransitionTo(HandshakeState::SessionDerived);

        auto channel = Channel::Create(std::move(keys).Unwrap(), config_.role, config_.channel, event_handler_);
        if (channel.IsErr()) {
            return ChannelResult::Err(Fail(HandshakeFailureReason::InvalidState, std::move(channel).UnwrapErr()));
        }
        key_pair_->Wipe();
        key_pair_.reset();
        TransitionTo(HandshakeState::Ready);
        return channel;
    }

    Result<std::unique_ptr<Channel>, ChannelFailure> HandshakeOrchestrator::Run(
        const std::chrono::milliseconds timeout) {
        if (auto started = Start(); started.IsErr()) {
            return Result<std::unique_ptr<Channel>, ChannelFailure>::Err(std::move(started).UnwrapErr());
        }
        return Complete(timeout);
    }

    Result<HandshakeHello, ChannelFailure> HandshakeOrchestrator::ValidatePeerHello(
        Result<HandshakeHello, ChannelFailure> received) {
        using HelloResult = Result<HandshakeHello, ChannelFailure>;
        const auto malformed = [this](std::string detail) {
            return HelloResult::Err(Fail(
                HandshakeFailureReason::MalformedPeerHello,
                ChannelFailure::InvalidInput(std::move(detail))));
        };

        if (received.IsErr()) {
            return malformed(fmt::format("Undecodable peer hello: {}", received.UnwrapErr().message));
        }
        auto hello = std::move(received).Unwrap();
        if (hello.version != kProtocolVersion) {
            return malformed(fmt::format("Unsupported protocol version {}", hello.version));
        }
        const auto expected_role = static_cast<uint32_t>(enums::PeerOf(config_.role));
        if (hello.role != expected_role) {
            return malformed(fmt::format("Peer announced role {}, expected {}",
                hello.role, enums::ToString(enums::PeerOf(config_.role))));
        }
        if (hello.endpoint_id.empty()) {
            return malformed("Peer endpoint id is empty");
        }
        if (auto valid = DhValidator::ValidateX25519PublicKey(hello.public_key); valid.IsErr()) {
            return malformed(fmt::format("Peer public key rejected: {}", valid.UnwrapErr().message));
        }
        if (config_.expected_peer_endpoint_id.has_value() &&
            hello.endpoint_id != *config_.expected_peer_endpoint_id) {
            return HelloResult::Err(Fail(
                HandshakeFailureReason::EndpointMismatch,
                ChannelFailure::InvalidInput(fmt::format(
                    "Peer endpoint '{}' does not match expected '{}'",
                    hello.endpoint_id, *config_.expected_peer_endpoint_id))));
        }
        return HelloResult::Ok(std::move(hello));
    }

    void HandshakeOrchestrator::TransitionTo(const HandshakeState next) {
        debug::LogHandshakeTransition(config_.role, state_, next);
        state_ = next;
    }

    ChannelFailure HandshakeOrchestrator::Fail(const HandshakeFailureReason reason, ChannelFailure failure) {
        debug::LogHandshakeFailure(config_.role, reason, failure.message);
        if (key_pair_.has_value()) {
            key_pair_->Wipe();
            key_pair_.reset();
        }
        failure_reason_ = reason;
        TransitionTo(HandshakeState::Failed);
        return failure;
    }

    enums::HandshakeState HandshakeOrchestrator::State() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    enums::HandshakeFailureReason HandshakeOrchestrator::FailureReason() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return failure_reason_;
    }

    std::vector<uint8_t> HandshakeOrchestrator::LocalPublicKey() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return local_public_key_;
    }

}

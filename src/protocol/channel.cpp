#include "softenclave/protocol/channel.hpp"
#include "softenclave/core/constants.hpp"
#include "softenclave/crypto/aes_gcm.hpp"
#include "softenclave/crypto/sodium_interop.hpp"
#include "softenclave/debug/channel_logger.hpp"
#include "softenclave/protocol/nonce.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace softenclave::channel {
    using crypto::AesGcm;
    using crypto::SodiumInterop;
    using enums::SecurityEvent;

    namespace {
        std::span<const uint8_t> TagBytes(std::string_view tag) {
            return {reinterpret_cast<const uint8_t*>(tag.data()), tag.size()};
        }
    }

    Result<std::unique_ptr<Channel>, ChannelFailure> Channel::Create(
        models::SessionKeys keys,
        const enums::EndpointRole role,
        const configuration::ChannelConfig config,
        interfaces::IChannelEventHandler* event_handler) {
        if (auto valid = config.Validate(); valid.IsErr()) {
            return Result<std::unique_ptr<Channel>, ChannelFailure>::Err(valid.UnwrapErr());
        }
        if (keys.IsWiped()) {
            return Result<std::unique_ptr<Channel>, ChannelFailure>::Err(
                ChannelFailure::InvalidInput("Session keys have already been wiped"));
        }
        return Result<std::unique_ptr<Channel>, ChannelFailure>::Ok(
            std::unique_ptr<Channel>(new Channel(std::move(keys), role, config, event_handler)));
    }

    Channel::Channel(
        models::SessionKeys keys,
        const enums::EndpointRole role,
        const configuration::ChannelConfig config,
        interfaces::IChannelEventHandler* event_handler)
        : keys_(std::move(keys))
        , role_(role)
        , config_(config)
        , event_handler_(event_handler)
        , inbound_sequence_(config.GetSequenceWindow())
        , replay_cache_(config.GetReplayCacheCapacity()) {
    }

    Channel::~Channel() {
        Close();
    }

    Result<WireEnvelope, ChannelFailure> Channel::Seal(
        std::span<const uint8_t> body,
        const enums::OperationKind operation) {
        return Seal(body, enums::OperationTag(operation));
    }

    Result<WireEnvelope, ChannelFailure> Channel::Seal(
        std::span<const uint8_t> body,
        std::string_view operation_tag) {
        std::optional<uint64_t> renegotiation_at;
        auto result = [&] {
            std::lock_guard<std::mutex> lock(mutex_);
            return SealLocked(body, operation_tag, renegotiation_at);
        }();
        Notify(std::nullopt, renegotiation_at);
        return result;
    }

    Result<std::vector<WireEnvelope>, ChannelFailure> Channel::SealAll(
        std::span<const OutboundMessage> messages) {
        using BatchResult = Result<std::vector<WireEnvelope>, ChannelFailure>;
        std::optional<uint64_t> renegotiation_at;
        auto result = [&]() -> BatchResult {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return BatchResult::Err(
                    ChannelFailure::ObjectDisposed(std::string(ErrorMessages::CHANNEL_CLOSED)));
            }
            for (const auto& message : messages) {
                if (message.body.size() > config_.GetMaxPlaintextBytes()) {
                    metrics_.RecordOversizedMessage();
                    return BatchResult::Err(ChannelFailure::MessageTooLarge(fmt::format(
                        "Plaintext of {} bytes exceeds the {} byte limit",
                        message.body.size(), config_.GetMaxPlaintextBytes())));
                }
            }
            if (config_.GetMaxOutboundSequence() - outbound_sequence_ < messages.size()) {
                return BatchResult::Err(ChannelFailure::SequenceExhaustion(fmt::format(
                    "{} envelopes do not fit after outbound sequence {}; the session must be renegotiated",
                    messages.size(), outbound_sequence_)));
            }

            std::vector<WireEnvelope> envelopes;
            envelopes.reserve(messages.size());
            for (const auto& message : messages) {
                auto sealed = SealLocked(message.body, enums::OperationTag(message.operation), renegotiation_at);
                if (sealed.IsErr()) {
                    return BatchResult::Err(std::move(sealed).UnwrapErr());
                }
                envelopes.push_back(std::move(sealed).Unwrap());
            }
            return BatchResult::Ok(std::move(envelopes));
        }();
        Notify(std::nullopt, renegotiation_at);
        return result;
    }

    Result<WireEnvelope, ChannelFailure> Channel::SealLocked(
        std::span<const uint8_t> body,
        std::string_view operation_tag,
        std::optional<uint64_t>& renegotiation_at) {
        if (closed_) {
            return Result<WireEnvelope, ChannelFailure>::Err(
                ChannelFailure::ObjectDisposed(std::string(ErrorMessages::CHANNEL_CLOSED)));
        }
        if (body.size() > config_.GetMaxPlaintextBytes()) {
            metrics_.RecordOversizedMessage();
            return Result<WireEnvelope, ChannelFailure>::Err(
                ChannelFailure::MessageTooLarge(fmt::format(
                    "Plaintext of {} bytes exceeds the {} byte limit",
                    body.size(), config_.GetMaxPlaintextBytes())));
        }

        const uint64_t next = outbound_sequence_ + 1;
        if (next > config_.GetMaxOutboundSequence()) {
            return Result<WireEnvelope, ChannelFailure>::Err(
                ChannelFailure::SequenceExhaustion(fmt::format(
                    "Outbound sequence {} is exhausted; the session must be renegotiated",
                    outbound_sequence_)));
        }

        const auto& sending = keys_.SendingKeys(role_);
        auto nonce_result = NonceFromSequence(sending.base_iv, next);
        if (nonce_result.IsErr()) {
            return Result<WireEnvelope, ChannelFailure>::Err(std::move(nonce_result).UnwrapErr());
        }
        const Nonce nonce = nonce_result.Unwrap();

        auto payload_result = WireCodec::EncodePayload(next, body);
        if (payload_result.IsErr()) {
            return Result<WireEnvelope, ChannelFailure>::Err(std::move(payload_result).UnwrapErr());
        }
        auto payload = std::move(payload_result).Unwrap();

        auto encrypt_result = sending.aead_key.WithReadAccess([&](std::span<const uint8_t> key) {
            return AesGcm::Encrypt(key, nonce, payload, TagBytes(operation_tag));
        });
        SodiumInterop::SecureWipe(std::span<uint8_t>(payload));
        if (encrypt_result.IsErr()) {
            return Result<WireEnvelope, ChannelFailure>::Err(
                ChannelFailure::FromSodiumFailure(encrypt_result.UnwrapErr()));
        }
        auto ciphertext_result = std::move(encrypt_result).Unwrap();
        if (ciphertext_result.IsErr()) {
            return Result<WireEnvelope, ChannelFailure>::Err(std::move(ciphertext_result).UnwrapErr());
        }

        outbound_sequence_ = next;
        metrics_.RecordSealed();
        if (!renegotiation_signalled_ && next >= config_.GetRenegotiationThreshold()) {
            renegotiation_signalled_ = true;
            renegotiation_at = next;
        }
        debug::LogSeal(role_, next, nonce);

        return Result<WireEnvelope, ChannelFailure>::Ok(WireEnvelope{
            .version = kProtocolVersion,
            .nonce = std::vector<uint8_t>(nonce.begin(), nonce.end()),
            .ciphertext = std::move(ciphertext_result).Unwrap()
        });
    }

    Result<std::vector<uint8_t>, ChannelFailure> Channel::Open(
        const WireEnvelope& envelope,
        const enums::OperationKind operation) {
        return Open(envelope, enums::OperationTag(operation));
    }

    Result<std::vector<uint8_t>, ChannelFailure> Channel::Open(
        const WireEnvelope& envelope,
        std::string_view operation_tag) {
        std::optional<PendingEvent> event;
        auto result = [&] {
            std::lock_guard<std::mutex> lock(mutex_);
            auto opened = OpenLocked(envelope, operation_tag, event);
            if (opened.IsOk()) {
                consecutive_failures_ = 0;
            } else if (opened.UnwrapErr().type != ChannelFailureType::ObjectDisposed) {
                ++consecutive_failures_;
            }
            return opened;
        }();
        Notify(event, std::nullopt);
        return result;
    }

    Result<std::vector<uint8_t>, ChannelFailure> Channel::OpenLocked(
        const WireEnvelope& envelope,
        std::string_view operation_tag,
        std::optional<PendingEvent>& event) {
        using OpenResult = Result<std::vector<uint8_t>, ChannelFailure>;

        if (closed_) {
            return OpenResult::Err(ChannelFailure::ObjectDisposed(std::string(ErrorMessages::CHANNEL_CLOSED)));
        }
        if (envelope.version != kProtocolVersion) {
            return OpenResult::Err(ChannelFailure::Decode(
                fmt::format("Unsupported envelope version {}", envelope.version)));
        }
        if (envelope.nonce.size() != kAesGcmNonceBytes) {
            return OpenResult::Err(ChannelFailure::Decode(
                fmt::format("Envelope nonce must be {} bytes, got {}", kAesGcmNonceBytes, envelope.nonce.size())));
        }
        if (envelope.ciphertext.size() > config_.GetMaxCiphertextBytes()) {
            metrics_.RecordOversizedMessage();
            return OpenResult::Err(Reject(
                SecurityEvent::OversizedMessage,
                ChannelFailure::MessageTooLarge(fmt::format(
                    "Ciphertext of {} bytes exceeds the {} byte limit",
                    envelope.ciphertext.size(), config_.GetMaxCiphertextBytes())),
                event));
        }

        Nonce nonce{};
        std::copy(envelope.nonce.begin(), envelope.nonce.end(), nonce.begin());

        if (replay_cache_.Contains(nonce)) {
            metrics_.RecordReplayRejected();
            return OpenResult::Err(Reject(
                SecurityEvent::ReplayDetected,
                ChannelFailure::ReplayDetected(std::string(ErrorMessages::REPLAY_DETECTED)),
                event));
        }

        const auto& receiving = keys_.ReceivingKeys(role_);
        auto decrypt_result = receiving.aead_key.WithReadAccess([&](std::span<const uint8_t> key) {
            return AesGcm::Decrypt(key, nonce, envelope.ciphertext, TagBytes(operation_tag));
        });
        if (decrypt_result.IsErr()) {
            return OpenResult::Err(ChannelFailure::FromSodiumFailure(decrypt_result.UnwrapErr()));
        }
        auto plaintext_result = std::move(decrypt_result).Unwrap();
        if (plaintext_result.IsErr()) {
            auto failure = std::move(plaintext_result).UnwrapErr();
            if (failure.type == ChannelFailureType::Authentication) {
                metrics_.RecordAuthenticationFailure();
                return OpenResult::Err(Reject(SecurityEvent::AuthenticationFailure, std::move(failure), event));
            }
            return OpenResult::Err(std::move(failure));
        }
        auto plaintext = std::move(plaintext_result).Unwrap();

        replay_cache_.Record(nonce);

        auto payload_result = WireCodec::DecodePayload(plaintext);
        SodiumInterop::SecureWipe(std::span<uint8_t>(plaintext));
        if (payload_result.IsErr()) {
            return OpenResult::Err(std::move(payload_result).UnwrapErr());
        }
        auto payload = std::move(payload_result).Unwrap();

        auto expected_nonce = NonceFromSequence(receiving.base_iv, payload.sequence);
        if (expected_nonce.IsErr() || expected_nonce.Unwrap() != nonce) {
            SodiumInterop::SecureWipe(std::span<uint8_t>(payload.body));
            metrics_.RecordSequenceViolation();
            return OpenResult::Err(Reject(
                SecurityEvent::SequenceViolation,
                ChannelFailure::SequenceViolation(fmt::format(
                    "Nonce does not correspond to sealed sequence {}", payload.sequence)),
                event));
        }

        if (auto ordered = inbound_sequence_.Check(payload.sequence); ordered.IsErr()) {
            SodiumInterop::SecureWipe(std::span<uint8_t>(payload.body));
            metrics_.RecordSequenceViolation();
            return OpenResult::Err(Reject(SecurityEvent::SequenceViolation, ordered.UnwrapErr(), event));
        }

        inbound_sequence_.Accept(payload.sequence);
        metrics_.RecordOpened();
        debug::LogOpen(role_, payload.sequence, nonce);
        return OpenResult::Ok(std::move(payload.body));
    }

    ChannelFailure Channel::Reject(
        const SecurityEvent event,
        ChannelFailure failure,
        std::optional<PendingEvent>& pending) {
        debug::LogRejected(role_, event, failure.message);
        pending = PendingEvent{event, failure.message};
        return failure;
    }

    void Channel::Notify(const std::optional<PendingEvent>& event, const std::optional<uint64_t> renegotiation_at) {
        if (event_handler_ == nullptr) {
            return;
        }
        if (event.has_value()) {
            event_handler_->OnSecurityViolation(event->event, event->detail);
        }
        if (renegotiation_at.has_value()) {
            event_handler_->OnRenegotiationRequired(*renegotiation_at);
        }
    }

    void Channel::Close() noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        held_at_close_ = keys_.HeldFor();
        keys_.Wipe();
        replay_cache_.Clear();
        closed_ = true;
    }

    bool Channel::IsClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    void Channel::RecordOperation(const std::chrono::microseconds key_exposure) noexcept {
        metrics_.RecordOperation(key_exposure);
    }

    metrics::MetricsSnapshot Channel::Metrics() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return metrics_.Snapshot(closed_ ? held_at_close_ : keys_.HeldFor());
    }

    uint32_t Channel::ConsecutiveFailures() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return consecutive_failures_;
    }

    uint64_t Channel::OutboundSequence() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return outbound_sequence_;
    }

    uint64_t Channel::LastAcceptedInbound() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return inbound_sequence_.LastAccepted();
    }

}

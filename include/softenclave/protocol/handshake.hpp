#pragma once
#include "softenclave/configuration/handshake_config.hpp"
#include "softenclave/core/failures.hpp"
#include "softenclave/core/result.hpp"
#include "softenclave/enums/handshake_state.hpp"
#include "softenclave/interfaces/i_channel_event_handler.hpp"
#include "softenclave/interfaces/i_transport.hpp"
#include "softenclave/models/ephemeral_key_pair.hpp"
#include "softenclave/protocol/channel.hpp"
#include "softenclave/protocol/constants.hpp"
#include "softenclave/protocol/wire_codec.hpp"
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <span>

namespace softenclave::channel {

/**
 * @brief Drives one side of the ephemeral X25519 exchange to an established Channel
 *
 * The transport subscription is taken at construction, so a peer hello that
 * arrives before Complete() is queued rather than lost. Failed is terminal:
 * retrying means building a new orchestrator, which generates fresh keys.
 * The ephemeral private key is wiped on Ready and on Failed.
 *
 * @example
 * ```cpp
 * HandshakeOrchestrator host(HandshakeConfig::ForHost("host-1"), transport);
 * auto channel = host.Run(std::chrono::seconds(5));
 * ```
 */
class HandshakeOrchestrator {
public:
    HandshakeOrchestrator(
        configuration::HandshakeConfig config,
        interfaces::ITransport& transport,
        interfaces::IChannelEventHandler* event_handler = nullptr);

    ~HandshakeOrchestrator();

    HandshakeOrchestrator(const HandshakeOrchestrator&) = delete;
    HandshakeOrchestrator& operator=(const HandshakeOrchestrator&) = delete;
    HandshakeOrchestrator(HandshakeOrchestrator&&) = delete;
    HandshakeOrchestrator& operator=(HandshakeOrchestrator&&) = delete;

    /// Idle -> KeysGenerated -> LocalAnnounced.
    [[nodiscard]] Result<Unit, ChannelFailure> Start();

    /// Waits for the peer hello, then LocalAnnounced -> ... -> Ready.
    [[nodiscard]] Result<std::unique_ptr<Channel>, ChannelFailure> Complete(
        std::chrono::milliseconds timeout = kDefaultHandshakeTimeout);

    [[nodiscard]] Result<std::unique_ptr<Channel>, ChannelFailure> Run(
        std::chrono::milliseconds timeout = kDefaultHandshakeTimeout);

    [[nodiscard]] enums::HandshakeState State() const;
    [[nodiscard]] enums::HandshakeFailureReason FailureReason() const;

    /// Empty until Start() has generated the key pair.
    [[nodiscard]] std::vector<uint8_t> LocalPublicKey() const;

private:
    void OnFrame(std::span<const uint8_t> frame);

    Result<HandshakeHello, ChannelFailure> ValidatePeerHello(
        Result<HandshakeHello, ChannelFailure> received);

    void TransitionTo(enums::HandshakeState next);
    ChannelFailure Fail(enums::HandshakeFailureReason reason, ChannelFailure failure);

    const configuration::HandshakeConfig config_;
    interfaces::ITransport& transport_;
    interfaces::IChannelEventHandler* event_handler_;

    mutable std::mutex mutex_;
    std::condition_variable hello_arrived_;
    enums::HandshakeState state_ = enums::HandshakeState::Idle;
    enums::HandshakeFailureReason failure_reason_ = enums::HandshakeFailureReason::None;
    std::optional<models::EphemeralKeyPair> key_pair_;
    std::vector<uint8_t> local_public_key_;
    std::optional<Result<HandshakeHello, ChannelFailure>> peer_hello_;

    std::unique_ptr<interfaces::ITransportSubscription> subscription_;
};

}  // namespace softenclave::channel

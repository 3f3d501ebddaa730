#pragma once
#include "softenclave/configuration/channel_config.hpp"
#include "softenclave/core/failures.hpp"
#include "softenclave/core/result.hpp"
#include "softenclave/enums/endpoint_role.hpp"
#include "softenclave/enums/operation_kind.hpp"
#include "softenclave/enums/security_event.hpp"
#include "softenclave/interfaces/i_channel_event_handler.hpp"
#include "softenclave/metrics/channel_metrics.hpp"
#include "softenclave/models/session_keys.hpp"
#include "softenclave/protocol/wire_codec.hpp"
#include "softenclave/security/replay/replay_cache.hpp"
#include "softenclave/security/sequence_validator.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace softenclave::channel {

/**
 * @brief One established session between a host and an enclave
 *
 * Seal and Open are serialized by an internal mutex, so a Channel may be shared
 * between threads. State changes only after the deciding step of an operation
 * succeeds: a failed seal leaves the outbound counter untouched, a failed open
 * leaves the inbound sequence untouched. A rejected message is dropped and the
 * channel stays usable; teardown is the caller's decision (see ConsecutiveFailures()).
 *
 * The event handler, when given, must outlive the channel. It is invoked after
 * the internal lock is released.
 */
/// One body of a multi-envelope request, sealed under its operation's tag.
struct OutboundMessage {
    std::span<const uint8_t> body;
    enums::OperationKind operation;
};

class Channel {
public:
    [[nodiscard]] static Result<std::unique_ptr<Channel>, ChannelFailure> Create(
        models::SessionKeys keys,
        enums::EndpointRole role,
        configuration::ChannelConfig config = configuration::ChannelConfig::Default(),
        interfaces::IChannelEventHandler* event_handler = nullptr);

    ~Channel();

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;
    Channel(Channel&&) = delete;
    Channel& operator=(Channel&&) = delete;

    [[nodiscard]] Result<WireEnvelope, ChannelFailure> Seal(
        std::span<const uint8_t> body,
        enums::OperationKind operation);

    /// Seals under an arbitrary associated-data tag.
    [[nodiscard]] Result<WireEnvelope, ChannelFailure> Seal(
        std::span<const uint8_t> body,
        std::string_view operation_tag);

    /**
     * @brief Seals consecutive envelopes as one unit
     *
     * Size limits and sequence headroom are checked for every message before the
     * first is sealed, so a rejected batch consumes no sequence numbers.
     */
    [[nodiscard]] Result<std::vector<WireEnvelope>, ChannelFailure> SealAll(
        std::span<const OutboundMessage> messages);

    [[nodiscard]] Result<std::vector<uint8_t>, ChannelFailure> Open(
        const WireEnvelope& envelope,
        enums::OperationKind operation);

    [[nodiscard]] Result<std::vector<uint8_t>, ChannelFailure> Open(
        const WireEnvelope& envelope,
        std::string_view operation_tag);

    /// Wipes all key material. Every later Seal/Open fails with ObjectDisposed.
    void Close() noexcept;

    [[nodiscard]] bool IsClosed() const;

    /// Accounts one served request; key_exposure is how long its secrets were in the clear.
    void RecordOperation(std::chrono::microseconds key_exposure) noexcept;

    [[nodiscard]] metrics::MetricsSnapshot Metrics() const;

    /// Rejected opens since the last accepted one.
    [[nodiscard]] uint32_t ConsecutiveFailures() const;

    [[nodiscard]] uint64_t OutboundSequence() const;
    [[nodiscard]] uint64_t LastAcceptedInbound() const;

    [[nodiscard]] enums::EndpointRole Role() const noexcept { return role_; }
    [[nodiscard]] const configuration::ChannelConfig& Config() const noexcept { return config_; }

private:
    struct PendingEvent {
        enums::SecurityEvent event;
        std::string detail;
    };

    Channel(
        models::SessionKeys keys,
        enums::EndpointRole role,
        configuration::ChannelConfig config,
        interfaces::IChannelEventHandler* event_handler);

    Result<WireEnvelope, ChannelFailure> SealLocked(
        std::span<const uint8_t> body,
        std::string_view operation_tag,
        std::optional<uint64_t>& renegotiation_at);

    Result<std::vector<uint8_t>, ChannelFailure> OpenLocked(
        const WireEnvelope& envelope,
        std::string_view operation_tag,
        std::optional<PendingEvent>& event);

    ChannelFailure Reject(
        enums::SecurityEvent event,
        ChannelFailure failure,
        std::optional<PendingEvent>& pending);

    void Notify(const std::optional<PendingEvent>& event, std::optional<uint64_t> renegotiation_at);

    models::SessionKeys keys_;
    const enums::EndpointRole role_;
    const configuration::ChannelConfig config_;
    interfaces::IChannelEventHandler* event_handler_;

    mutable std::mutex mutex_;
    uint64_t outbound_sequence_ = 0;
    security::SequenceValidator inbound_sequence_;
    security::ReplayCache replay_cache_;
    metrics::ChannelMetrics metrics_;
    uint32_t consecutive_failures_ = 0;
    bool renegotiation_signalled_ = false;
    bool closed_ = false;
    std::chrono::steady_clock::duration held_at_close_{};
};

}  // namespace softenclave::channel

#pragma once

#include "softenclave/core/failures.hpp"
#include "softenclave/core/result.hpp"
#include "softenclave/protocol/constants.hpp"
#include <cstddef>
#include <cstdint>

namespace softenclave::channel::configuration {

/// What the session keys are bound to besides the ECDH secret.
///
/// - ContextBound: endpoint identifiers and code identity (salt) only
/// - TranscriptBound: additionally the sorted pair of ephemeral public keys (HKDF info)
enum class SecurityTier : uint8_t {
    ContextBound = 0,
    TranscriptBound = 1
};

/// Tunables for one Channel.
///
/// @example
/// ```cpp
/// auto strict = ChannelConfig::Default();
/// auto lossy = ChannelConfig::Tolerant(32);
/// auto small = ChannelConfig::Default().WithMaxOutboundSequence(8);
/// ```
class ChannelConfig {
public:
    /// Strict ordering, 4096-entry replay cache, 1 MiB ciphertext / 256 KiB plaintext caps,
    /// transcript-bound keys.
    [[nodiscard]] static constexpr ChannelConfig Default() noexcept {
        return ChannelConfig();
    }

    [[nodiscard]] static constexpr ChannelConfig Strict() noexcept {
        return Default();
    }

    /// Accepts a sequence up to `window` ahead of the last accepted one; gaps are skipped, never reopened.
    [[nodiscard]] static constexpr ChannelConfig Tolerant(const uint64_t window) noexcept {
        return Default().WithSequenceWindow(window);
    }

    [[nodiscard]] constexpr ChannelConfig WithSecurityTier(const SecurityTier tier) const noexcept {
        ChannelConfig copy = *this;
        copy.security_tier_ = tier;
        return copy;
    }

    [[nodiscard]] constexpr ChannelConfig WithSequenceWindow(const uint64_t window) const noexcept {
        ChannelConfig copy = *this;
        copy.sequence_window_ = window;
        return copy;
    }

    [[nodiscard]] constexpr ChannelConfig WithReplayCacheCapacity(const size_t capacity) const noexcept {
        ChannelConfig copy = *this;
        copy.replay_cache_capacity_ = capacity;
        return copy;
    }

    [[nodiscard]] constexpr ChannelConfig WithMessageLimits(
        const size_t max_plaintext_bytes,
        const size_t max_ciphertext_bytes) const noexcept {
        ChannelConfig copy = *this;
        copy.max_plaintext_bytes_ = max_plaintext_bytes;
        copy.max_ciphertext_bytes_ = max_ciphertext_bytes;
        return copy;
    }

    /// Lowers the sequence ceiling; the renegotiation threshold is clamped to stay below it.
    [[nodiscard]] constexpr ChannelConfig WithMaxOutboundSequence(const uint64_t max_sequence) const noexcept {
        ChannelConfig copy = *this;
        copy.max_outbound_sequence_ = max_sequence;
        if (copy.renegotiation_threshold_ > max_sequence) {
            copy.renegotiation_threshold_ = max_sequence;
        }
        return copy;
    }

    [[nodiscard]] constexpr ChannelConfig WithRenegotiationThreshold(const uint64_t threshold) const noexcept {
        ChannelConfig copy = *this;
        copy.renegotiation_threshold_ = threshold;
        return copy;
    }

    [[nodiscard]] constexpr SecurityTier GetSecurityTier() const noexcept { return security_tier_; }
    [[nodiscard]] constexpr bool IsTranscriptBound() const noexcept {
        return security_tier_ == SecurityTier::TranscriptBound;
    }
    [[nodiscard]] constexpr uint64_t GetSequenceWindow() const noexcept { return sequence_window_; }
    [[nodiscard]] constexpr bool IsStrictOrdering() const noexcept {
        return sequence_window_ == kStrictSequenceWindow;
    }
    [[nodiscard]] constexpr size_t GetReplayCacheCapacity() const noexcept { return replay_cache_capacity_; }
    [[nodiscard]] constexpr size_t GetMaxPlaintextBytes() const noexcept { return max_plaintext_bytes_; }
    [[nodiscard]] constexpr size_t GetMaxCiphertextBytes() const noexcept { return max_ciphertext_bytes_; }
    [[nodiscard]] constexpr uint64_t GetMaxOutboundSequence() const noexcept { return max_outbound_sequence_; }
    [[nodiscard]] constexpr uint64_t GetRenegotiationThreshold() const noexcept { return renegotiation_threshold_; }

    /// Rejects combinations a Channel cannot honour (zero capacities, a ceiling beyond 2^32 - 1, ...).
    [[nodiscard]] Result<Unit, ChannelFailure> Validate() const;

    [[nodiscard]] constexpr bool operator==(const ChannelConfig& other) const noexcept = default;

private:
    constexpr ChannelConfig() noexcept = default;

    SecurityTier security_tier_ = SecurityTier::TranscriptBound;
    uint64_t sequence_window_ = kStrictSequenceWindow;
    size_t replay_cache_capacity_ = kDefaultReplayCacheCapacity;
    size_t max_plaintext_bytes_ = kMaxPlaintextBytes;
    size_t max_ciphertext_bytes_ = kMaxCiphertextBytes;
    uint64_t max_outbound_sequence_ = kMaxSequence;
    uint64_t renegotiation_threshold_ = kDefaultRenegotiationThreshold;
};

} // namespace softenclave::channel::configuration

#pragma once

#include <cstdint>

namespace softenclave::channel::enums {

/**
 * @brief Handshake progress, strictly forward
 *
 * Idle -> KeysGenerated -> LocalAnnounced -> PeerKeyReceived -> SessionDerived -> Ready.
 * Any step may instead move to Failed, which is terminal.
 */
enum class HandshakeState : uint8_t {
    Idle = 0,
    KeysGenerated = 1,
    LocalAnnounced = 2,
    PeerKeyReceived = 3,
    SessionDerived = 4,
    Ready = 5,
    Failed = 6
};

enum class HandshakeFailureReason : uint8_t {
    None = 0,
    KeyGeneration,
    Transport,
    MalformedPeerHello,
    EndpointMismatch,
    KeyAgreement,
    Timeout,
    InvalidState
};

constexpr const char* ToString(HandshakeState state) noexcept {
    switch (state) {
        case HandshakeState::Idle: return "Idle";
        case HandshakeState::KeysGenerated: return "KeysGenerated";
        case HandshakeState::LocalAnnounced: return "LocalAnnounced";
        case HandshakeState::PeerKeyReceived: return "PeerKeyReceived";
        case HandshakeState::SessionDerived: return "SessionDerived";
        case HandshakeState::Ready: return "Ready";
        case HandshakeState::Failed: return "Failed";
        default: return "UNKNOWN";
    }
}

constexpr const char* ToString(HandshakeFailureReason reason) noexcept {
    switch (reason) {
        case HandshakeFailureReason::None: return "None";
        case HandshakeFailureReason::KeyGeneration: return "KeyGeneration";
        case HandshakeFailureReason::Transport: return "Transport";
        case HandshakeFailureReason::MalformedPeerHello: return "MalformedPeerHello";
        case HandshakeFailureReason::EndpointMismatch: return "EndpointMismatch";
        case HandshakeFailureReason::KeyAgreement: return "KeyAgreement";
        case HandshakeFailureReason::Timeout: return "Timeout";
        case HandshakeFailureReason::InvalidState: return "InvalidState";
        default: return "UNKNOWN";
    }
}

} // namespace softenclave::channel::enums

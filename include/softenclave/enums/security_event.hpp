#pragma once

#include <cstdint>

namespace softenclave::channel::enums {

enum class SecurityEvent : uint8_t {
    ReplayDetected = 0,
    AuthenticationFailure = 1,
    SequenceViolation = 2,
    OversizedMessage = 3
};

constexpr const char* ToString(SecurityEvent event) noexcept {
    switch (event) {
        case SecurityEvent::ReplayDetected:
            return "REPLAY_DETECTED";
        case SecurityEvent::AuthenticationFailure:
            return "AUTHENTICATION_FAILURE";
        case SecurityEvent::SequenceViolation:
            return "SEQUENCE_VIOLATION";
        case SecurityEvent::OversizedMessage:
            return "OVERSIZED_MESSAGE";
        default:
            return "UNKNOWN";
    }
}

} // namespace softenclave::channel::enums

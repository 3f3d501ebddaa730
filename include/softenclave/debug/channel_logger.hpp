#pragma once

/**
 * @file channel_logger.hpp
 * @brief Trace logging for handshake and channel events.
 *
 * Compiled in only with SOFTENCLAVE_DEBUG_LOGS (CMake: -DSOFTENCLAVE_DEBUG_LOGS=ON);
 * otherwise every macro and helper is a no-op. Only public values are traced:
 * ephemeral public keys, nonces, sequences, transcript hashes and event names.
 * Symmetric keys, shared secrets and plaintext never reach these helpers.
 */

#include "softenclave/enums/endpoint_role.hpp"
#include "softenclave/enums/handshake_state.hpp"
#include "softenclave/enums/security_event.hpp"

#include <cstdint>
#include <cstdio>
#include <span>
#include <string>
#include <string_view>

namespace softenclave::channel::debug {

#ifdef SOFTENCLAVE_DEBUG_LOGS

inline std::string ToHex(std::span<const uint8_t> data, size_t max_bytes = 32) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    const size_t shown = data.size() < max_bytes ? data.size() : max_bytes;
    std::string result;
    result.reserve(shown * 2 + 16);
    for (size_t i = 0; i < shown; ++i) {
        result.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    if (shown < data.size()) {
        result += "...(" + std::to_string(data.size()) + " bytes)";
    }
    return result;
}

#define SOFTENCLAVE_LOG_BYTES(role, operation, name, data) \
    do { \
        fprintf(stdout, "[SOFTENCLAVE] %s %s %s: %s\n", \
            ::softenclave::channel::enums::ToString(role), \
            operation, \
            name, \
            ::softenclave::channel::debug::ToHex(data).c_str()); \
        fflush(stdout); \
    } while(0)

#define SOFTENCLAVE_LOG_VALUE(role, operation, name, value) \
    do { \
        fprintf(stdout, "[SOFTENCLAVE] %s %s %s: %s\n", \
            ::softenclave::channel::enums::ToString(role), \
            operation, \
            name, \
            std::to_string(value).c_str()); \
        fflush(stdout); \
    } while(0)

#define SOFTENCLAVE_LOG_EVENT(role, operation, message) \
    do { \
        fprintf(stdout, "[SOFTENCLAVE] %s %s %s\n", \
            ::softenclave::channel::enums::ToString(role), \
            operation, \
            message); \
        fflush(stdout); \
    } while(0)

#define SOFTENCLAVE_LOG_SECTION(role, section_name) \
    do { \
        fprintf(stdout, "[SOFTENCLAVE] %s ========== %s ==========\n", \
            ::softenclave::channel::enums::ToString(role), \
            section_name); \
        fflush(stdout); \
    } while(0)

inline void LogHandshakeTransition(
    enums::EndpointRole role,
    enums::HandshakeState from,
    enums::HandshakeState to) {
    fprintf(stdout, "[SOFTENCLAVE] %s HANDSHAKE %s -> %s\n",
        enums::ToString(role), enums::ToString(from), enums::ToString(to));
    fflush(stdout);
}

inline void LogHandshakeFailure(
    enums::EndpointRole role,
    enums::HandshakeFailureReason reason,
    std::string_view detail) {
    fprintf(stdout, "[SOFTENCLAVE] %s HANDSHAKE failed (%s): %.*s\n",
        enums::ToString(role), enums::ToString(reason),
        static_cast<int>(detail.size()), detail.data());
    fflush(stdout);
}

inline void LogSessionDerived(
    enums::EndpointRole role,
    std::span<const uint8_t> local_public,
    std::span<const uint8_t> peer_public,
    std::string_view salt_input) {
    SOFTENCLAVE_LOG_SECTION(role, "SESSION DERIVED");
    SOFTENCLAVE_LOG_BYTES(role, "SESSION", "local_public", local_public);
    SOFTENCLAVE_LOG_BYTES(role, "SESSION", "peer_public", peer_public);
    fprintf(stdout, "[SOFTENCLAVE] %s SESSION context: %.*s\n",
        enums::ToString(role), static_cast<int>(salt_input.size()), salt_input.data());
    fflush(stdout);
}

inline void LogSeal(enums::EndpointRole role, uint64_t sequence, std::span<const uint8_t> nonce) {
    SOFTENCLAVE_LOG_VALUE(role, "SEAL", "sequence", sequence);
    SOFTENCLAVE_LOG_BYTES(role, "SEAL", "nonce", nonce);
}

inline void LogOpen(enums::EndpointRole role, uint64_t sequence, std::span<const uint8_t> nonce) {
    SOFTENCLAVE_LOG_VALUE(role, "OPEN", "sequence", sequence);
    SOFTENCLAVE_LOG_BYTES(role, "OPEN", "nonce", nonce);
}

inline void LogRejected(enums::EndpointRole role, enums::SecurityEvent event, std::string_view detail) {
    fprintf(stdout, "[SOFTENCLAVE] %s REJECT %s: %.*s\n",
        enums::ToString(role), enums::ToString(event),
        static_cast<int>(detail.size()), detail.data());
    fflush(stdout);
}

#else // !SOFTENCLAVE_DEBUG_LOGS

#define SOFTENCLAVE_LOG_BYTES(role, operation, name, data) ((void)0)
#define SOFTENCLAVE_LOG_VALUE(role, operation, name, value) ((void)0)
#define SOFTENCLAVE_LOG_EVENT(role, operation, message) ((void)0)
#define SOFTENCLAVE_LOG_SECTION(role, section_name) ((void)0)

inline void LogHandshakeTransition(enums::EndpointRole, enums::HandshakeState, enums::HandshakeState) {}
inline void LogHandshakeFailure(enums::EndpointRole, enums::HandshakeFailureReason, std::string_view) {}
inline void LogSessionDerived(enums::EndpointRole, std::span<const uint8_t>, std::span<const uint8_t>,
    std::string_view) {}
inline void LogSeal(enums::EndpointRole, uint64_t, std::span<const uint8_t>) {}
inline void LogOpen(enums::EndpointRole, uint64_t, std::span<const uint8_t>) {}
inline void LogRejected(enums::EndpointRole, enums::SecurityEvent, std::string_view) {}

#endif // SOFTENCLAVE_DEBUG_LOGS

} // namespace softenclave::channel::debug

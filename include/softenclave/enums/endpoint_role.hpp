#pragma once

#include <cstdint>

namespace softenclave::channel::enums {

/**
 * @brief Which end of the channel an object acts for
 *
 * The host sends on the host->enclave direction and receives on enclave->host;
 * the enclave does the opposite. Session context is always laid out host first.
 */
enum class EndpointRole : uint8_t {
    Host = 1,
    Enclave = 2
};

constexpr EndpointRole PeerOf(EndpointRole role) noexcept {
    return role == EndpointRole::Host ? EndpointRole::Enclave : EndpointRole::Host;
}

constexpr const char* ToString(EndpointRole role) noexcept {
    switch (role) {
        case EndpointRole::Host:
            return "HOST";
        case EndpointRole::Enclave:
            return "ENCLAVE";
        default:
            return "UNKNOWN";
    }
}

} // namespace softenclave::channel::enums

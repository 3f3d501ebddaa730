#pragma once

#include "softenclave/configuration/channel_config.hpp"
#include "softenclave/enums/endpoint_role.hpp"
#include <optional>
#include <string>

namespace softenclave::channel::configuration {

/// Per-endpoint handshake settings.
///
/// code_identity is what the enclave announces for the code it runs. On the host
/// it is the pinned value the enclave must run; when unset the host binds to
/// whatever the enclave announces.
struct HandshakeConfig {
    enums::EndpointRole role = enums::EndpointRole::Host;
    std::string endpoint_id;
    std::optional<std::string> expected_peer_endpoint_id;
    std::optional<std::string> code_identity;
    ChannelConfig channel = ChannelConfig::Default();

    [[nodiscard]] static HandshakeConfig ForHost(
        std::string endpoint_id,
        std::optional<std::string> expected_code_identity = std::nullopt) {
        HandshakeConfig config;
        config.role = enums::EndpointRole::Host;
        config.endpoint_id = std::move(endpoint_id);
        config.code_identity = std::move(expected_code_identity);
        return config;
    }

    [[nodiscard]] static HandshakeConfig ForEnclave(
        std::string endpoint_id,
        std::string code_identity) {
        HandshakeConfig config;
        config.role = enums::EndpointRole::Enclave;
        config.endpoint_id = std::move(endpoint_id);
        config.code_identity = std::move(code_identity);
        return config;
    }
};

} // namespace softenclave::channel::configuration

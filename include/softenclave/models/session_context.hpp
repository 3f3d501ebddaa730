#pragma once
#include "softenclave/enums/endpoint_role.hpp"
#include <string>
#include <string_view>
namespace softenclave::channel::models {
/// Identity bound into session key derivation.
///
/// Always laid out host first: local_endpoint_id is the host's identifier and
/// remote_endpoint_id the enclave's, whichever side builds it. An absent field
/// is the empty string, so the salt input is always "local|remote|code".
class SessionContext {
public:
    SessionContext(
        std::string local_endpoint_id,
        std::string remote_endpoint_id,
        std::string code_identity);

    [[nodiscard]] static SessionContext Canonical(
        enums::EndpointRole role,
        std::string_view self_endpoint_id,
        std::string_view peer_endpoint_id,
        std::string_view code_identity);

    [[nodiscard]] const std::string& LocalEndpointId() const noexcept { return local_endpoint_id_; }
    [[nodiscard]] const std::string& RemoteEndpointId() const noexcept { return remote_endpoint_id_; }
    [[nodiscard]] const std::string& CodeIdentity() const noexcept { return code_identity_; }

    [[nodiscard]] std::string SaltInput() const;

    bool operator==(const SessionContext& other) const = default;

private:
    std::string local_endpoint_id_;
    std::string remote_endpoint_id_;
    std::string code_identity_;
};
}

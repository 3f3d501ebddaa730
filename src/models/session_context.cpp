#include "softenclave/models/session_context.hpp"
#include "softenclave/protocol/constants.hpp"
#include <fmt/format.h>
namespace softenclave::channel::models {
SessionContext::SessionContext(
    std::string local_endpoint_id,
    std::string remote_endpoint_id,
    std::string code_identity)
    : local_endpoint_id_(std::move(local_endpoint_id))
    , remote_endpoint_id_(std::move(remote_endpoint_id))
    , code_identity_(std::move(code_identity)) {
}
SessionContext SessionContext::Canonical(
    const enums::EndpointRole role,
    std::string_view self_endpoint_id,
    std::string_view peer_endpoint_id,
    std::string_view code_identity) {
    if (role == enums::EndpointRole::Host) {
        return {std::string(self_endpoint_id), std::string(peer_endpoint_id), std::string(code_identity)};
    }
    return {std::string(peer_endpoint_id), std::string(self_endpoint_id), std::string(code_identity)};
}
std::string SessionContext::SaltInput() const {
    return fmt::format("{}{}{}{}{}",
        local_endpoint_id_, kContextSeparator,
        remote_endpoint_id_, kContextSeparator,
        code_identity_);
}
}

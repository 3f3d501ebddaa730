#pragma once
#include "softenclave/core/failures.hpp"
#include "softenclave/core/result.hpp"
#include "softenclave/protocol/operations.hpp"
#include <cstdint>
#include <span>
namespace softenclave::channel::interfaces {
/// Execution engine behind the enclave end of the channel.
/// Only fully authenticated, decoded requests reach it.
class IRequestHandler {
public:
    virtual ~IRequestHandler() = default;
    virtual Result<ExecuteResult, ChannelFailure> Execute(const ExecuteRequest& request) = 0;
    /// key_material is only valid for the duration of the call.
    virtual Result<SignResult, ChannelFailure> SignTransaction(
        std::span<const uint8_t> key_material,
        std::span<const uint8_t> transaction) = 0;
};
}

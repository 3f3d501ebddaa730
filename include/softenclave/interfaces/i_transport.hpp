#pragma once
#include "softenclave/core/failures.hpp"
#include "softenclave/core/result.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <span>
namespace softenclave::channel::interfaces {
/// Live registration on a transport; destroying it unsubscribes.
class ITransportSubscription {
public:
    virtual ~ITransportSubscription() = default;
};
/// Untrusted opaque-bytes link between host and enclave.
/// It may drop, duplicate, reorder or replay frames; every subscriber sees every inbound frame.
class ITransport {
public:
    using FrameHandler = std::function<void(std::span<const uint8_t>)>;
    virtual ~ITransport() = default;
    virtual Result<Unit, ChannelFailure> Send(std::span<const uint8_t> frame) = 0;
    [[nodiscard]] virtual std::unique_ptr<ITransportSubscription> Subscribe(FrameHandler handler) = 0;
};
}

#pragma once
#include "softenclave/enums/security_event.hpp"
#include <cstdint>
#include <string>
namespace softenclave::channel::interfaces {
class IChannelEventHandler {
public:
    virtual ~IChannelEventHandler() = default;
    virtual void OnSecurityViolation(enums::SecurityEvent event, const std::string& detail) = 0;
    virtual void OnRenegotiationRequired(uint64_t outbound_sequence) = 0;
};
}

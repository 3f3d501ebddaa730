#pragma once
#include "softenclave/core/failures.hpp"
#include "softenclave/core/result.hpp"
#include "softenclave/interfaces/i_transport.hpp"
#include "softenclave/protocol/channel.hpp"
#include "softenclave/protocol/constants.hpp"
#include "softenclave/protocol/operations.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>

namespace softenclave::channel {

/**
 * @brief Host end of the request/response exchange
 *
 * Every inbound channel frame is opened as it arrives, so the inbound sequence
 * stays in step with the enclave even for responses nobody is waiting for.
 * Responses that do not answer the call in flight are dropped after opening.
 * An ErrorResponse answers a call only when it names one of the sequence
 * numbers that call's envelopes were sealed under. One Call is in flight at a time.
 */
class RequestClient {
public:
    RequestClient(Channel& channel, interfaces::ITransport& transport);
    ~RequestClient();

    RequestClient(const RequestClient&) = delete;
    RequestClient& operator=(const RequestClient&) = delete;

    /// An ErrorResponse from the enclave is returned as a Response, not as a failure.
    [[nodiscard]] Result<Response, ChannelFailure> Call(
        const Request& request,
        std::chrono::milliseconds timeout = kDefaultRequestTimeout);

    [[nodiscard]] uint64_t DroppedResponses() const;

private:
    void OnFrame(std::span<const uint8_t> frame);
    bool AnswersCall(enums::OperationKind kind, const Result<Response, ChannelFailure>& decoded) const;

    Channel& channel_;
    interfaces::ITransport& transport_;

    std::mutex call_mutex_;

    mutable std::mutex state_mutex_;
    std::condition_variable response_ready_;
    std::optional<enums::OperationKind> awaiting_;
    std::optional<Result<Response, ChannelFailure>> response_;
    uint64_t first_sequence_ = 0;
    uint64_t last_sequence_ = 0;
    uint64_t dropped_responses_ = 0;

    std::unique_ptr<interfaces::ITransportSubscription> subscription_;
};

}  // namespace softenclave::channel

#pragma once
#include "softenclave/core/failures.hpp"
#include "softenclave/core/result.hpp"
#include "softenclave/crypto/sodium_secure_memory_handle.hpp"
#include "softenclave/interfaces/i_request_handler.hpp"
#include "softenclave/interfaces/i_transport.hpp"
#include "softenclave/protocol/channel.hpp"
#include "softenclave/protocol/operations.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>

namespace softenclave::channel {

/**
 * @brief Enclave end of the request/response exchange
 *
 * Every channel frame from the host is opened under the tag of the operation it
 * claims, decoded, handed to the IRequestHandler and answered with a sealed
 * response. A request that authenticated but could not be served is answered
 * with a sealed ErrorResponse. Frames the channel rejects get no reply; their
 * failure is only reported to the caller of HandleFrame.
 *
 * The signing key of a SignTransactionKey envelope is parked in guarded memory
 * until the next authenticated envelope. It is used only if that envelope is the
 * matching SignTransactionData, and wiped in every case.
 */
class RequestDispatcher {
public:
    RequestDispatcher(
        Channel& channel,
        interfaces::IRequestHandler& handler,
        interfaces::ITransport& transport);

    RequestDispatcher(const RequestDispatcher&) = delete;
    RequestDispatcher& operator=(const RequestDispatcher&) = delete;

    /// Subscribes to the transport; frames are handled until the subscription is destroyed.
    [[nodiscard]] std::unique_ptr<interfaces::ITransportSubscription> Listen();

    /// Handshake frames are ignored and return Ok.
    Result<Unit, ChannelFailure> HandleFrame(std::span<const uint8_t> frame);

    /// Failure of the most recent frame handled through Listen(), if it failed.
    [[nodiscard]] std::optional<ChannelFailure> LastFailure() const;

    [[nodiscard]] uint64_t HandledRequests() const;

private:
    Result<Unit, ChannelFailure> HandleMessage(const ChannelMessage& message);
    Result<Unit, ChannelFailure> Serve(enums::OperationKind kind, std::span<const uint8_t> body);
    Result<std::optional<Response>, ChannelFailure> Dispatch(InboundRequest request);
    Result<Response, ChannelFailure> SignWithPendingKey(const SignTransactionDataPart& data);
    Result<Unit, ChannelFailure> Respond(const Response& response);
    void ReplyWithError(const ChannelFailure& failure);

    Channel& channel_;
    interfaces::IRequestHandler& handler_;
    interfaces::ITransport& transport_;

    mutable std::mutex mutex_;
    std::optional<crypto::SecureMemoryHandle> pending_sign_key_;
    std::optional<ChannelFailure> last_failure_;
    uint64_t handled_requests_ = 0;
};

}  // namespace softenclave::channel

#include "softenclave/protocol/request_dispatcher.hpp"
#include "softenclave/crypto/sodium_interop.hpp"
#include "softenclave/debug/channel_logger.hpp"
#include "softenclave/protocol/constants.hpp"
#include "softenclave/protocol/wire_codec.hpp"
#include <chrono>
#include <fmt/format.h>
#include <type_traits>
#include <variant>

namespace softenclave::channel {
    using crypto::SecureMemoryHandle;
    using crypto::SodiumInterop;
    using enums::OperationKind;

    namespace {
        template<typename>
        inline constexpr bool kAlwaysFalse = false;

        std::chrono::microseconds ElapsedSince(const std::chrono::steady_clock::time_point start) {
            return std::chrono::duration_cast<std::chrono::microseconds>(
                std::chrono::steady_clock::now() - start);
        }
    }

    RequestDispatcher::RequestDispatcher(
        Channel& channel,
        interfaces::IRequestHandler& handler,
        interfaces::ITransport& transport)
        : channel_(channel)
        , handler_(handler)
        , transport_(transport) {
    }

    std::unique_ptr<interfaces::ITransportSubscription> RequestDispatcher::Listen() {
        return transport_.Subscribe([this](std::span<const uint8_t> frame) {
            auto handled = HandleFrame(frame);
            std::lock_guard<std::mutex> lock(mutex_);
            if (handled.IsErr()) {
                last_failure_ = std::move(handled).UnwrapErr();
            } else {
                last_failure_.reset();
            }
        });
    }

    Result<Unit, ChannelFailure> RequestDispatcher::HandleFrame(std::span<const uint8_t> frame) {
        auto decoded = WireCodec::DecodeFrame(frame);
        if (decoded.IsErr()) {
            return Result<Unit, ChannelFailure>::Err(std::move(decoded).UnwrapErr());
        }
        const auto& value = decoded.Unwrap();
        if (std::holds_alternative<HandshakeHello>(value)) {
            return Result<Unit, ChannelFailure>::Ok(unit);
        }

        std::lock_guard<std::mutex> lock(mutex_);
        return HandleMessage(std::get<ChannelMessage>(value));
    }

    Result<Unit, ChannelFailure> RequestDispatcher::HandleMessage(const ChannelMessage& message) {
        if (!enums::IsKnownOperation(message.operation)) {
            return Result<Unit, ChannelFailure>::Err(
                ChannelFailure::Decode(fmt::format("Unknown operation {}", message.operation)));
        }
        const auto kind = static_cast<OperationKind>(message.operation);
        if (!enums::ResponseKind(kind).has_value()) {
            return Result<Unit, ChannelFailure>::Err(
                ChannelFailure::InvalidInput(
                    fmt::format("{} is not accepted by the enclave", enums::ToString(kind))));
        }

        // Rejected envelopes are never answered: the host cannot tell which call
        // a reply would belong to, and forged frames must not consume our sequence.
        auto opened = channel_.Open(message.envelope, kind);
        if (opened.IsErr()) {
            return Result<Unit, ChannelFailure>::Err(std::move(opened).UnwrapErr());
        }
        if (kind != OperationKind::SignTransactionData) {
            pending_sign_key_.reset();
        }

        auto body = std::move(opened).Unwrap();
        auto served = Serve(kind, body);
        SodiumInterop::SecureWipe(std::span<uint8_t>(body));
        if (served.IsErr()) {
            ReplyWithError(served.UnwrapErr());
        }
        return served;
    }

    Result<Unit, ChannelFailure> RequestDispatcher::Serve(const OperationKind kind, std::span<const uint8_t> body) {
        auto request = OperationCodec::DecodeRequestPart(kind, body);
        if (request.IsErr()) {
            return Result<Unit, ChannelFailure>::Err(std::move(request).UnwrapErr());
        }

        auto response = Dispatch(std::move(request).Unwrap());
        if (response.IsErr()) {
            return Result<Unit, ChannelFailure>::Err(std::move(response).UnwrapErr());
        }
        ++handled_requests_;
        const auto& reply = response.Unwrap();
        if (!reply.has_value()) {
            return Result<Unit, ChannelFailure>::Ok(unit);
        }
        return Respond(*reply);
    }

    Result<std::optional<Response>, ChannelFailure> RequestDispatcher::Dispatch(InboundRequest request) {
        using DispatchResult = Result<std::optional<Response>, ChannelFailure>;
        return std::visit([this](auto& value) -> DispatchResult {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, ExecuteRequest>) {
                if (value.code.size() > kMaxCodeBytes) {
                    return DispatchResult::Err(ChannelFailure::MessageTooLarge(fmt::format(
                        "Code of {} bytes exceeds the {} byte limit", value.code.size(), kMaxCodeBytes)));
                }
                const auto started = std::chrono::steady_clock::now();
                auto executed = handler_.Execute(value);
                const auto elapsed = ElapsedSince(started);
                if (executed.IsErr()) {
                    return DispatchResult::Err(std::move(executed).UnwrapErr());
                }
                auto result = std::move(executed).Unwrap();
                if (result.metrics.total_duration.count() == 0) {
                    result.metrics.total_duration = elapsed;
                }
                channel_.RecordOperation(elapsed);
                return DispatchResult::Ok(Response{std::move(result)});
            } else if constexpr (std::is_same_v<T, SignTransactionKeyPart>) {
                if (value.key_material.empty()) {
                    return DispatchResult::Err(ChannelFailure::InvalidInput("Signing key is empty"));
                }
                auto handle_result = SecureMemoryHandle::Allocate(value.key_material.size());
                if (handle_result.IsErr()) {
                    SodiumInterop::SecureWipe(std::span<uint8_t>(value.key_material));
                    return DispatchResult::Err(ChannelFailure::FromSodiumFailure(handle_result.UnwrapErr()));
                }
                auto handle = std::move(handle_result).Unwrap();
                auto written = handle.Write(value.key_material);
                SodiumInterop::SecureWipe(std::span<uint8_t>(value.key_material));
                if (written.IsErr()) {
                    return DispatchResult::Err(ChannelFailure::FromSodiumFailure(written.UnwrapErr()));
                }
                pending_sign_key_ = std::move(handle);
                return DispatchResult::Ok(std::nullopt);
            } else if constexpr (std::is_same_v<T, SignTransactionDataPart>) {
                auto signed_result = SignWithPendingKey(value);
                if (signed_result.IsErr()) {
                    return DispatchResult::Err(std::move(signed_result).UnwrapErr());
                }
                return DispatchResult::Ok(std::move(signed_result).Unwrap());
            } else if constexpr (std::is_same_v<T, PingRequest>) {
                return DispatchResult::Ok(Response{PongResponse{value.nonce}});
            } else if constexpr (std::is_same_v<T, MetricsRequest>) {
                return DispatchResult::Ok(Response{MetricsReport{channel_.Metrics()}});
            } else {
                static_assert(kAlwaysFalse<T>, "unhandled request part");
            }
        }, request);
    }

    Result<Response, ChannelFailure> RequestDispatcher::SignWithPendingKey(const SignTransactionDataPart& data) {
        if (!pending_sign_key_.has_value()) {
            return Result<Response, ChannelFailure>::Err(
                ChannelFailure::InvalidState("Transaction data arrived without a signing key"));
        }
        SecureMemoryHandle key = std::move(*pending_sign_key_);
        pending_sign_key_.reset();

        const auto started = std::chrono::steady_clock::now();
        auto signed_result = key.WithReadAccess([&](std::span<const uint8_t> key_material) {
            return handler_.SignTransaction(key_material, data.transaction);
        });
        key.Reset();
        const auto exposure = ElapsedSince(started);

        if (signed_result.IsErr()) {
            return Result<Response, ChannelFailure>::Err(
                ChannelFailure::FromSodiumFailure(signed_result.UnwrapErr()));
        }
        auto inner = std::move(signed_result).Unwrap();
        if (inner.IsErr()) {
            return Result<Response, ChannelFailure>::Err(std::move(inner).UnwrapErr());
        }
        auto result = std::move(inner).Unwrap();
        result.metrics.key_exposure = exposure;
        if (result.metrics.total_duration.count() == 0) {
            result.metrics.total_duration = exposure;
        }
        result.metrics.memory_zeroed = key.IsInvalid();
        channel_.RecordOperation(exposure);
        return Result<Response, ChannelFailure>::Ok(Response{std::move(result)});
    }

    Result<Unit, ChannelFailure> RequestDispatcher::Respond(const Response& response) {
        const auto kind = KindOf(response);
        auto body = OperationCodec::EncodeResponse(response);
        if (body.IsErr()) {
            return Result<Unit, ChannelFailure>::Err(std::move(body).UnwrapErr());
        }
        auto sealed = channel_.Seal(body.Unwrap(), kind);
        SodiumInterop::SecureWipe(std::span<uint8_t>(body.Unwrap()));
        if (sealed.IsErr()) {
            return Result<Unit, ChannelFailure>::Err(std::move(sealed).UnwrapErr());
        }
        auto frame = WireCodec::EncodeFrame(ChannelMessage{
            .operation = static_cast<uint32_t>(kind),
            .envelope = std::move(sealed).Unwrap()
        });
        if (frame.IsErr()) {
            return Result<Unit, ChannelFailure>::Err(std::move(frame).UnwrapErr());
        }
        return transport_.Send(frame.Unwrap());
    }

    void RequestDispatcher::ReplyWithError(const ChannelFailure& failure) {
        if (channel_.IsClosed()) {
            return;
        }
        const auto answered = ErrorResponseFrom(failure, channel_.LastAcceptedInbound());
        if (auto replied = Respond(answered); replied.IsErr()) {
            SOFTENCLAVE_LOG_EVENT(channel_.Role(), "DISPATCH", replied.UnwrapErr().message.c_str());
        }
    }

    std::optional<ChannelFailure> RequestDispatcher::LastFailure() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_failure_;
    }

    uint64_t RequestDispatcher::HandledRequests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return handled_requests_;
    }

}

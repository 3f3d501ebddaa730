#include "softenclave/protocol/request_client.hpp"
#include "softenclave/crypto/sodium_interop.hpp"
#include "softenclave/protocol/wire_codec.hpp"
#include <fmt/format.h>
#include <variant>
#include <vector>

namespace softenclave::channel {
    using crypto::SodiumInterop;
    using enums::OperationKind;

    RequestClient::RequestClient(Channel& channel, interfaces::ITransport& transport)
        : channel_(channel)
        , transport_(transport) {
        subscription_ = transport_.Subscribe([this](std::span<const uint8_t> frame) {
            OnFrame(frame);
        });
    }

    RequestClient::~RequestClient() {
        subscription_.reset();
    }

    Result<Response, ChannelFailure> RequestClient::Call(
        const Request& request,
        const std::chrono::milliseconds timeout) {
        std::lock_guard<std::mutex> call_lock(call_mutex_);

        auto parts_result = OperationCodec::EncodeRequest(request);
        if (parts_result.IsErr()) {
            return Result<Response, ChannelFailure>::Err(std::move(parts_result).UnwrapErr());
        }
        auto parts = std::move(parts_result).Unwrap();
        const auto expected = enums::ResponseKind(KindOf(request));
        if (!expected.has_value()) {
            return Result<Response, ChannelFailure>::Err(
                ChannelFailure::InvalidInput("Request has no response kind"));
        }

        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            awaiting_ = *expected;
            response_.reset();
            first_sequence_ = 1;
            last_sequence_ = 0;
        }

        // Every part is sealed before any is sent: a request the channel refuses
        // never leaves a lone SignTransactionKey envelope at the enclave.
        std::vector<OutboundMessage> outbound;
        outbound.reserve(parts.size());
        for (const auto& part : parts) {
            outbound.push_back(OutboundMessage{.body = part.body, .operation = part.kind});
        }
        auto sealed = channel_.SealAll(outbound);
        for (auto& part : parts) {
            SodiumInterop::SecureWipe(std::span<uint8_t>(part.body));
        }

        auto send_parts = [&]() -> Result<Unit, ChannelFailure> {
            SOFTENCLAVE_TRY(sealed);
            auto envelopes = std::move(sealed).Unwrap();
            {
                // Only this call's own sequence range may be answered by an ErrorResponse.
                std::lock_guard<std::mutex> lock(state_mutex_);
                last_sequence_ = channel_.OutboundSequence();
                first_sequence_ = last_sequence_ - envelopes.size() + 1;
            }
            for (size_t i = 0; i < envelopes.size(); ++i) {
                auto frame = WireCodec::EncodeFrame(ChannelMessage{
                    .operation = static_cast<uint32_t>(parts[i].kind),
                    .envelope = std::move(envelopes[i])
                });
                if (frame.IsErr()) {
                    return Result<Unit, ChannelFailure>::Err(std::move(frame).UnwrapErr());
                }
                SOFTENCLAVE_TRY(transport_.Send(frame.Unwrap()));
            }
            return Result<Unit, ChannelFailure>::Ok(unit);
        };

        if (auto sent = send_parts(); sent.IsErr()) {
            std::lock_guard<std::mutex> lock(state_mutex_);
            awaiting_.reset();
            return Result<Response, ChannelFailure>::Err(std::move(sent).UnwrapErr());
        }

        std::unique_lock<std::mutex> lock(state_mutex_);
        const bool answered = response_ready_.wait_for(lock, timeout, [this] {
            return response_.has_value();
        });
        awaiting_.reset();
        if (!answered) {
            return Result<Response, ChannelFailure>::Err(ChannelFailure::Timeout(fmt::format(
                "No {} response within {} ms", enums::ToString(*expected), timeout.count())));
        }
        auto response = std::move(*response_);
        response_.reset();
        return response;
    }

    void RequestClient::OnFrame(std::span<const uint8_t> frame) {
        auto decoded = WireCodec::DecodeFrame(frame);
        if (decoded.IsErr()) {
            return;
        }
        const auto* message = std::get_if<ChannelMessage>(&decoded.Unwrap());
        if (message == nullptr || !enums::IsKnownOperation(message->operation)) {
            return;
        }
        const auto kind = static_cast<OperationKind>(message->operation);
        if (enums::ResponseKind(kind).has_value()) {
            return;
        }

        auto opened = channel_.Open(message->envelope, kind);
        if (opened.IsErr()) {
            // Forged or replayed frames never complete a call; the genuine response may still arrive.
            return;
        }
        auto body = std::move(opened).Unwrap();
        auto response = OperationCodec::DecodeResponse(kind, body);
        SodiumInterop::SecureWipe(std::span<uint8_t>(body));

        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!AnswersCall(kind, response)) {
            ++dropped_responses_;
            return;
        }
        response_ = std::move(response);
        response_ready_.notify_all();
    }

    bool RequestClient::AnswersCall(
        const OperationKind kind,
        const Result<Response, ChannelFailure>& decoded) const {
        if (!awaiting_.has_value() || response_.has_value()) {
            return false;
        }
        if (kind == *awaiting_) {
            return true;
        }
        if (kind != OperationKind::Error || decoded.IsErr()) {
            return false;
        }
        const auto* error = std::get_if<ErrorResponse>(&decoded.Unwrap());
        return error != nullptr &&
            error->request_sequence >= first_sequence_ &&
            error->request_sequence <= last_sequence_;
    }

    uint64_t RequestClient::DroppedResponses() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return dropped_responses_;
    }

}

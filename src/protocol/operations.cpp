#include "softenclave/protocol/operations.hpp"
#include "softenclave/crypto/sodium_interop.hpp"
#include "operations/operations.pb.h"
#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <google/protobuf/message_lite.h>
#include <fmt/format.h>
#include <algorithm>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>

namespace softenclave::channel {
    namespace ops = ::softenclave::proto::operations;
    using enums::OperationKind;

    namespace {
        template<typename>
        inline constexpr bool kAlwaysFalse = false;

        Result<std::vector<uint8_t>, ChannelFailure> SerializeDeterministic(
            const google::protobuf::MessageLite& message,
            std::string_view name) {
            std::string output;
            {
                google::protobuf::io::StringOutputStream stream(&output);
                google::protobuf::io::CodedOutputStream coded_out(&stream);
                coded_out.SetSerializationDeterministic(true);
                if (!message.SerializeToCodedStream(&coded_out) || coded_out.HadError()) {
                    return Result<std::vector<uint8_t>, ChannelFailure>::Err(
                        ChannelFailure::Encode(fmt::format("Failed to serialize {}", name)));
                }
            }
            std::vector<uint8_t> bytes(output.begin(), output.end());
            std::fill(output.begin(), output.end(), '\0');
            return Result<std::vector<uint8_t>, ChannelFailure>::Ok(std::move(bytes));
        }

        template<typename Message>
        Result<Message, ChannelFailure> Parse(std::span<const uint8_t> body, std::string_view name) {
            Message message;
            if (body.size() > static_cast<size_t>(std::numeric_limits<int>::max()) ||
                !message.ParseFromArray(body.data(), static_cast<int>(body.size()))) {
                return Result<Message, ChannelFailure>::Err(
                    ChannelFailure::Decode(fmt::format("Failed to parse {} body", name)));
            }
            return Result<Message, ChannelFailure>::Ok(std::move(message));
        }

        std::string AsString(std::span<const uint8_t> bytes) {
            return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
        }

        std::vector<uint8_t> AsBytes(const std::string& bytes) {
            return std::vector<uint8_t>(bytes.begin(), bytes.end());
        }

        void WipeString(std::string& value) {
            std::fill(value.begin(), value.end(), '\0');
        }

        void ToProto(const ExecutionMetrics& metrics, ops::ExecutionMetrics& out) {
            out.set_key_exposure_us(static_cast<uint64_t>(metrics.key_exposure.count()));
            out.set_total_duration_us(static_cast<uint64_t>(metrics.total_duration.count()));
            out.set_memory_zeroed(metrics.memory_zeroed);
        }

        ExecutionMetrics FromProto(const ops::ExecutionMetrics& metrics) {
            return ExecutionMetrics{
                .key_exposure = std::chrono::microseconds(static_cast<int64_t>(metrics.key_exposure_us())),
                .total_duration = std::chrono::microseconds(static_cast<int64_t>(metrics.total_duration_us())),
                .memory_zeroed = metrics.memory_zeroed()
            };
        }

        Result<std::vector<uint8_t>, ChannelFailure> EncodeMetricsReport(const MetricsReport& report) {
            const auto& snapshot = report.snapshot;
            ops::MetricsReport proto;
            proto.set_sealed(snapshot.sealed);
            proto.set_opened(snapshot.opened);
            proto.set_replay_rejections(snapshot.replay_rejections);
            proto.set_sequence_violations(snapshot.sequence_violations);
            proto.set_authentication_failures(snapshot.authentication_failures);
            proto.set_oversized_messages(snapshot.oversized_messages);
            proto.set_operations(snapshot.operations);
            proto.set_total_key_exposure_us(static_cast<uint64_t>(snapshot.total_key_exposure.count()));
            proto.set_key_material_held_us(static_cast<uint64_t>(snapshot.key_material_held.count()));
            return SerializeDeterministic(proto, "MetricsReport");
        }

        MetricsReport DecodeMetricsReport(const ops::MetricsReport& proto) {
            MetricsReport report;
            report.snapshot.sealed = proto.sealed();
            report.snapshot.opened = proto.opened();
            report.snapshot.replay_rejections = proto.replay_rejections();
            report.snapshot.sequence_violations = proto.sequence_violations();
            report.snapshot.authentication_failures = proto.authentication_failures();
            report.snapshot.oversized_messages = proto.oversized_messages();
            report.snapshot.operations = proto.operations();
            report.snapshot.total_key_exposure =
                std::chrono::microseconds(static_cast<int64_t>(proto.total_key_exposure_us()));
            report.snapshot.key_material_held =
                std::chrono::microseconds(static_cast<int64_t>(proto.key_material_held_us()));
            return report;
        }

        RequestPart Part(OperationKind kind, std::vector<uint8_t> body) {
            return RequestPart{kind, std::move(body)};
        }
    }

    OperationKind KindOf(const Request& request) {
        return std::visit([](const auto& value) -> OperationKind {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, ExecuteRequest>) {
                return OperationKind::Execute;
            } else if constexpr (std::is_same_v<T, SignTransactionRequest>) {
                return OperationKind::SignTransactionData;
            } else if constexpr (std::is_same_v<T, PingRequest>) {
                return OperationKind::Ping;
            } else if constexpr (std::is_same_v<T, MetricsRequest>) {
                return OperationKind::GetMetrics;
            } else {
                static_assert(kAlwaysFalse<T>, "unhandled request type");
            }
        }, request);
    }

    OperationKind KindOf(const Response& response) {
        return std::visit([](const auto& value) -> OperationKind {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, ExecuteResult>) {
                return OperationKind::ExecuteResult;
            } else if constexpr (std::is_same_v<T, SignResult>) {
                return OperationKind::SignResult;
            } else if constexpr (std::is_same_v<T, PongResponse>) {
                return OperationKind::Pong;
            } else if constexpr (std::is_same_v<T, MetricsReport>) {
                return OperationKind::MetricsReport;
            } else if constexpr (std::is_same_v<T, ErrorResponse>) {
                return OperationKind::Error;
            } else {
                static_assert(kAlwaysFalse<T>, "unhandled response type");
            }
        }, response);
    }

    ErrorResponse ErrorResponseFrom(const ChannelFailure& failure, const uint64_t request_sequence) {
        return ErrorResponse{ToString(failure.type), failure.message, request_sequence};
    }

    Result<std::vector<RequestPart>, ChannelFailure> OperationCodec::EncodeRequest(const Request& request) {
        using PartsResult = Result<std::vector<RequestPart>, ChannelFailure>;
        return std::visit([](const auto& value) -> PartsResult {
            using T = std::decay_t<decltype(value)>;
            std::vector<RequestPart> parts;
            if constexpr (std::is_same_v<T, ExecuteRequest>) {
                ops::ExecuteRequest proto;
                proto.set_code(value.code);
                proto.set_context_json(value.context_json);
                const auto timeout_ms = std::clamp<int64_t>(
                    value.timeout.count(), 0, std::numeric_limits<uint32_t>::max());
                proto.set_timeout_ms(static_cast<uint32_t>(timeout_ms));
                auto body = SerializeDeterministic(proto, "ExecuteRequest");
                WipeString(*proto.mutable_context_json());
                if (body.IsErr()) {
                    return PartsResult::Err(std::move(body).UnwrapErr());
                }
                parts.push_back(Part(OperationKind::Execute, std::move(body).Unwrap()));
            } else if constexpr (std::is_same_v<T, SignTransactionRequest>) {
                ops::SignTransactionKey key;
                key.set_key_material(AsString(value.key_material));
                auto key_body = SerializeDeterministic(key, "SignTransactionKey");
                WipeString(*key.mutable_key_material());
                if (key_body.IsErr()) {
                    return PartsResult::Err(std::move(key_body).UnwrapErr());
                }
                ops::SignTransactionData data;
                data.set_transaction(AsString(value.transaction));
                auto data_body = SerializeDeterministic(data, "SignTransactionData");
                if (data_body.IsErr()) {
                    crypto::SodiumInterop::SecureWipe(std::span<uint8_t>(key_body.Unwrap()));
                    return PartsResult::Err(std::move(data_body).UnwrapErr());
                }
                parts.push_back(Part(OperationKind::SignTransactionKey, std::move(key_body).Unwrap()));
                parts.push_back(Part(OperationKind::SignTransactionData, std::move(data_body).Unwrap()));
            } else if constexpr (std::is_same_v<T, PingRequest>) {
                ops::PingRequest proto;
                proto.set_nonce(value.nonce);
                auto body = SerializeDeterministic(proto, "PingRequest");
                if (body.IsErr()) {
                    return PartsResult::Err(std::move(body).UnwrapErr());
                }
                parts.push_back(Part(OperationKind::Ping, std::move(body).Unwrap()));
            } else if constexpr (std::is_same_v<T, MetricsRequest>) {
                ops::MetricsRequest proto;
                auto body = SerializeDeterministic(proto, "MetricsRequest");
                if (body.IsErr()) {
                    return PartsResult::Err(std::move(body).UnwrapErr());
                }
                parts.push_back(Part(OperationKind::GetMetrics, std::move(body).Unwrap()));
            } else {
                static_assert(kAlwaysFalse<T>, "unhandled request type");
            }
            return PartsResult::Ok(std::move(parts));
        }, request);
    }

    Result<InboundRequest, ChannelFailure> OperationCodec::DecodeRequestPart(
        const OperationKind kind,
        std::span<const uint8_t> body) {
        using InboundResult = Result<InboundRequest, ChannelFailure>;
        switch (kind) {
            case OperationKind::Execute: {
                auto parsed = Parse<ops::ExecuteRequest>(body, "ExecuteRequest");
                if (parsed.IsErr()) {
                    return InboundResult::Err(std::move(parsed).UnwrapErr());
                }
                auto proto = std::move(parsed).Unwrap();
                ExecuteRequest request{
                    .code = proto.code(),
                    .context_json = proto.context_json(),
                    .timeout = std::chrono::milliseconds(proto.timeout_ms())
                };
                WipeString(*proto.mutable_context_json());
                return InboundResult::Ok(std::move(request));
            }
            case OperationKind::SignTransactionKey: {
                auto parsed = Parse<ops::SignTransactionKey>(body, "SignTransactionKey");
                if (parsed.IsErr()) {
                    return InboundResult::Err(std::move(parsed).UnwrapErr());
                }
                auto proto = std::move(parsed).Unwrap();
                SignTransactionKeyPart part{AsBytes(proto.key_material())};
                WipeString(*proto.mutable_key_material());
                return InboundResult::Ok(std::move(part));
            }
            case OperationKind::SignTransactionData: {
                auto parsed = Parse<ops::SignTransactionData>(body, "SignTransactionData");
                if (parsed.IsErr()) {
                    return InboundResult::Err(std::move(parsed).UnwrapErr());
                }
                return InboundResult::Ok(SignTransactionDataPart{AsBytes(parsed.Unwrap().transaction())});
            }
            case OperationKind::Ping: {
                auto parsed = Parse<ops::PingRequest>(body, "PingRequest");
                if (parsed.IsErr()) {
                    return InboundResult::Err(std::move(parsed).UnwrapErr());
                }
                return InboundResult::Ok(PingRequest{parsed.Unwrap().nonce()});
            }
            case OperationKind::GetMetrics: {
                auto parsed = Parse<ops::MetricsRequest>(body, "MetricsRequest");
                if (parsed.IsErr()) {
                    return InboundResult::Err(std::move(parsed).UnwrapErr());
                }
                return InboundResult::Ok(MetricsRequest{});
            }
            case OperationKind::ExecuteResult:
            case OperationKind::SignResult:
            case OperationKind::Pong:
            case OperationKind::MetricsReport:
            case OperationKind::Error:
                break;
        }
        return InboundResult::Err(ChannelFailure::InvalidInput(
            fmt::format("{} is not a request operation", enums::ToString(kind))));
    }

    Result<std::vector<uint8_t>, ChannelFailure> OperationCodec::EncodeResponse(const Response& response) {
        return std::visit([](const auto& value) -> Result<std::vector<uint8_t>, ChannelFailure> {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, ExecuteResult>) {
                ops::ExecuteResult proto;
                proto.set_result_json(value.result_json);
                ToProto(value.metrics, *proto.mutable_metrics());
                return SerializeDeterministic(proto, "ExecuteResult");
            } else if constexpr (std::is_same_v<T, SignResult>) {
                ops::SignResult proto;
                proto.set_signature(AsString(value.signature));
                ToProto(value.metrics, *proto.mutable_metrics());
                return SerializeDeterministic(proto, "SignResult");
            } else if constexpr (std::is_same_v<T, PongResponse>) {
                ops::PongResponse proto;
                proto.set_nonce(value.nonce);
                return SerializeDeterministic(proto, "PongResponse");
            } else if constexpr (std::is_same_v<T, MetricsReport>) {
                return EncodeMetricsReport(value);
            } else if constexpr (std::is_same_v<T, ErrorResponse>) {
                ops::ErrorResponse proto;
                proto.set_code(value.code);
                proto.set_message(value.message);
                proto.set_request_sequence(value.request_sequence);
                return SerializeDeterministic(proto, "ErrorResponse");
            } else {
                static_assert(kAlwaysFalse<T>, "unhandled response type");
            }
        }, response);
    }

    Result<Response, ChannelFailure> OperationCodec::DecodeResponse(
        const OperationKind kind,
        std::span<const uint8_t> body) {
        using ResponseResult = Result<Response, ChannelFailure>;
        switch (kind) {
            case OperationKind::ExecuteResult: {
                auto parsed = Parse<ops::ExecuteResult>(body, "ExecuteResult");
                if (parsed.IsErr()) {
                    return ResponseResult::Err(std::move(parsed).UnwrapErr());
                }
                const auto& proto = parsed.Unwrap();
                return ResponseResult::Ok(ExecuteResult{proto.result_json(), FromProto(proto.metrics())});
            }
            case OperationKind::SignResult: {
                auto parsed = Parse<ops::SignResult>(body, "SignResult");
                if (parsed.IsErr()) {
                    return ResponseResult::Err(std::move(parsed).UnwrapErr());
                }
                const auto& proto = parsed.Unwrap();
                return ResponseResult::Ok(SignResult{AsBytes(proto.signature()), FromProto(proto.metrics())});
            }
            case OperationKind::Pong: {
                auto parsed = Parse<ops::PongResponse>(body, "PongResponse");
                if (parsed.IsErr()) {
                    return ResponseResult::Err(std::move(parsed).UnwrapErr());
                }
                return ResponseResult::Ok(PongResponse{parsed.Unwrap().nonce()});
            }
            case OperationKind::MetricsReport: {
                auto parsed = Parse<ops::MetricsReport>(body, "MetricsReport");
                if (parsed.IsErr()) {
                    return ResponseResult::Err(std::move(parsed).UnwrapErr());
                }
                return ResponseResult::Ok(DecodeMetricsReport(parsed.Unwrap()));
            }
            case OperationKind::Error: {
                auto parsed = Parse<ops::ErrorResponse>(body, "ErrorResponse");
                if (parsed.IsErr()) {
                    return ResponseResult::Err(std::move(parsed).UnwrapErr());
                }
                const auto& proto = parsed.Unwrap();
                return ResponseResult::Ok(ErrorResponse{proto.code(), proto.message(), proto.request_sequence()});
            }
            case OperationKind::Execute:
            case OperationKind::SignTransactionKey:
            case OperationKind::SignTransactionData:
            case OperationKind::Ping:
            case OperationKind::GetMetrics:
                break;
        }
        return ResponseResult::Err(ChannelFailure::InvalidInput(
            fmt::format("{} is not a response operation", enums::ToString(kind))));
    }

}

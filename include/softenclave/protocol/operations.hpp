#pragma once
#include "softenclave/core/failures.hpp"
#include "softenclave/core/result.hpp"
#include "softenclave/enums/operation_kind.hpp"
#include "softenclave/metrics/channel_metrics.hpp"
#include <chrono>
#include <cstdint>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace softenclave::channel {

struct ExecutionMetrics {
    std::chrono::microseconds key_exposure{0};
    std::chrono::microseconds total_duration{0};
    bool memory_zeroed = false;
};

struct ExecuteRequest {
    std::string code;
    std::string context_json;
    std::chrono::milliseconds timeout{0};
};

struct ExecuteResult {
    std::string result_json;
    ExecutionMetrics metrics;
};

/// Travels as two envelopes: SignTransactionKey, then SignTransactionData.
struct SignTransactionRequest {
    std::vector<uint8_t> key_material;
    std::vector<uint8_t> transaction;
};

struct SignResult {
    std::vector<uint8_t> signature;
    ExecutionMetrics metrics;
};

struct PingRequest {
    uint64_t nonce = 0;
};

struct PongResponse {
    uint64_t nonce = 0;
};

struct MetricsRequest {};

struct MetricsReport {
    metrics::MetricsSnapshot snapshot;
};

struct ErrorResponse {
    std::string code;
    std::string message;
    uint64_t request_sequence = 0;
};

using Request = std::variant<ExecuteRequest, SignTransactionRequest, PingRequest, MetricsRequest>;
using Response = std::variant<ExecuteResult, SignResult, PongResponse, MetricsReport, ErrorResponse>;

/// One sealed unit of a request: the kind it is sealed under and its encoded body.
struct RequestPart {
    enums::OperationKind kind;
    std::vector<uint8_t> body;
};

/// Decoded single envelope on the enclave side, before request reassembly.
struct SignTransactionKeyPart {
    std::vector<uint8_t> key_material;
};

struct SignTransactionDataPart {
    std::vector<uint8_t> transaction;
};

using InboundRequest = std::variant<
    ExecuteRequest,
    SignTransactionKeyPart,
    SignTransactionDataPart,
    PingRequest,
    MetricsRequest>;

/// Kind of the last part a request is sealed as; the response answers this kind.
[[nodiscard]] enums::OperationKind KindOf(const Request& request);
[[nodiscard]] enums::OperationKind KindOf(const Response& response);

[[nodiscard]] ErrorResponse ErrorResponseFrom(const ChannelFailure& failure, uint64_t request_sequence);

/**
 * @brief Protobuf bodies for the operation catalogue
 *
 * Requests become one or more RequestParts, each sealed separately. Responses are
 * always a single body. Decoding checks that the body matches the kind it was
 * opened under; a body never decodes as a different operation.
 */
class OperationCodec {
public:
    [[nodiscard]] static Result<std::vector<RequestPart>, ChannelFailure> EncodeRequest(
        const Request& request);

    [[nodiscard]] static Result<InboundRequest, ChannelFailure> DecodeRequestPart(
        enums::OperationKind kind,
        std::span<const uint8_t> body);

    [[nodiscard]] static Result<std::vector<uint8_t>, ChannelFailure> EncodeResponse(
        const Response& response);

    [[nodiscard]] static Result<Response, ChannelFailure> DecodeResponse(
        enums::OperationKind kind,
        std::span<const uint8_t> body);

private:
    OperationCodec() = delete;
};

}  // namespace softenclave::channel

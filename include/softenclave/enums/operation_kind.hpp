#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace softenclave::channel::enums {

/**
 * @brief Closed set of operations carried over the channel
 *
 * Each kind maps to one versioned associated-data tag, so an envelope sealed
 * for one operation never opens as another. Values match the wire enum in
 * operations.proto.
 */
enum class OperationKind : uint8_t {
    Execute = 1,
    ExecuteResult = 2,
    SignTransactionKey = 3,
    SignTransactionData = 4,
    SignResult = 5,
    Ping = 6,
    Pong = 7,
    GetMetrics = 8,
    MetricsReport = 9,
    Error = 10
};

/// Associated data bound into every envelope of this kind.
constexpr std::string_view OperationTag(OperationKind kind) noexcept {
    switch (kind) {
        case OperationKind::Execute: return "soft-enclave/op=execute/v1";
        case OperationKind::ExecuteResult: return "soft-enclave/op=execute-result/v1";
        case OperationKind::SignTransactionKey: return "soft-enclave/op=sign-tx-key/v1";
        case OperationKind::SignTransactionData: return "soft-enclave/op=sign-tx-data/v1";
        case OperationKind::SignResult: return "soft-enclave/op=sign-result/v1";
        case OperationKind::Ping: return "soft-enclave/op=ping/v1";
        case OperationKind::Pong: return "soft-enclave/op=pong/v1";
        case OperationKind::GetMetrics: return "soft-enclave/op=get-metrics/v1";
        case OperationKind::MetricsReport: return "soft-enclave/op=metrics/v1";
        case OperationKind::Error: return "soft-enclave/op=error/v1";
    }
    return {};
}

/// Response kind the enclave answers a request kind with; nullopt for kinds that are not requests.
constexpr std::optional<OperationKind> ResponseKind(OperationKind request) noexcept {
    switch (request) {
        case OperationKind::Execute: return OperationKind::ExecuteResult;
        case OperationKind::SignTransactionKey:
        case OperationKind::SignTransactionData: return OperationKind::SignResult;
        case OperationKind::Ping: return OperationKind::Pong;
        case OperationKind::GetMetrics: return OperationKind::MetricsReport;
        default: return std::nullopt;
    }
}

constexpr bool IsKnownOperation(uint32_t raw) noexcept {
    return raw >= static_cast<uint32_t>(OperationKind::Execute) &&
           raw <= static_cast<uint32_t>(OperationKind::Error);
}

constexpr const char* ToString(OperationKind kind) noexcept {
    switch (kind) {
        case OperationKind::Execute: return "EXECUTE";
        case OperationKind::ExecuteResult: return "EXECUTE_RESULT";
        case OperationKind::SignTransactionKey: return "SIGN_TRANSACTION_KEY";
        case OperationKind::SignTransactionData: return "SIGN_TRANSACTION_DATA";
        case OperationKind::SignResult: return "SIGN_RESULT";
        case OperationKind::Ping: return "PING";
        case OperationKind::Pong: return "PONG";
        case OperationKind::GetMetrics: return "GET_METRICS";
        case OperationKind::MetricsReport: return "METRICS";
        case OperationKind::Error: return "ERROR";
        default: return "UNKNOWN";
    }
}

} // namespace softenclave::channel::enums

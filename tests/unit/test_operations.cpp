#include <catch2/catch_test_macros.hpp>
#include "softenclave/protocol/operations.hpp"
#include <variant>
using namespace softenclave::channel;
using enums::OperationKind;

TEST_CASE("Operations - Request kinds", "[operations]") {
    REQUIRE(KindOf(Request{ExecuteRequest{}}) == OperationKind::Execute);
    REQUIRE(KindOf(Request{SignTransactionRequest{}}) == OperationKind::SignTransactionData);
    REQUIRE(KindOf(Request{PingRequest{}}) == OperationKind::Ping);
    REQUIRE(KindOf(Request{MetricsRequest{}}) == OperationKind::GetMetrics);

    REQUIRE(KindOf(Response{ExecuteResult{}}) == OperationKind::ExecuteResult);
    REQUIRE(KindOf(Response{ErrorResponse{}}) == OperationKind::Error);
    REQUIRE(enums::ResponseKind(OperationKind::SignTransactionKey) == OperationKind::SignResult);
    REQUIRE_FALSE(enums::ResponseKind(OperationKind::Pong).has_value());
}

TEST_CASE("Operations - Tags are distinct and versioned", "[operations][security]") {
    std::vector<std::string_view> tags;
    for (uint32_t raw = 1; enums::IsKnownOperation(raw); ++raw) {
        const auto tag = enums::OperationTag(static_cast<OperationKind>(raw));
        REQUIRE(tag.ends_with("/v1"));
        for (const auto& other : tags) {
            REQUIRE(tag != other);
        }
        tags.push_back(tag);
    }
    REQUIRE(tags.size() == 10);
    REQUIRE_FALSE(enums::IsKnownOperation(0));
    REQUIRE_FALSE(enums::IsKnownOperation(11));
}

TEST_CASE("Operations - Request encoding", "[operations]") {
    SECTION("Execute is a single part") {
        const ExecuteRequest request{
            .code = "return 1 + 1",
            .context_json = "{\"user\":\"alice\"}",
            .timeout = std::chrono::milliseconds(250)
        };
        auto parts = OperationCodec::EncodeRequest(request);
        REQUIRE(parts.IsOk());
        REQUIRE(parts.Unwrap().size() == 1);
        REQUIRE(parts.Unwrap()[0].kind == OperationKind::Execute);

        auto decoded = OperationCodec::DecodeRequestPart(OperationKind::Execute, parts.Unwrap()[0].body);
        REQUIRE(decoded.IsOk());
        const auto& got = std::get<ExecuteRequest>(decoded.Unwrap());
        REQUIRE(got.code == request.code);
        REQUIRE(got.context_json == request.context_json);
        REQUIRE(got.timeout == std::chrono::milliseconds(250));
    }
    SECTION("Sign is split into key then data") {
        const SignTransactionRequest request{.key_material = {1, 2, 3}, .transaction = {9, 8, 7, 6}};
        auto parts = OperationCodec::EncodeRequest(request).Unwrap();
        REQUIRE(parts.size() == 2);
        REQUIRE(parts[0].kind == OperationKind::SignTransactionKey);
        REQUIRE(parts[1].kind == OperationKind::SignTransactionData);

        auto key = OperationCodec::DecodeRequestPart(parts[0].kind, parts[0].body).Unwrap();
        auto data = OperationCodec::DecodeRequestPart(parts[1].kind, parts[1].body).Unwrap();
        REQUIRE(std::get<SignTransactionKeyPart>(key).key_material == request.key_material);
        REQUIRE(std::get<SignTransactionDataPart>(data).transaction == request.transaction);
    }
    SECTION("Negative timeouts are clamped to zero") {
        auto parts = OperationCodec::EncodeRequest(ExecuteRequest{.code = "x", .timeout = std::chrono::milliseconds(-5)});
        auto decoded = OperationCodec::DecodeRequestPart(OperationKind::Execute, parts.Unwrap()[0].body);
        REQUIRE(std::get<ExecuteRequest>(decoded.Unwrap()).timeout == std::chrono::milliseconds(0));
    }
    SECTION("Ping carries its nonce") {
        auto parts = OperationCodec::EncodeRequest(PingRequest{0xfeedULL}).Unwrap();
        auto decoded = OperationCodec::DecodeRequestPart(OperationKind::Ping, parts[0].body).Unwrap();
        REQUIRE(std::get<PingRequest>(decoded).nonce == 0xfeedULL);
    }
    SECTION("Response kinds are not requests") {
        auto decoded = OperationCodec::DecodeRequestPart(OperationKind::Pong, {});
        REQUIRE(decoded.IsErr());
        REQUIRE(decoded.UnwrapErr().type == ChannelFailureType::InvalidInput);
    }
    SECTION("Garbage body fails to decode") {
        const std::vector<uint8_t> garbage = {0xff, 0xff, 0xff, 0xff};
        auto decoded = OperationCodec::DecodeRequestPart(OperationKind::Execute, garbage);
        REQUIRE(decoded.IsErr());
        REQUIRE(decoded.UnwrapErr().type == ChannelFailureType::Decode);
    }
}

TEST_CASE("Operations - Response encoding", "[operations]") {
    SECTION("Execute result with metrics") {
        const ExecuteResult result{
            .result_json = "{\"ok\":true}",
            .metrics = {std::chrono::microseconds(12), std::chrono::microseconds(900), true}
        };
        auto body = OperationCodec::EncodeResponse(result).Unwrap();
        auto decoded = OperationCodec::DecodeResponse(OperationKind::ExecuteResult, body);
        REQUIRE(decoded.IsOk());
        const auto& got = std::get<ExecuteResult>(decoded.Unwrap());
        REQUIRE(got.result_json == "{\"ok\":true}");
        REQUIRE(got.metrics.key_exposure == std::chrono::microseconds(12));
        REQUIRE(got.metrics.total_duration == std::chrono::microseconds(900));
        REQUIRE(got.metrics.memory_zeroed);
    }
    SECTION("Metrics report") {
        MetricsReport report;
        report.snapshot.sealed = 3;
        report.snapshot.replay_rejections = 1;
        report.snapshot.total_key_exposure = std::chrono::microseconds(77);
        auto body = OperationCodec::EncodeResponse(report).Unwrap();
        auto decoded = OperationCodec::DecodeResponse(OperationKind::MetricsReport, body).Unwrap();
        const auto& got = std::get<MetricsReport>(decoded).snapshot;
        REQUIRE(got.sealed == 3);
        REQUIRE(got.replay_rejections == 1);
        REQUIRE(got.total_key_exposure == std::chrono::microseconds(77));
    }
    SECTION("Error response from a failure") {
        const auto error = ErrorResponseFrom(ChannelFailure::InvalidState("No signing key"), 41);
        REQUIRE(error.code == "InvalidState");
        REQUIRE(error.message == "No signing key");
        auto body = OperationCodec::EncodeResponse(error).Unwrap();
        auto decoded = OperationCodec::DecodeResponse(OperationKind::Error, body).Unwrap();
        REQUIRE(std::get<ErrorResponse>(decoded).code == "InvalidState");
        REQUIRE(std::get<ErrorResponse>(decoded).request_sequence == 41);
    }
    SECTION("Request kinds are not responses") {
        auto decoded = OperationCodec::DecodeResponse(OperationKind::Execute, {});
        REQUIRE(decoded.IsErr());
        REQUIRE(decoded.UnwrapErr().type == ChannelFailureType::InvalidInput);
    }
}

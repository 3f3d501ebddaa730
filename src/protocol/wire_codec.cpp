#include "softenclave/protocol/wire_codec.hpp"
#include "channel/envelope.pb.h"
#include "channel/frame.pb.h"
#include "channel/handshake.pb.h"
#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <google/protobuf/message_lite.h>
#include <fmt/format.h>
#include <limits>
#include <string>
#include <string_view>

namespace softenclave::channel {
    namespace wire = ::softenclave::proto::channel;

    namespace {
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
                        ChannelFailure::Encode(
                            fmt::format("Failed to serialize {} deterministically", name)));
                }
            }
            return Result<std::vector<uint8_t>, ChannelFailure>::Ok(
                std::vector<uint8_t>(output.begin(), output.end()));
        }

        Result<Unit, ChannelFailure> ParseInto(
            google::protobuf::MessageLite& message,
            std::span<const uint8_t> bytes,
            std::string_view name) {
            if (bytes.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
                return Result<Unit, ChannelFailure>::Err(
                    ChannelFailure::MessageTooLarge(
                        fmt::format("{} of {} bytes cannot be parsed", name, bytes.size())));
            }
            if (!message.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
                return Result<Unit, ChannelFailure>::Err(
                    ChannelFailure::Decode(fmt::format("Failed to parse {}", name)));
            }
            return Result<Unit, ChannelFailure>::Ok(unit);
        }

        std::string AsString(std::span<const uint8_t> bytes) {
            return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
        }

        std::vector<uint8_t> AsBytes(const std::string& bytes) {
            return std::vector<uint8_t>(bytes.begin(), bytes.end());
        }

        void ToProto(const WireEnvelope& envelope, wire::WireEnvelope& out) {
            out.set_version(envelope.version);
            out.set_nonce(AsString(envelope.nonce));
            out.set_ciphertext(AsString(envelope.ciphertext));
        }

        WireEnvelope FromProto(const wire::WireEnvelope& envelope) {
            return WireEnvelope{
                .version = envelope.version(),
                .nonce = AsBytes(envelope.nonce()),
                .ciphertext = AsBytes(envelope.ciphertext())
            };
        }

        void ToProto(const HandshakeHello& hello, wire::HandshakeHello& out) {
            out.set_version(hello.version);
            out.set_role(hello.role);
            out.set_public_key(AsString(hello.public_key));
            out.set_endpoint_id(hello.endpoint_id);
            out.set_code_identity(hello.code_identity);
        }

        HandshakeHello FromProto(const wire::HandshakeHello& hello) {
            return HandshakeHello{
                .version = hello.version(),
                .role = hello.role(),
                .public_key = AsBytes(hello.public_key()),
                .endpoint_id = hello.endpoint_id(),
                .code_identity = hello.code_identity()
            };
        }
    }

    Result<std::vector<uint8_t>, ChannelFailure> WireCodec::EncodeEnvelope(const WireEnvelope& envelope) {
        wire::WireEnvelope proto;
        ToProto(envelope, proto);
        return SerializeDeterministic(proto, "WireEnvelope");
    }

    Result<WireEnvelope, ChannelFailure> WireCodec::DecodeEnvelope(std::span<const uint8_t> bytes) {
        wire::WireEnvelope proto;
        SOFTENCLAVE_TRY(ParseInto(proto, bytes, "WireEnvelope"));
        return Result<WireEnvelope, ChannelFailure>::Ok(FromProto(proto));
    }

    Result<std::vector<uint8_t>, ChannelFailure> WireCodec::EncodePayload(
        const uint64_t sequence,
        std::span<const uint8_t> body) {
        if (sequence < kMinSequence || sequence > kMaxSequence) {
            return Result<std::vector<uint8_t>, ChannelFailure>::Err(
                ChannelFailure::InvalidSequence(fmt::format("Sequence {} is outside the wire range", sequence)));
        }
        wire::SealedPayload proto;
        proto.set_sequence(static_cast<uint32_t>(sequence));
        proto.set_body(AsString(body));
        auto encoded = SerializeDeterministic(proto, "SealedPayload");
        proto.mutable_body()->assign(proto.body().size(), '\0');
        return encoded;
    }

    Result<SealedPayload, ChannelFailure> WireCodec::DecodePayload(std::span<const uint8_t> bytes) {
        wire::SealedPayload proto;
        SOFTENCLAVE_TRY(ParseInto(proto, bytes, "SealedPayload"));
        SealedPayload payload{
            .sequence = proto.sequence(),
            .body = AsBytes(proto.body())
        };
        proto.mutable_body()->assign(proto.body().size(), '\0');
        return Result<SealedPayload, ChannelFailure>::Ok(std::move(payload));
    }

    Result<std::vector<uint8_t>, ChannelFailure> WireCodec::EncodeHello(const HandshakeHello& hello) {
        wire::HandshakeHello proto;
        ToProto(hello, proto);
        return SerializeDeterministic(proto, "HandshakeHello");
    }

    Result<HandshakeHello, ChannelFailure> WireCodec::DecodeHello(std::span<const uint8_t> bytes) {
        wire::HandshakeHello proto;
        SOFTENCLAVE_TRY(ParseInto(proto, bytes, "HandshakeHello"));
        return Result<HandshakeHello, ChannelFailure>::Ok(FromProto(proto));
    }

    Result<std::vector<uint8_t>, ChannelFailure> WireCodec::EncodeFrame(const TransportFrame& frame) {
        wire::TransportFrame proto;
        if (const auto* hello = std::get_if<HandshakeHello>(&frame)) {
            ToProto(*hello, *proto.mutable_hello());
        } else {
            const auto& message = std::get<ChannelMessage>(frame);
            proto.mutable_message()->set_operation(message.operation);
            ToProto(message.envelope, *proto.mutable_message()->mutable_envelope());
        }
        return SerializeDeterministic(proto, "TransportFrame");
    }

    Result<TransportFrame, ChannelFailure> WireCodec::DecodeFrame(std::span<const uint8_t> bytes) {
        wire::TransportFrame proto;
        SOFTENCLAVE_TRY(ParseInto(proto, bytes, "TransportFrame"));
        switch (proto.body_case()) {
            case wire::TransportFrame::kHello:
                return Result<TransportFrame, ChannelFailure>::Ok(FromProto(proto.hello()));
            case wire::TransportFrame::kMessage:
                return Result<TransportFrame, ChannelFailure>::Ok(ChannelMessage{
                    .operation = proto.message().operation(),
                    .envelope = FromProto(proto.message().envelope())
                });
            case wire::TransportFrame::BODY_NOT_SET:
                break;
        }
        return Result<TransportFrame, ChannelFailure>::Err(
            ChannelFailure::Decode("Transport frame carries neither a hello nor a message"));
    }

}

#pragma once
#include <string>
#include <utility>
namespace softenclave::channel {

/// Faults of the libsodium layer: init, guarded allocation and access.
enum class SodiumFailureType {
    InitializationFailed,
    AllocationFailed,
    BufferTooSmall,
    ReadOperationFailed,
    ComparisonFailed,
    InvalidOperation
};

enum class ChannelFailureType {
    // Rejections a peer or the wire can provoke.
    KeyAgreement,
    InvalidSequence,
    ReplayDetected,
    Authentication,
    SequenceViolation,
    HandshakeTimeout,
    SequenceExhaustion,
    // Local misuse and infrastructure faults.
    KeyGeneration,
    DeriveKey,
    InvalidInput,
    Decode,
    Encode,
    MessageTooLarge,
    InvalidState,
    ObjectDisposed,
    Transport,
    Timeout,
    Generic
};

/// Name carried on the wire in ErrorResponse.code.
constexpr const char* ToString(const ChannelFailureType type) noexcept {
    using T = ChannelFailureType;
    switch (type) {
        case T::KeyAgreement: return "KeyAgreement";
        case T::InvalidSequence: return "InvalidSequence";
        case T::ReplayDetected: return "ReplayDetected";
        case T::Authentication: return "Authentication";
        case T::SequenceViolation: return "SequenceViolation";
        case T::HandshakeTimeout: return "HandshakeTimeout";
        case T::SequenceExhaustion: return "SequenceExhaustion";
        case T::KeyGeneration: return "KeyGeneration";
        case T::DeriveKey: return "DeriveKey";
        case T::InvalidInput: return "InvalidInput";
        case T::Decode: return "Decode";
        case T::Encode: return "Encode";
        case T::MessageTooLarge: return "MessageTooLarge";
        case T::InvalidState: return "InvalidState";
        case T::ObjectDisposed: return "ObjectDisposed";
        case T::Transport: return "Transport";
        case T::Timeout: return "Timeout";
        case T::Generic: return "Generic";
    }
    return "Unknown";
}

class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;

    SodiumFailure(const SodiumFailureType kind, std::string text)
        : type(kind), message(std::move(text)) {}

    static SodiumFailure InitializationFailed(std::string text) { return {SodiumFailureType::InitializationFailed, std::move(text)}; }
    static SodiumFailure AllocationFailed(std::string text) { return {SodiumFailureType::AllocationFailed, std::move(text)}; }
    static SodiumFailure BufferTooSmall(std::string text) { return {SodiumFailureType::BufferTooSmall, std::move(text)}; }
    static SodiumFailure ReadOperationFailed(std::string text) { return {SodiumFailureType::ReadOperationFailed, std::move(text)}; }
    static SodiumFailure ComparisonFailed(std::string text) { return {SodiumFailureType::ComparisonFailed, std::move(text)}; }
    static SodiumFailure InvalidOperation(std::string text) { return {SodiumFailureType::InvalidOperation, std::move(text)}; }
};

/// Failure raised by any channel, handshake or codec operation.
class ChannelFailure {
public:
    ChannelFailureType type;
    std::string message;

    ChannelFailure(const ChannelFailureType kind, std::string text)
        : type(kind), message(std::move(text)) {}

    static ChannelFailure KeyAgreement(std::string text) { return {ChannelFailureType::KeyAgreement, std::move(text)}; }
    static ChannelFailure InvalidSequence(std::string text) { return {ChannelFailureType::InvalidSequence, std::move(text)}; }
    static ChannelFailure ReplayDetected(std::string text) { return {ChannelFailureType::ReplayDetected, std::move(text)}; }
    static ChannelFailure Authentication(std::string text) { return {ChannelFailureType::Authentication, std::move(text)}; }
    static ChannelFailure SequenceViolation(std::string text) { return {ChannelFailureType::SequenceViolation, std::move(text)}; }
    static ChannelFailure HandshakeTimeout(std::string text) { return {ChannelFailureType::HandshakeTimeout, std::move(text)}; }
    static ChannelFailure SequenceExhaustion(std::string text) { return {ChannelFailureType::SequenceExhaustion, std::move(text)}; }
    static ChannelFailure KeyGeneration(std::string text) { return {ChannelFailureType::KeyGeneration, std::move(text)}; }
    static ChannelFailure DeriveKey(std::string text) { return {ChannelFailureType::DeriveKey, std::move(text)}; }
    static ChannelFailure InvalidInput(std::string text) { return {ChannelFailureType::InvalidInput, std::move(text)}; }
    static ChannelFailure Decode(std::string text) { return {ChannelFailureType::Decode, std::move(text)}; }
    static ChannelFailure Encode(std::string text) { return {ChannelFailureType::Encode, std::move(text)}; }
    static ChannelFailure MessageTooLarge(std::string text) { return {ChannelFailureType::MessageTooLarge, std::move(text)}; }
    static ChannelFailure InvalidState(std::string text) { return {ChannelFailureType::InvalidState, std::move(text)}; }
    static ChannelFailure ObjectDisposed(std::string text) { return {ChannelFailureType::ObjectDisposed, std::move(text)}; }
    static ChannelFailure Transport(std::string text) { return {ChannelFailureType::Transport, std::move(text)}; }
    static ChannelFailure Timeout(std::string text) { return {ChannelFailureType::Timeout, std::move(text)}; }
    static ChannelFailure Generic(std::string text) { return {ChannelFailureType::Generic, std::move(text)}; }

    /// Guarded-memory faults surface to channel callers as Generic.
    static ChannelFailure FromSodiumFailure(const SodiumFailure& failure) {
        return Generic(failure.message);
    }
};

}

#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace softenclave::channel {

inline constexpr uint32_t kProtocolVersion = 1;

inline constexpr size_t kX25519PublicKeyBytes = 32;
inline constexpr size_t kX25519PrivateKeyBytes = 32;
inline constexpr size_t kSha256Bytes = 32;

inline constexpr size_t kAesKeyBytes = 32;
inline constexpr size_t kAesGcmNonceBytes = 12;
inline constexpr size_t kAesGcmTagBytes = 16;

// Sequence occupies the last four nonce bytes, big-endian.
inline constexpr size_t kNonceSequenceOffset = 8;
inline constexpr size_t kNonceSequenceBytes = 4;
inline constexpr uint64_t kMinSequence = 1;
inline constexpr uint64_t kMaxSequence = 0xFFFFFFFFull;

inline constexpr size_t kDefaultReplayCacheCapacity = 4096;
inline constexpr uint64_t kStrictSequenceWindow = 0;
inline constexpr size_t kMaxCiphertextBytes = 1024 * 1024;
inline constexpr size_t kMaxPlaintextBytes = 256 * 1024;
inline constexpr size_t kMaxCodeBytes = 128 * 1024;
inline constexpr uint64_t kDefaultRenegotiationThreshold = kMaxSequence - (1ull << 20);
inline constexpr std::chrono::milliseconds kDefaultHandshakeTimeout{15'000};
inline constexpr std::chrono::milliseconds kDefaultRequestTimeout{15'000};

inline constexpr std::string_view kContextSeparator = "|";
inline constexpr std::string_view kKdfInfoBase = "soft-enclave/v1";
inline constexpr std::string_view kAeadKeyLabel = "/aead/";
inline constexpr std::string_view kBaseIvLabel = "/iv/";
inline constexpr std::string_view kHostToEnclaveLabel = "host->enclave/";
inline constexpr std::string_view kEnclaveToHostLabel = "enclave->host/";

inline constexpr std::string_view kPurposeHandshakeX25519 = "handshake-x25519";

}  // namespace softenclave::channel

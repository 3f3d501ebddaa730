#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
namespace softenclave::channel {

/// Primitive sizes shared by the crypto layer.
struct Constants {
    static constexpr size_t X_25519_PUBLIC_KEY_SIZE = 32;
    static constexpr size_t X_25519_PRIVATE_KEY_SIZE = 32;
    static constexpr size_t X_25519_SHARED_SECRET_SIZE = 32;
    static constexpr size_t CURVE_25519_FIELD_ELEMENT_SIZE = 32;

    static constexpr size_t AES_KEY_SIZE = 32;
    static constexpr size_t AES_GCM_NONCE_SIZE = 12;
    static constexpr size_t AES_GCM_TAG_SIZE = 16;
    static constexpr size_t SHA_256_DIGEST_SIZE = 32;

    static constexpr size_t OPENSSL_ERROR_BUFFER_SIZE = 256;
};

struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr const char* ALGORITHM_HKDF = "HKDF";
    static constexpr const char* ALGORITHM_SHA256 = "SHA256";
    static constexpr const char* PARAM_DIGEST = "digest";
    static constexpr const char* PARAM_KEY = "key";
    static constexpr const char* PARAM_SALT = "salt";
    static constexpr const char* PARAM_INFO = "info";
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};

struct SodiumConstants {
    static constexpr int SUCCESS = 0;
};

struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Secure memory handle already released";
    static constexpr std::string_view CONSTANT_TIME_COMPARISON_FAILED = "Constant-time comparison failed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view FAILED_TO_READ_SECURE_MEMORY = "Failed to read secure memory: ";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view CHANNEL_CLOSED = "Channel has been closed";
    static constexpr std::string_view AES_GCM_AUTHENTICATION_FAILED =
        "AES-GCM tag mismatch: envelope was altered or sealed under another key";
    static constexpr std::string_view REPLAY_DETECTED = "Replay detected: nonce already accepted on this channel";
};

}

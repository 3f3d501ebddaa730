#include "softenclave/crypto/aes_gcm.hpp"
#include "softenclave/core/constants.hpp"
#include <fmt/format.h>
#include <openssl/evp.h>
#include <openssl/err.h>
#include <sodium.h>
#include <algorithm>
#include <array>
#include <cstddef>
#include <memory>
#include <new>
#include <optional>
#include <string>
namespace softenclave::channel::crypto {
using OpenSSL = OpenSSLConstants;
namespace {
    using EVP_CIPHER_CTX_ptr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;
    using BytesResult = Result<std::vector<uint8_t>, ChannelFailure>;

    /// Most recent queued OpenSSL error; drains the queue so it cannot leak into the next call.
    std::string GetOpenSSLError() {
        unsigned long last = OpenSSL::NO_ERROR;
        for (unsigned long code = ERR_get_error(); code != OpenSSL::NO_ERROR; code = ERR_get_error()) {
            last = code;
        }
        if (last == OpenSSL::NO_ERROR) {
            return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
        }
        std::array<char, Constants::OPENSSL_ERROR_BUFFER_SIZE> text{};
        ERR_error_string_n(last, text.data(), text.size());
        return std::string(text.data());
    }

    BytesResult OpenSSLFailure(const char* step) {
        return BytesResult::Err(
            ChannelFailure::Generic(fmt::format("{}: {}", step, GetOpenSSLError())));
    }

    BytesResult AllocateOutput(const size_t size) {
        try {
            return BytesResult::Ok(std::vector<uint8_t>(size));
        } catch (const std::bad_alloc&) {
            return BytesResult::Err(ChannelFailure::Generic(
                fmt::format("Failed to allocate {} bytes for AES-GCM output", size)));
        }
    }

    void WipeOutput(std::vector<uint8_t>& output) {
        if (!output.empty()) {
            sodium_memzero(output.data(), output.size());
        }
    }

    std::optional<ChannelFailure> ValidateKeyAndNonce(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce) {
        if (key.size() != Constants::AES_KEY_SIZE) {
            return ChannelFailure::InvalidInput(
                fmt::format("AES-256-GCM key must be {} bytes, got {}",
                    Constants::AES_KEY_SIZE, key.size()));
        }
        if (nonce.size() != Constants::AES_GCM_NONCE_SIZE) {
            return ChannelFailure::InvalidInput(
                fmt::format("AES-GCM nonce must be {} bytes, got {}",
                    Constants::AES_GCM_NONCE_SIZE, nonce.size()));
        }
        return std::nullopt;
    }

    using ContextResult = Result<EVP_CIPHER_CTX_ptr, ChannelFailure>;

    ContextResult ContextFailure(const char* step) {
        return ContextResult::Err(
            ChannelFailure::Generic(fmt::format("{}: {}", step, GetOpenSSLError())));
    }

    /// Cipher context keyed for one message with the associated data already absorbed.
    ContextResult BeginGcm(
        const bool encrypt,
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> associated_data) {
        EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
        if (!ctx) {
            return ContextFailure("Failed to create cipher context");
        }
        const int enc = encrypt ? 1 : 0;
        if (EVP_CipherInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr, enc) != OpenSSL::SUCCESS) {
            return ContextFailure("Failed to initialize AES-256-GCM");
        }
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                                static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS) {
            return ContextFailure("Failed to set nonce length");
        }
        if (EVP_CipherInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data(), enc) != OpenSSL::SUCCESS) {
            return ContextFailure("Failed to set key and nonce");
        }
        if (!associated_data.empty()) {
            int absorbed = 0;
            if (EVP_CipherUpdate(ctx.get(), nullptr, &absorbed, associated_data.data(),
                                 static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
                return ContextFailure("Failed to add associated data");
            }
        }
        return ContextResult::Ok(std::move(ctx));
    }
}
Result<std::vector<uint8_t>, ChannelFailure>
AesGcm::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data) {
    if (auto invalid = ValidateKeyAndNonce(key, nonce); invalid.has_value()) {
        return BytesResult::Err(std::move(*invalid));
    }
    auto begun = BeginGcm(true, key, nonce, associated_data);
    if (begun.IsErr()) {
        return BytesResult::Err(std::move(begun).UnwrapErr());
    }
    const auto ctx = std::move(begun).Unwrap();

    auto allocated = AllocateOutput(plaintext.size() + Constants::AES_GCM_TAG_SIZE);
    if (allocated.IsErr()) {
        return allocated;
    }
    auto output = std::move(allocated).Unwrap();
    int written = 0;
    if (!plaintext.empty() &&
        EVP_EncryptUpdate(ctx.get(), output.data(), &written,
                          plaintext.data(), static_cast<int>(plaintext.size())) != OpenSSL::SUCCESS) {
        WipeOutput(output);
        return OpenSSLFailure("Encryption failed");
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), output.data() + written, &final_len) != OpenSSL::SUCCESS) {
        WipeOutput(output);
        return OpenSSLFailure("Encryption finalization failed");
    }
    const size_t ciphertext_len = static_cast<size_t>(written + final_len);
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                            static_cast<int>(Constants::AES_GCM_TAG_SIZE),
                            output.data() + ciphertext_len) != OpenSSL::SUCCESS) {
        WipeOutput(output);
        return OpenSSLFailure("Failed to get authentication tag");
    }
    output.resize(ciphertext_len + Constants::AES_GCM_TAG_SIZE);
    return BytesResult::Ok(std::move(output));
}

Result<std::vector<uint8_t>, ChannelFailure>
AesGcm::Decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext_with_tag,
    std::span<const uint8_t> associated_data) {
    if (auto invalid = ValidateKeyAndNonce(key, nonce); invalid.has_value()) {
        return BytesResult::Err(std::move(*invalid));
    }
    // A body shorter than the tag can never authenticate.
    if (ciphertext_with_tag.size() < Constants::AES_GCM_TAG_SIZE) {
        return BytesResult::Err(ChannelFailure::Authentication(
            fmt::format("Ciphertext of {} bytes is shorter than the {} byte tag",
                ciphertext_with_tag.size(), Constants::AES_GCM_TAG_SIZE)));
    }
    const size_t body_len = ciphertext_with_tag.size() - Constants::AES_GCM_TAG_SIZE;
    const auto body = ciphertext_with_tag.first(body_len);
    std::array<uint8_t, Constants::AES_GCM_TAG_SIZE> tag{};
    std::copy(ciphertext_with_tag.begin() + static_cast<std::ptrdiff_t>(body_len),
              ciphertext_with_tag.end(), tag.begin());

    auto begun = BeginGcm(false, key, nonce, associated_data);
    if (begun.IsErr()) {
        return BytesResult::Err(std::move(begun).UnwrapErr());
    }
    const auto ctx = std::move(begun).Unwrap();

    auto allocated = AllocateOutput(std::max<size_t>(body_len, 1));
    if (allocated.IsErr()) {
        return allocated;
    }
    auto output = std::move(allocated).Unwrap();
    int written = 0;
    if (!body.empty() &&
        EVP_DecryptUpdate(ctx.get(), output.data(), &written,
                          body.data(), static_cast<int>(body.size())) != OpenSSL::SUCCESS) {
        WipeOutput(output);
        return OpenSSLFailure("Decryption failed");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                            static_cast<int>(tag.size()), tag.data()) != OpenSSL::SUCCESS) {
        WipeOutput(output);
        return OpenSSLFailure("Failed to set authentication tag");
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), output.data() + written, &final_len) != OpenSSL::SUCCESS) {
        WipeOutput(output);
        ERR_clear_error();
        return BytesResult::Err(
            ChannelFailure::Authentication(std::string(ErrorMessages::AES_GCM_AUTHENTICATION_FAILED)));
    }
    output.resize(static_cast<size_t>(written + final_len));
    return BytesResult::Ok(std::move(output));
}
}

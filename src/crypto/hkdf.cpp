#include "softenclave/crypto/hkdf.hpp"
#include "softenclave/core/constants.hpp"

#include <fmt/format.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <memory>
#include <new>
#include <vector>

namespace softenclave::channel::crypto {

namespace {
    using KdfContext = std::unique_ptr<EVP_KDF_CTX, decltype(&EVP_KDF_CTX_free)>;
    using UnitResult = Result<Unit, ChannelFailure>;

    /// HKDF-SHA256 context; the fetched algorithm is released once the context holds it.
    KdfContext NewHkdfContext() {
        EVP_KDF* kdf = EVP_KDF_fetch(nullptr, OpenSSLConstants::ALGORITHM_HKDF, nullptr);
        if (kdf == nullptr) {
            return KdfContext(nullptr, &EVP_KDF_CTX_free);
        }
        KdfContext ctx(EVP_KDF_CTX_new(kdf), &EVP_KDF_CTX_free);
        EVP_KDF_free(kdf);
        return ctx;
    }

    OSSL_PARAM OctetParam(const char* name, std::span<const uint8_t> bytes) {
        return OSSL_PARAM_construct_octet_string(
            name, const_cast<uint8_t*>(bytes.data()), bytes.size());
    }
}

Result<Unit, ChannelFailure> Hkdf::DeriveKey(
    std::span<const uint8_t> ikm,
    std::span<uint8_t> output,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {
    if (ikm.empty()) {
        return UnitResult::Err(ChannelFailure::InvalidInput("HKDF input key material cannot be empty"));
    }
    if (output.empty() || output.size() > MAX_OUTPUT_LEN) {
        return UnitResult::Err(ChannelFailure::InvalidInput(
            fmt::format("HKDF output size must be in [1, {}], got {}", MAX_OUTPUT_LEN, output.size())));
    }

    const KdfContext ctx = NewHkdfContext();
    if (!ctx) {
        return UnitResult::Err(ChannelFailure::DeriveKey("HKDF-SHA256 is unavailable in this OpenSSL build"));
    }

    // Absent salt and info are left unset; OpenSSL treats them as empty.
    std::vector<OSSL_PARAM> params;
    params.reserve(5);
    params.push_back(OSSL_PARAM_construct_utf8_string(
        OpenSSLConstants::PARAM_DIGEST, const_cast<char*>(OpenSSLConstants::ALGORITHM_SHA256), 0));
    params.push_back(OctetParam(OpenSSLConstants::PARAM_KEY, ikm));
    if (!salt.empty()) {
        params.push_back(OctetParam(OpenSSLConstants::PARAM_SALT, salt));
    }
    if (!info.empty()) {
        params.push_back(OctetParam(OpenSSLConstants::PARAM_INFO, info));
    }
    params.push_back(OSSL_PARAM_construct_end());

    if (EVP_KDF_derive(ctx.get(), output.data(), output.size(), params.data()) != OpenSSLConstants::SUCCESS) {
        return UnitResult::Err(ChannelFailure::DeriveKey(
            fmt::format("HKDF-SHA256 failed to expand {} bytes", output.size())));
    }
    return UnitResult::Ok(unit);
}

Result<std::vector<uint8_t>, ChannelFailure> Hkdf::DeriveKeyBytes(
    std::span<const uint8_t> ikm,
    const size_t output_size,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {
    std::vector<uint8_t> output;
    try {
        output.resize(output_size);
    } catch (const std::bad_alloc&) {
        return Result<std::vector<uint8_t>, ChannelFailure>::Err(ChannelFailure::DeriveKey(
            fmt::format("Failed to allocate {} bytes of HKDF output", output_size)));
    }
    return DeriveKey(ikm, output, salt, info).Map([&output](Unit) { return std::move(output); });
}

}

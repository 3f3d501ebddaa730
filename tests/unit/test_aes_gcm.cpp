#include <catch2/catch_test_macros.hpp>
#include "softenclave/crypto/aes_gcm.hpp"
#include "softenclave/crypto/sodium_interop.hpp"
#include "softenclave/protocol/constants.hpp"
using namespace softenclave::channel;
using namespace softenclave::channel::crypto;
TEST_CASE("AES-GCM - Basic encryption and decryption", "[aes_gcm]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Encrypt and decrypt round-trip") {
        const std::vector<uint8_t> key(kAesKeyBytes, 0xAA);
        const std::vector<uint8_t> nonce(kAesGcmNonceBytes, 0xBB);
        const std::vector<uint8_t> plaintext = {'P', 'I', 'N', 'G'};
        const std::vector<uint8_t> ad = {'p', 'i', 'n', 'g'};
        auto sealed = AesGcm::Encrypt(key, nonce, plaintext, ad);
        REQUIRE(sealed.IsOk());
        REQUIRE(sealed.Unwrap().size() == plaintext.size() + kAesGcmTagBytes);
        auto opened = AesGcm::Decrypt(key, nonce, sealed.Unwrap(), ad);
        REQUIRE(opened.IsOk());
        REQUIRE(opened.Unwrap() == plaintext);
    }
    SECTION("Empty plaintext matches the published all-zero vector") {
        const std::vector<uint8_t> key(kAesKeyBytes, 0x00);
        const std::vector<uint8_t> nonce(kAesGcmNonceBytes, 0x00);
        auto sealed = AesGcm::Encrypt(key, nonce, {});
        REQUIRE(sealed.IsOk());
        const std::vector<uint8_t> expected_tag = {
            0x53, 0x0f, 0x8a, 0xfb, 0xc7, 0x45, 0x36, 0xb9,
            0xa9, 0x63, 0xb4, 0xf1, 0xc4, 0xcb, 0x73, 0x8b};
        REQUIRE(sealed.Unwrap() == expected_tag);
        auto opened = AesGcm::Decrypt(key, nonce, sealed.Unwrap());
        REQUIRE(opened.IsOk());
        REQUIRE(opened.Unwrap().empty());
    }
    SECTION("Large plaintext") {
        const std::vector<uint8_t> key(kAesKeyBytes, 0x33);
        const std::vector<uint8_t> nonce(kAesGcmNonceBytes, 0x44);
        const std::vector<uint8_t> plaintext(kMaxPlaintextBytes, 0x55);
        auto sealed = AesGcm::Encrypt(key, nonce, plaintext);
        REQUIRE(sealed.IsOk());
        REQUIRE(AesGcm::Decrypt(key, nonce, sealed.Unwrap()).Unwrap() == plaintext);
    }
}
TEST_CASE("AES-GCM - Authentication failures", "[aes_gcm][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> key(kAesKeyBytes, 0x66);
    const std::vector<uint8_t> nonce(kAesGcmNonceBytes, 0x77);
    const std::vector<uint8_t> plaintext = {'s', 'e', 'c', 'r', 'e', 't'};
    const std::vector<uint8_t> ad = {'e', 'x', 'e', 'c'};
    auto ciphertext = AesGcm::Encrypt(key, nonce, plaintext, ad).Unwrap();

    auto expect_authentication_failure = [](const Result<std::vector<uint8_t>, ChannelFailure>& result) {
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ChannelFailureType::Authentication);
    };
    SECTION("Wrong key") {
        const std::vector<uint8_t> wrong_key(kAesKeyBytes, 0x99);
        expect_authentication_failure(AesGcm::Decrypt(wrong_key, nonce, ciphertext, ad));
    }
    SECTION("Wrong nonce") {
        const std::vector<uint8_t> wrong_nonce(kAesGcmNonceBytes, 0x88);
        expect_authentication_failure(AesGcm::Decrypt(key, wrong_nonce, ciphertext, ad));
    }
    SECTION("Wrong associated data") {
        const std::vector<uint8_t> wrong_ad = {'s', 'i', 'g', 'n'};
        expect_authentication_failure(AesGcm::Decrypt(key, nonce, ciphertext, wrong_ad));
    }
    SECTION("Missing associated data") {
        expect_authentication_failure(AesGcm::Decrypt(key, nonce, ciphertext));
    }
    SECTION("Tampered ciphertext") {
        ciphertext[0] ^= 0x01;
        expect_authentication_failure(AesGcm::Decrypt(key, nonce, ciphertext, ad));
    }
    SECTION("Tampered tag") {
        ciphertext.back() ^= 0x80;
        expect_authentication_failure(AesGcm::Decrypt(key, nonce, ciphertext, ad));
    }
    SECTION("Truncated below tag size") {
        ciphertext.resize(kAesGcmTagBytes - 1);
        expect_authentication_failure(AesGcm::Decrypt(key, nonce, ciphertext, ad));
    }
}
TEST_CASE("AES-GCM - Parameter validation", "[aes_gcm]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> plaintext = {1, 2, 3};
    SECTION("Short key") {
        const std::vector<uint8_t> key(16, 0x01);
        const std::vector<uint8_t> nonce(kAesGcmNonceBytes, 0x02);
        auto result = AesGcm::Encrypt(key, nonce, plaintext);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ChannelFailureType::InvalidInput);
    }
    SECTION("Short nonce") {
        const std::vector<uint8_t> key(kAesKeyBytes, 0x01);
        const std::vector<uint8_t> nonce(8, 0x02);
        auto result = AesGcm::Encrypt(key, nonce, plaintext);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ChannelFailureType::InvalidInput);
    }
    SECTION("Same inputs produce the same ciphertext") {
        const std::vector<uint8_t> key(kAesKeyBytes, 0x01);
        const std::vector<uint8_t> nonce(kAesGcmNonceBytes, 0x02);
        REQUIRE(AesGcm::Encrypt(key, nonce, plaintext).Unwrap() ==
                AesGcm::Encrypt(key, nonce, plaintext).Unwrap());
    }
}

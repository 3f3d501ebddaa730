#pragma once

#include "softenclave/core/result.hpp"
#include "softenclave/core/failures.hpp"
#include "softenclave/core/constants.hpp"

#include <sodium.h>
#include <array>
#include <atomic>
#include <mutex>
#include <span>
#include <cstddef>
#include <string_view>
#include <utility>
#include <vector>

namespace softenclave::channel::crypto {

class SecureMemoryHandle;

/**
 * @brief libsodium entry points used by the channel
 *
 * X25519 agreement, SHA-256, randomness, wiping and guarded allocation.
 * Call Initialize() once before anything that allocates or agrees keys.
 */
class SodiumInterop {
public:
    /// Runs sodium_init() exactly once per process; later calls report the first outcome.
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    /// Zeroes the buffer in a way the optimizer cannot elide.
    static void SecureWipe(std::span<uint8_t> buffer) noexcept;

    /// Length-checked comparison whose timing does not depend on contents.
    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    /**
     * @brief Fresh X25519 key pair
     *
     * The scalar is drawn directly into guarded memory and never exists elsewhere.
     *
     * @param key_purpose Label used in error messages
     * @return (private key handle, public key bytes)
     */
    static Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ChannelFailure>
    GenerateX25519KeyPair(std::string_view key_purpose);

    /**
     * @brief X25519(private_key, peer_public_key) into guarded memory
     *
     * KeyAgreement when either side has the wrong size or libsodium reports
     * an all-zero output.
     */
    static Result<SecureMemoryHandle, ChannelFailure> ComputeX25519SharedSecret(
        const SecureMemoryHandle& private_key,
        std::span<const uint8_t> peer_public_key);

    static std::array<uint8_t, Constants::SHA_256_DIGEST_SIZE> Sha256(
        std::span<const uint8_t> data);

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    /// sodium_malloc, or nullptr when uninitialized or out of memory.
    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

    SodiumInterop() = delete;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;
};

}

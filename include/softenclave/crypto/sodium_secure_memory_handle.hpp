#pragma once

#include "softenclave/core/result.hpp"
#include "softenclave/core/failures.hpp"

#include <cstddef>
#include <span>
#include <type_traits>
#include <cstdint>
#include <vector>

namespace softenclave::channel::crypto {

/**
 * @brief RAII owner of a libsodium guarded allocation
 *
 * Memory comes from sodium_malloc: guard pages on both sides, locked in RAM,
 * zeroed by sodium_free. Move-only. Key material for the channel lives here
 * and is only touched through WithReadAccess / WithWriteAccess.
 */
class SecureMemoryHandle {
public:
    static Result<SecureMemoryHandle, SodiumFailure> Allocate(size_t size);

    ~SecureMemoryHandle();

    SecureMemoryHandle() noexcept : ptr_(nullptr), size_(0) {}

    SecureMemoryHandle(SecureMemoryHandle&& other) noexcept;
    SecureMemoryHandle& operator=(SecureMemoryHandle&& other) noexcept;

    SecureMemoryHandle(const SecureMemoryHandle&) = delete;
    SecureMemoryHandle& operator=(const SecureMemoryHandle&) = delete;

    /// Copies data in and zeroes whatever the data does not cover.
    Result<Unit, SodiumFailure> Write(std::span<const uint8_t> data);

    /// Copies the first count bytes out of guarded memory.
    Result<std::vector<uint8_t>, SodiumFailure> ReadBytes(size_t count) const;

    /**
     * @brief Run func over a read-only view of the protected bytes
     *
     * The view must not escape func.
     */
    template<typename F>
    auto WithReadAccess(F&& func) const -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<const uint8_t>>;
        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(Disposed());
        }
        return Result<T, SodiumFailure>::Ok(
            std::forward<F>(func)(std::span<const uint8_t>(static_cast<const uint8_t*>(ptr_), size_)));
    }

    template<typename F>
    auto WithWriteAccess(F&& func) -> Result<std::invoke_result_t<F, std::span<uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<uint8_t>>;
        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(Disposed());
        }
        return Result<T, SodiumFailure>::Ok(
            std::forward<F>(func)(std::span<uint8_t>(static_cast<uint8_t*>(ptr_), size_)));
    }

    /**
     * @brief Free the allocation now instead of at destruction
     */
    void Reset() noexcept;

    [[nodiscard]] bool IsInvalid() const noexcept {
        return ptr_ == nullptr;
    }

    [[nodiscard]] size_t Size() const noexcept {
        return size_;
    }

private:
    SecureMemoryHandle(void* ptr, size_t size) noexcept
        : ptr_(ptr), size_(size) {}

    static SodiumFailure Disposed();

    void* ptr_;
    size_t size_;
};

} // namespace softenclave::channel::crypto

#include "softenclave/crypto/sodium_secure_memory_handle.hpp"
#include "softenclave/crypto/sodium_interop.hpp"
#include "softenclave/core/constants.hpp"

#include <fmt/format.h>
#include <algorithm>
#include <utility>

namespace softenclave::channel::crypto {

Result<SecureMemoryHandle, SodiumFailure> SecureMemoryHandle::Allocate(const size_t size) {
    using AllocateResult = Result<SecureMemoryHandle, SodiumFailure>;
    if (!SodiumInterop::IsInitialized()) {
        return AllocateResult::Err(SodiumFailure::InitializationFailed(std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    if (size == 0) {
        return AllocateResult::Err(SodiumFailure::AllocationFailed("Guarded allocations must be non-empty"));
    }
    void* region = SodiumInterop::AllocateSecure(size);
    if (region == nullptr) {
        return AllocateResult::Err(SodiumFailure::AllocationFailed(
            fmt::format("{}{} bytes", ErrorMessages::FAILED_TO_ALLOCATE_SECURE_MEMORY, size)));
    }
    return AllocateResult::Ok(SecureMemoryHandle(region, size));
}

SecureMemoryHandle::~SecureMemoryHandle() {
    Reset();
}

SecureMemoryHandle::SecureMemoryHandle(SecureMemoryHandle&& other) noexcept
    : ptr_(std::exchange(other.ptr_, nullptr))
    , size_(std::exchange(other.size_, 0)) {
}

SecureMemoryHandle& SecureMemoryHandle::operator=(SecureMemoryHandle&& other) noexcept {
    if (this != &other) {
        Reset();
        ptr_ = std::exchange(other.ptr_, nullptr);
        size_ = std::exchange(other.size_, 0);
    }
    return *this;
}

void SecureMemoryHandle::Reset() noexcept {
    // sodium_free zeroes the region before releasing it.
    if (void* region = std::exchange(ptr_, nullptr); region != nullptr) {
        SodiumInterop::FreeSecure(region);
    }
    size_ = 0;
}

SodiumFailure SecureMemoryHandle::Disposed() {
    return SodiumFailure::InvalidOperation(std::string(ErrorMessages::HANDLE_DISPOSED));
}

Result<Unit, SodiumFailure> SecureMemoryHandle::Write(std::span<const uint8_t> data) {
    if (IsInvalid()) {
        return Result<Unit, SodiumFailure>::Err(Disposed());
    }
    if (data.size() > size_) {
        return Result<Unit, SodiumFailure>::Err(SodiumFailure::BufferTooSmall(
            fmt::format("{} ({} bytes into {})", ErrorMessages::DATA_EXCEEDS_BUFFER, data.size(), size_)));
    }
    auto* bytes = static_cast<uint8_t*>(ptr_);
    std::copy(data.begin(), data.end(), bytes);
    if (data.size() < size_) {
        sodium_memzero(bytes + data.size(), size_ - data.size());
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, SodiumFailure> SecureMemoryHandle::ReadBytes(const size_t count) const {
    if (IsInvalid()) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(Disposed());
    }
    if (count > size_) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(SodiumFailure::ReadOperationFailed(
            fmt::format("{}{} bytes requested from a {} byte region",
                ErrorMessages::FAILED_TO_READ_SECURE_MEMORY, count, size_)));
    }
    const auto* bytes = static_cast<const uint8_t*>(ptr_);
    return Result<std::vector<uint8_t>, SodiumFailure>::Ok(std::vector<uint8_t>(bytes, bytes + count));
}

} // namespace softenclave::channel::crypto

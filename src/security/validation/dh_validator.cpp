#include "softenclave/security/validation/dh_validator.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace softenclave::channel::security {

Result<Unit, ChannelFailure> DhValidator::ValidateX25519PublicKey(
    std::span<const uint8_t> public_key) {

    if (public_key.size() != Constants::X_25519_PUBLIC_KEY_SIZE) {
        return Result<Unit, ChannelFailure>::Err(
            ChannelFailure::InvalidInput(
                fmt::format(
                    "Invalid X25519 public key size: expected {}, got {}",
                    Constants::X_25519_PUBLIC_KEY_SIZE,
                    public_key.size())));
    }

    Point masked{};
    std::copy(public_key.begin(), public_key.end(), masked.begin());
    masked[Constants::X_25519_PUBLIC_KEY_SIZE - 1] &= 0x7F;

    if (HasSmallOrder(masked)) {
        return Result<Unit, ChannelFailure>::Err(
            ChannelFailure::InvalidInput("X25519 public key is a small-order point (invalid for DH)"));
    }

    if (!IsCanonicalFieldElement(masked)) {
        return Result<Unit, ChannelFailure>::Err(
            ChannelFailure::InvalidInput("X25519 public key is not a canonical Curve25519 field element"));
    }

    return Result<Unit, ChannelFailure>::Ok(unit);
}

bool DhValidator::HasSmallOrder(const Point& masked_key) {
    bool found = false;
    for (const auto& small_order_point : SMALL_ORDER_POINTS) {
        found |= ConstantTimeEquals(masked_key, small_order_point);
    }
    return found;
}

bool DhValidator::IsCanonicalFieldElement(const Point& masked_key) {
    // Compare from the most significant byte down.
    for (size_t i = Constants::CURVE_25519_FIELD_ELEMENT_SIZE; i-- > 0;) {
        if (masked_key[i] < CURVE_25519_PRIME[i]) {
            return true;
        }
        if (masked_key[i] > CURVE_25519_PRIME[i]) {
            return false;
        }
    }
    return false;
}

bool DhValidator::ConstantTimeEquals(const Point& a, const Point& b) {
    uint8_t diff = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        diff |= a[i] ^ b[i];
    }
    return diff == 0;
}

} // namespace softenclave::channel::security

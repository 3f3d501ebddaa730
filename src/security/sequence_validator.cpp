#include "softenclave/security/sequence_validator.hpp"
#include <fmt/format.h>

namespace softenclave::channel::security {
    SequenceValidator::SequenceValidator(const uint64_t window) noexcept
        : window_(window) {
    }

    Result<Unit, ChannelFailure> SequenceValidator::Check(const uint64_t sequence) const {
        if (sequence < kMinSequence) {
            return Result<Unit, ChannelFailure>::Err(
                ChannelFailure::SequenceViolation("Sequence 0 is never issued"));
        }
        if (sequence <= last_accepted_) {
            return Result<Unit, ChannelFailure>::Err(
                ChannelFailure::SequenceViolation(
                    fmt::format("Sequence {} not after last accepted {}", sequence, last_accepted_)));
        }
        const uint64_t distance = sequence - last_accepted_;
        const uint64_t allowed = window_ == kStrictSequenceWindow ? 1 : window_;
        if (distance > allowed) {
            return Result<Unit, ChannelFailure>::Err(
                ChannelFailure::SequenceViolation(
                    fmt::format("Sequence {} is {} ahead of last accepted {} (allowed {})",
                        sequence, distance, last_accepted_, allowed)));
        }
        return Result<Unit, ChannelFailure>::Ok(unit);
    }

    void SequenceValidator::Accept(const uint64_t sequence) noexcept {
        if (sequence > last_accepted_) {
            last_accepted_ = sequence;
        }
    }
}

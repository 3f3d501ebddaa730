#pragma once
#include "softenclave/core/failures.hpp"
#include "softenclave/core/result.hpp"
#include "softenclave/protocol/constants.hpp"
#include <cstdint>
namespace softenclave::channel::security {
/// Inbound ordering policy.
///
/// Strict (window 0): only last + 1 is accepted.
/// Windowed (window w > 0): any sequence in (last, last + w] is accepted; skipped
/// sequences can never be accepted afterwards.
class SequenceValidator {
public:
    explicit SequenceValidator(uint64_t window = kStrictSequenceWindow) noexcept;
    [[nodiscard]] Result<Unit, ChannelFailure> Check(uint64_t sequence) const;
    void Accept(uint64_t sequence) noexcept;
    [[nodiscard]] uint64_t LastAccepted() const noexcept { return last_accepted_; }
    [[nodiscard]] uint64_t Window() const noexcept { return window_; }
private:
    uint64_t window_;
    uint64_t last_accepted_ = 0;
};
}

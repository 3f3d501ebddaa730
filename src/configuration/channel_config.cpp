#include "softenclave/configuration/channel_config.hpp"
#include <fmt/format.h>

namespace softenclave::channel::configuration {

Result<Unit, ChannelFailure> ChannelConfig::Validate() const {
    if (replay_cache_capacity_ == 0) {
        return Result<Unit, ChannelFailure>::Err(
            ChannelFailure::InvalidInput("Replay cache capacity must be positive"));
    }
    if (max_plaintext_bytes_ == 0 || max_ciphertext_bytes_ == 0) {
        return Result<Unit, ChannelFailure>::Err(
            ChannelFailure::InvalidInput("Message size limits must be positive"));
    }
    if (max_outbound_sequence_ < kMinSequence || max_outbound_sequence_ > kMaxSequence) {
        return Result<Unit, ChannelFailure>::Err(
            ChannelFailure::InvalidInput(
                fmt::format("Outbound sequence ceiling must lie in [{}, {}], got {}",
                    kMinSequence, kMaxSequence, max_outbound_sequence_)));
    }
    if (renegotiation_threshold_ > max_outbound_sequence_) {
        return Result<Unit, ChannelFailure>::Err(
            ChannelFailure::InvalidInput(
                fmt::format("Renegotiation threshold {} exceeds sequence ceiling {}",
                    renegotiation_threshold_, max_outbound_sequence_)));
    }
    return Result<Unit, ChannelFailure>::Ok(unit);
}

} // namespace softenclave::channel::configuration

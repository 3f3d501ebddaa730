#include "softenclave/metrics/channel_metrics.hpp"
namespace softenclave::channel::metrics {
void ChannelMetrics::RecordOperation(const std::chrono::microseconds key_exposure) noexcept {
    operations_.fetch_add(1, std::memory_order_relaxed);
    total_key_exposure_us_.fetch_add(key_exposure.count(), std::memory_order_relaxed);
}
MetricsSnapshot ChannelMetrics::Snapshot(const std::chrono::steady_clock::duration key_material_held) const noexcept {
    MetricsSnapshot snapshot;
    snapshot.sealed = sealed_.load(std::memory_order_relaxed);
    snapshot.opened = opened_.load(std::memory_order_relaxed);
    snapshot.replay_rejections = replay_rejections_.load(std::memory_order_relaxed);
    snapshot.sequence_violations = sequence_violations_.load(std::memory_order_relaxed);
    snapshot.authentication_failures = authentication_failures_.load(std::memory_order_relaxed);
    snapshot.oversized_messages = oversized_messages_.load(std::memory_order_relaxed);
    snapshot.operations = operations_.load(std::memory_order_relaxed);
    snapshot.total_key_exposure = std::chrono::microseconds(
        total_key_exposure_us_.load(std::memory_order_relaxed));
    snapshot.key_material_held =
        std::chrono::duration_cast<std::chrono::microseconds>(key_material_held);
    return snapshot;
}
}

#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
namespace softenclave::channel::metrics {
struct MetricsSnapshot {
    uint64_t sealed = 0;
    uint64_t opened = 0;
    uint64_t replay_rejections = 0;
    uint64_t sequence_violations = 0;
    uint64_t authentication_failures = 0;
    uint64_t oversized_messages = 0;
    uint64_t operations = 0;
    std::chrono::microseconds total_key_exposure{0};
    std::chrono::microseconds key_material_held{0};
};
/// Lock-free counters for one channel. Readers get a consistent-enough snapshot;
/// individual counters are exact, cross-counter ordering is not guaranteed.
class ChannelMetrics {
public:
    ChannelMetrics() = default;
    ChannelMetrics(const ChannelMetrics&) = delete;
    ChannelMetrics& operator=(const ChannelMetrics&) = delete;

    void RecordSealed() noexcept { sealed_.fetch_add(1, std::memory_order_relaxed); }
    void RecordOpened() noexcept { opened_.fetch_add(1, std::memory_order_relaxed); }
    void RecordReplayRejected() noexcept { replay_rejections_.fetch_add(1, std::memory_order_relaxed); }
    void RecordSequenceViolation() noexcept { sequence_violations_.fetch_add(1, std::memory_order_relaxed); }
    void RecordAuthenticationFailure() noexcept {
        authentication_failures_.fetch_add(1, std::memory_order_relaxed);
    }
    void RecordOversizedMessage() noexcept { oversized_messages_.fetch_add(1, std::memory_order_relaxed); }

    /// One request served; key_exposure is how long decrypted secrets were live for it.
    void RecordOperation(std::chrono::microseconds key_exposure) noexcept;

    [[nodiscard]] MetricsSnapshot Snapshot(std::chrono::steady_clock::duration key_material_held) const noexcept;

private:
    std::atomic<uint64_t> sealed_{0};
    std::atomic<uint64_t> opened_{0};
    std::atomic<uint64_t> replay_rejections_{0};
    std::atomic<uint64_t> sequence_violations_{0};
    std::atomic<uint64_t> authentication_failures_{0};
    std::atomic<uint64_t> oversized_messages_{0};
    std::atomic<uint64_t> operations_{0};
    std::atomic<int64_t> total_key_exposure_us_{0};
};
}

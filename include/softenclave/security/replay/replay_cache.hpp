#pragma once
#include "softenclave/protocol/constants.hpp"
#include "softenclave/protocol/nonce.hpp"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <unordered_set>
namespace softenclave::channel::security {
/// Bounded set of nonces already accepted on one channel.
///
/// Oldest entry is evicted first once capacity is reached. Not internally
/// synchronized: the owning Channel serializes access.
class ReplayCache {
public:
    explicit ReplayCache(size_t capacity = kDefaultReplayCacheCapacity);
    ReplayCache(const ReplayCache&) = delete;
    ReplayCache& operator=(const ReplayCache&) = delete;
    ReplayCache(ReplayCache&&) = default;
    ReplayCache& operator=(ReplayCache&&) = default;
    ~ReplayCache() = default;
    [[nodiscard]] bool Contains(const Nonce& nonce) const;
    /// Returns false when the nonce was already present.
    bool Record(const Nonce& nonce);
    [[nodiscard]] size_t Size() const noexcept { return order_.size(); }
    [[nodiscard]] size_t Capacity() const noexcept { return capacity_; }
    void Clear() noexcept;
private:
    struct NonceHash {
        size_t operator()(const Nonce& nonce) const noexcept;
    };
    size_t capacity_;
    std::deque<Nonce> order_;
    std::unordered_set<Nonce, NonceHash> seen_;
};
}

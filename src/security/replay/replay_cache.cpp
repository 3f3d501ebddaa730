#include "softenclave/security/replay/replay_cache.hpp"
#include <algorithm>

namespace softenclave::channel::security {
    namespace {
        constexpr size_t kFnvOffsetBasis = 0xcbf29ce484222325ull;
        constexpr size_t kFnvPrime = 0x100000001b3ull;
    }

    size_t ReplayCache::NonceHash::operator()(const Nonce& nonce) const noexcept {
        size_t hash = kFnvOffsetBasis;
        for (const uint8_t byte : nonce) {
            hash ^= static_cast<size_t>(byte);
            hash *= kFnvPrime;
        }
        return hash;
    }

    ReplayCache::ReplayCache(const size_t capacity)
        : capacity_(std::max<size_t>(capacity, 1)) {
        seen_.reserve(capacity_);
    }

    bool ReplayCache::Contains(const Nonce& nonce) const {
        return seen_.contains(nonce);
    }

    bool ReplayCache::Record(const Nonce& nonce) {
        if (seen_.contains(nonce)) {
            return false;
        }
        while (order_.size() >= capacity_) {
            seen_.erase(order_.front());
            order_.pop_front();
        }
        order_.push_back(nonce);
        seen_.insert(nonce);
        return true;
    }

    void ReplayCache::Clear() noexcept {
        order_.clear();
        seen_.clear();
    }
}

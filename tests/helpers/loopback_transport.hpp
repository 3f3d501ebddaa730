#pragma once

#include "softenclave/interfaces/i_transport.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <span>
#include <vector>

namespace softenclave::channel::test_helpers {

using interfaces::ITransport;
using interfaces::ITransportSubscription;

/// One end of an in-memory link. Send delivers synchronously to the peer's
/// subscribers on the calling thread and keeps a copy of every frame for replay.
class LoopbackEndpoint : public ITransport {
public:
    LoopbackEndpoint() : subscribers_(std::make_shared<Subscribers>()) {}

    void ConnectTo(LoopbackEndpoint& peer) noexcept { peer_ = &peer; }

    Result<Unit, ChannelFailure> Send(std::span<const uint8_t> frame) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (fail_sends_) {
                return Result<Unit, ChannelFailure>::Err(ChannelFailure::Transport("Link is down"));
            }
            sent_.emplace_back(frame.begin(), frame.end());
            if (dropping_ || peer_ == nullptr) {
                return Result<Unit, ChannelFailure>::Ok(unit);
            }
        }
        peer_->Deliver(frame);
        return Result<Unit, ChannelFailure>::Ok(unit);
    }

    [[nodiscard]] std::unique_ptr<ITransportSubscription> Subscribe(FrameHandler handler) override {
        std::lock_guard<std::mutex> lock(subscribers_->mutex);
        const uint64_t id = subscribers_->next_id++;
        subscribers_->handlers.emplace(id, std::move(handler));
        return std::make_unique<Subscription>(subscribers_, id);
    }

    /// Hands raw bytes to this endpoint's subscribers as if the peer had sent them.
    void Deliver(std::span<const uint8_t> frame) {
        std::vector<FrameHandler> handlers;
        {
            std::lock_guard<std::mutex> lock(subscribers_->mutex);
            for (const auto& [id, handler] : subscribers_->handlers) {
                handlers.push_back(handler);
            }
        }
        const std::vector<uint8_t> copy(frame.begin(), frame.end());
        for (const auto& handler : handlers) {
            handler(copy);
        }
    }

    [[nodiscard]] std::vector<std::vector<uint8_t>> SentFrames() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    void SetDropping(const bool dropping) {
        std::lock_guard<std::mutex> lock(mutex_);
        dropping_ = dropping;
    }

    void SetFailSends(const bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_sends_ = fail;
    }

    [[nodiscard]] size_t SubscriberCount() const {
        std::lock_guard<std::mutex> lock(subscribers_->mutex);
        return subscribers_->handlers.size();
    }

private:
    struct Subscribers {
        std::mutex mutex;
        uint64_t next_id = 0;
        std::map<uint64_t, FrameHandler> handlers;
    };

    class Subscription : public ITransportSubscription {
    public:
        Subscription(std::weak_ptr<Subscribers> subscribers, const uint64_t id)
            : subscribers_(std::move(subscribers)), id_(id) {}

        ~Subscription() override {
            if (auto subscribers = subscribers_.lock()) {
                std::lock_guard<std::mutex> lock(subscribers->mutex);
                subscribers->handlers.erase(id_);
            }
        }

    private:
        std::weak_ptr<Subscribers> subscribers_;
        uint64_t id_;
    };

    mutable std::mutex mutex_;
    LoopbackEndpoint* peer_ = nullptr;
    bool dropping_ = false;
    bool fail_sends_ = false;
    std::vector<std::vector<uint8_t>> sent_;
    std::shared_ptr<Subscribers> subscribers_;
};

struct LoopbackTransportPair {
    LoopbackEndpoint host;
    LoopbackEndpoint enclave;

    LoopbackTransportPair() {
        host.ConnectTo(enclave);
        enclave.ConnectTo(host);
    }

    LoopbackTransportPair(const LoopbackTransportPair&) = delete;
    LoopbackTransportPair& operator=(const LoopbackTransportPair&) = delete;
};

}

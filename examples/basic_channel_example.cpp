/**
 * @file basic_channel_example.cpp
 * @brief Establishes a host/enclave channel in one process and sends a few requests
 */

#include "softenclave/crypto/sodium_interop.hpp"
#include "softenclave/interfaces/i_request_handler.hpp"
#include "softenclave/interfaces/i_transport.hpp"
#include "softenclave/protocol/handshake.hpp"
#include "softenclave/protocol/request_client.hpp"
#include "softenclave/protocol/request_dispatcher.hpp"

#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <thread>

using namespace softenclave::channel;
using namespace softenclave::channel::configuration;
using namespace softenclave::channel::interfaces;

namespace {

/// Half of an in-process link; frames are delivered synchronously to the other half.
class InProcessLink : public ITransport {
public:
    void Connect(InProcessLink& peer) { peer_ = &peer; }

    Result<Unit, ChannelFailure> Send(std::span<const uint8_t> frame) override {
        if (peer_ == nullptr) {
            return Result<Unit, ChannelFailure>::Err(ChannelFailure::Transport("Link is not connected"));
        }
        peer_->Deliver(frame);
        return Result<Unit, ChannelFailure>::Ok(unit);
    }

    std::unique_ptr<ITransportSubscription> Subscribe(FrameHandler handler) override {
        std::lock_guard<std::mutex> lock(mutex_);
        const uint64_t id = next_id_++;
        handlers_.emplace(id, std::move(handler));
        return std::make_unique<Subscription>(*this, id);
    }

private:
    class Subscription : public ITransportSubscription {
    public:
        Subscription(InProcessLink& link, const uint64_t id) : link_(link), id_(id) {}
        ~Subscription() override {
            std::lock_guard<std::mutex> lock(link_.mutex_);
            link_.handlers_.erase(id_);
        }

    private:
        InProcessLink& link_;
        uint64_t id_;
    };

    void Deliver(std::span<const uint8_t> frame) {
        std::vector<FrameHandler> handlers;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& [id, handler] : handlers_) {
                handlers.push_back(handler);
            }
        }
        for (const auto& handler : handlers) {
            handler(frame);
        }
    }

    InProcessLink* peer_ = nullptr;
    std::mutex mutex_;
    uint64_t next_id_ = 0;
    std::map<uint64_t, FrameHandler> handlers_;
};

/// Stand-in execution engine: reports the code it was given.
class EchoEngine : public IRequestHandler {
public:
    Result<ExecuteResult, ChannelFailure> Execute(const ExecuteRequest& request) override {
        ExecuteResult result;
        result.result_json = "{\"executed\":\"" + request.code + "\"}";
        return Result<ExecuteResult, ChannelFailure>::Ok(std::move(result));
    }

    Result<SignResult, ChannelFailure> SignTransaction(
        std::span<const uint8_t> key_material,
        std::span<const uint8_t> transaction) override {
        SignResult result;
        result.signature.resize(transaction.size());
        for (size_t i = 0; i < transaction.size(); ++i) {
            result.signature[i] = static_cast<uint8_t>(transaction[i] ^ key_material[i % key_material.size()]);
        }
        return Result<SignResult, ChannelFailure>::Ok(std::move(result));
    }
};

void print_hex(const std::string& label, const std::vector<uint8_t>& data) {
    std::cout << label << ": ";
    for (auto byte : data) {
        std::cout << std::hex << std::setw(2) << std::setfill('0')
                  << static_cast<int>(byte);
    }
    std::cout << std::dec << std::endl;
}

}

int main() {
    std::cout << "=== Soft Enclave Channel - Basic Example ===" << std::endl;
    std::cout << std::endl;

    std::cout << "1. Initializing libsodium..." << std::endl;
    if (auto init_result = crypto::SodiumInterop::Initialize(); init_result.IsErr()) {
        std::cerr << "Failed to initialize: " << init_result.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "   ✓ Initialized successfully" << std::endl << std::endl;

    InProcessLink host_link;
    InProcessLink enclave_link;
    host_link.Connect(enclave_link);
    enclave_link.Connect(host_link);

    std::cout << "2. Running the X25519 handshake..." << std::endl;
    HandshakeOrchestrator host_handshake(HandshakeConfig::ForHost("host-1", "echo-engine-v1"), host_link);
    HandshakeOrchestrator enclave_handshake(HandshakeConfig::ForEnclave("enclave-1", "echo-engine-v1"), enclave_link);

    std::optional<Result<std::unique_ptr<Channel>, ChannelFailure>> enclave_result;
    std::thread enclave_thread([&] { enclave_result.emplace(enclave_handshake.Run(std::chrono::seconds(5))); });
    auto host_result = host_handshake.Run(std::chrono::seconds(5));
    enclave_thread.join();

    if (host_result.IsErr() || !enclave_result.has_value() || enclave_result->IsErr()) {
        std::cerr << "Handshake failed: "
                  << (host_result.IsErr() ? host_result.UnwrapErr().message : enclave_result->UnwrapErr().message)
                  << std::endl;
        return 1;
    }
    auto host_channel = std::move(host_result).Unwrap();
    auto enclave_channel = std::move(*enclave_result).Unwrap();
    print_hex("   Host public key", host_handshake.LocalPublicKey());
    print_hex("   Enclave public key", enclave_handshake.LocalPublicKey());
    std::cout << "   ✓ Both sides Ready" << std::endl << std::endl;

    EchoEngine engine;
    RequestDispatcher dispatcher(*enclave_channel, engine, enclave_link);
    auto listening = dispatcher.Listen();
    RequestClient client(*host_channel, host_link);

    std::cout << "3. PING..." << std::endl;
    auto pong = client.Call(PingRequest{0x5EC0DE});
    if (pong.IsErr() || !std::holds_alternative<PongResponse>(pong.Unwrap())) {
        std::cerr << "Ping failed" << std::endl;
        return 1;
    }
    std::cout << "   ✓ PONG nonce " << std::hex << std::get<PongResponse>(pong.Unwrap()).nonce
              << std::dec << std::endl << std::endl;

    std::cout << "4. EXECUTE..." << std::endl;
    auto executed = client.Call(ExecuteRequest{.code = "return 40 + 2", .context_json = "{}"});
    if (executed.IsErr() || !std::holds_alternative<ExecuteResult>(executed.Unwrap())) {
        std::cerr << "Execute failed" << std::endl;
        return 1;
    }
    std::cout << "   ✓ Result " << std::get<ExecuteResult>(executed.Unwrap()).result_json << std::endl << std::endl;

    std::cout << "5. SIGN_TRANSACTION (key and data in separate envelopes)..." << std::endl;
    auto signed_tx = client.Call(SignTransactionRequest{
        .key_material = {0x13, 0x37, 0x13, 0x37},
        .transaction = {0xDE, 0xAD, 0xBE, 0xEF}
    });
    if (signed_tx.IsErr() || !std::holds_alternative<SignResult>(signed_tx.Unwrap())) {
        std::cerr << "Signing failed" << std::endl;
        return 1;
    }
    const auto& sign_result = std::get<SignResult>(signed_tx.Unwrap());
    print_hex("   Signature", sign_result.signature);
    std::cout << "   Key wiped after use: " << (sign_result.metrics.memory_zeroed ? "yes" : "no") << std::endl;
    std::cout << "   Key exposure: " << sign_result.metrics.key_exposure.count() << " us" << std::endl << std::endl;

    std::cout << "6. Enclave metrics" << std::endl;
    const auto metrics = enclave_channel->Metrics();
    std::cout << "   Sealed: " << metrics.sealed << ", opened: " << metrics.opened
              << ", operations: " << metrics.operations << std::endl;
    std::cout << "   Replays rejected: " << metrics.replay_rejections
              << ", authentication failures: " << metrics.authentication_failures << std::endl;

    host_channel->Close();
    enclave_channel->Close();
    std::cout << std::endl << "=== Example completed successfully ===" << std::endl;
    return 0;
}

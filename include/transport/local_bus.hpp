#ifndef BLOBDVM_TRANSPORT_LOCAL_BUS_HPP
#define BLOBDVM_TRANSPORT_LOCAL_BUS_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <thread>
#include "transport/subscription_registry.hpp"
#include "transport/transport.hpp"
#include "utils/channel.hpp"

namespace blobdvm {
namespace transport {

// In-process transport: publish() enqueues, a dispatch thread delivers
class LocalBus : public Transport {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    LocalBus();
    ~LocalBus() override;

    LocalBus(const LocalBus&) = delete;
    LocalBus& operator=(const LocalBus&) = delete;


    // ---- TRANSPORT INTERFACE ----
    void publish(const protocol::Envelope& envelope) override;
    SubscriptionId subscribe(const protocol::Filter& filter, Handler handler) override;
    void unsubscribe(SubscriptionId id) override;


    // ---- LIFECYCLE ----
    // Delivers what is already queued, then joins the dispatch thread
    void shutdown();

    // Envelopes accepted by publish() so far
    uint64_t published_count() const { return published_count_; }

private:
    struct Delivery {
        std::optional<SubscriptionId> target;
        protocol::Envelope envelope;
    };

    // ---- PARAMETERS ----
    SubscriptionRegistry registry_;
    utils::Channel<Delivery> queue_;
    std::unique_ptr<std::thread> dispatch_thread_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> published_count_{0};

    static constexpr std::chrono::milliseconds POLL_INTERVAL{100};

    // ---- DISPATCH ----
    void dispatch_loop();
};

} // namespace transport
} // namespace blobdvm

#endif // BLOBDVM_TRANSPORT_LOCAL_BUS_HPP

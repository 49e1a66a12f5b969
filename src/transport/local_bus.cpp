#include "transport/local_bus.hpp"
#include <boost/log/trivial.hpp>

namespace blobdvm {
namespace transport {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

LocalBus::LocalBus() {
    running_ = true;
    dispatch_thread_ = std::make_unique<std::thread>(&LocalBus::dispatch_loop, this);
    BOOST_LOG_TRIVIAL(info) << "Local bus: Started";
}

LocalBus::~LocalBus() {
    shutdown();
}

void LocalBus::shutdown() {
    if (!running_.exchange(false)) {
        return;
    }

    queue_.close();
    if (dispatch_thread_ && dispatch_thread_->joinable()) {
        dispatch_thread_->join();
    }
    BOOST_LOG_TRIVIAL(info) << "Local bus: Shut down";
}


//==============================================
// TRANSPORT INTERFACE
//==============================================

void LocalBus::publish(const protocol::Envelope& envelope) {
    if (!running_) {
        throw TransportError("Local bus is shut down");
    }

    registry_.retain(envelope);
    if (!queue_.produce(Delivery{std::nullopt, envelope})) {
        throw TransportError("Local bus is shut down");
    }
    ++published_count_;
    BOOST_LOG_TRIVIAL(debug) << "Local bus: Published " << protocol::to_string(envelope.kind)
                             << " " << envelope.id;
}

LocalBus::SubscriptionId LocalBus::subscribe(const protocol::Filter& filter, Handler handler) {
    SubscriptionId id = registry_.add(filter, std::move(handler));

    // Bring the new subscriber up to date with known servers
    for (auto& envelope : registry_.retained_matching(filter)) {
        if (!queue_.produce(Delivery{id, std::move(envelope)})) {
            BOOST_LOG_TRIVIAL(debug) << "Local bus: Skipping replay, bus is shut down";
            break;
        }
    }
    return id;
}

void LocalBus::unsubscribe(SubscriptionId id) {
    registry_.remove(id);
}


//==============================================
// DISPATCH
//==============================================

void LocalBus::dispatch_loop() {
    BOOST_LOG_TRIVIAL(debug) << "Local bus: Dispatch thread running";

    Delivery delivery;
    while (running_ || !queue_.empty()) {
        if (!queue_.consume_for(delivery, POLL_INTERVAL)) {
            if (queue_.closed()) {
                break;
            }
            continue;
        }

        if (delivery.target) {
            registry_.dispatch_to(*delivery.target, delivery.envelope);
        } else {
            registry_.dispatch(delivery.envelope);
        }
    }

    BOOST_LOG_TRIVIAL(debug) << "Local bus: Dispatch thread stopped";
}

} // namespace transport
} // namespace blobdvm

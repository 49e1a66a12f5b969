#ifndef BLOBDVM_TRANSPORT_SUBSCRIPTION_REGISTRY_HPP
#define BLOBDVM_TRANSPORT_SUBSCRIPTION_REGISTRY_HPP

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "transport/transport.hpp"

namespace blobdvm {
namespace transport {

// Subscription table shared by the transport implementations.
// Also retains the latest announcement per author so late subscribers
// can be brought up to date.
class SubscriptionRegistry {
public:
    using Handler = Transport::Handler;
    using SubscriptionId = Transport::SubscriptionId;

    // ---- SUBSCRIPTIONS ----
    SubscriptionId add(const protocol::Filter& filter, Handler handler);
    // Once this returns the handler is not running and will not run again,
    // unless called from inside a handler on the dispatching thread
    void remove(SubscriptionId id);
    std::size_t size() const;


    // ---- DISPATCH ----
    // Calls every matching handler outside the table lock, returns the number called
    std::size_t dispatch(const protocol::Envelope& envelope);
    // Calls a single subscription if it still exists and matches
    bool dispatch_to(SubscriptionId id, const protocol::Envelope& envelope);


    // ---- ANNOUNCEMENT RETENTION ----
    // Keeps the envelope if it is an announcement, newest per author wins
    void retain(const protocol::Envelope& envelope);
    // Retained announcements accepted by filter
    std::vector<protocol::Envelope> retained_matching(const protocol::Filter& filter) const;

private:
    struct Entry {
        protocol::Filter filter;
        std::shared_ptr<Handler> handler;
    };

    // ---- PARAMETERS ----
    mutable std::mutex mutex_;
    std::map<SubscriptionId, Entry> entries_;
    std::map<std::string, protocol::Envelope> announcements_;
    SubscriptionId next_id_{1};

    // Held while handlers run so remove() can wait for them; recursive so
    // a handler may unsubscribe itself
    std::recursive_mutex callback_mutex_;

    void invoke(const std::vector<std::shared_ptr<Handler>>& handlers,
                const protocol::Envelope& envelope);
};

} // namespace transport
} // namespace blobdvm

#endif // BLOBDVM_TRANSPORT_SUBSCRIPTION_REGISTRY_HPP

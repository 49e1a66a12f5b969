#ifndef BLOBDVM_TRANSPORT_HPP
#define BLOBDVM_TRANSPORT_HPP

#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include "protocol/envelope.hpp"

namespace blobdvm {
namespace transport {

class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& message)
        : std::runtime_error("Transport error: " + message) {}
};

// Asynchronous publish/subscribe message transport.
// Delivery is at-least-once and unordered; handlers run on a transport thread.
class Transport {
public:
    using Handler = std::function<void(const protocol::Envelope&)>;
    using SubscriptionId = uint64_t;

    virtual ~Transport() = default;

    // Publishes an envelope to every matching subscription
    virtual void publish(const protocol::Envelope& envelope) = 0;
    // Registers a handler for envelopes accepted by filter
    virtual SubscriptionId subscribe(const protocol::Filter& filter, Handler handler) = 0;
    // Removes a subscription; unknown ids are ignored
    virtual void unsubscribe(SubscriptionId id) = 0;
};

} // namespace transport
} // namespace blobdvm

#endif // BLOBDVM_TRANSPORT_HPP

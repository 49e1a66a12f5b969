#include "client/correlator.hpp"
#include <boost/log/trivial.hpp>

namespace blobdvm {
namespace client {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Correlator::Correlator(transport::Transport& transport)
    : transport_(transport) {
    protocol::Filter filter;
    filter.kinds = {protocol::MessageKind::RESPONSE};
    subscription_ = transport_.subscribe(filter, [this](const protocol::Envelope& envelope) {
        on_response(envelope);
    });
    BOOST_LOG_TRIVIAL(debug) << "Correlator: Subscribed to responses";
}

Correlator::~Correlator() {
    transport_.unsubscribe(subscription_);
}


//==============================================
// REQUEST / RESPONSE
//==============================================

protocol::Envelope Correlator::send(const protocol::Envelope& request, std::chrono::milliseconds timeout) {
    auto slot = std::make_shared<PendingRequest>();
    slot->issued_at = std::chrono::steady_clock::now();
    slot->deadline = slot->issued_at + timeout;
    std::future<protocol::Envelope> result = slot->result.get_future();

    // Register before publishing so an immediate reply cannot be missed
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!pending_.emplace(request.id, slot).second) {
            throw ClientError("Request " + request.id + " is already pending");
        }
    }

    try {
        transport_.publish(request);
    } catch (const std::exception& e) {
        release(request.id);
        BOOST_LOG_TRIVIAL(error) << "Correlator: Publishing request " << request.id << " failed: " << e.what();
        throw;
    }
    BOOST_LOG_TRIVIAL(debug) << "Correlator: Waiting up to " << timeout.count()
                             << " ms for response to " << request.id;

    if (result.wait_until(slot->deadline) != std::future_status::ready) {
        release(request.id);
        // A reply may have landed between the deadline and the release
        if (result.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            return result.get();
        }
        BOOST_LOG_TRIVIAL(warning) << "Correlator: No response to " << request.id
                                   << " after " << timeout.count() << " ms";
        throw TimeoutError("no response to request " + request.id + " within " +
                           std::to_string(timeout.count()) + " ms");
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - slot->issued_at);
    BOOST_LOG_TRIVIAL(debug) << "Correlator: Response to " << request.id << " after " << elapsed.count() << " ms";
    return result.get();
}


//==============================================
// RESPONSE HANDLING
//==============================================

void Correlator::on_response(const protocol::Envelope& envelope) {
    auto reference = envelope.tag(protocol::TAG_REQUEST_REF);
    if (!reference) {
        BOOST_LOG_TRIVIAL(debug) << "Correlator: Ignoring response " << envelope.id << " without reference";
        return;
    }

    std::shared_ptr<PendingRequest> slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(*reference);
        if (it == pending_.end()) {
            BOOST_LOG_TRIVIAL(trace) << "Correlator: Dropping response for unknown or settled request " << *reference;
            return;
        }
        slot = std::move(it->second);
        pending_.erase(it);
    }

    slot->result.set_value(envelope);
}

void Correlator::release(const std::string& request_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.erase(request_id);
}


//==============================================
// QUERY METHODS
//==============================================

std::size_t Correlator::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

} // namespace client
} // namespace blobdvm

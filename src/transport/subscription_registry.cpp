#include "transport/subscription_registry.hpp"
#include <boost/log/trivial.hpp>

namespace blobdvm {
namespace transport {

//==============================================
// SUBSCRIPTIONS
//==============================================

SubscriptionRegistry::SubscriptionId SubscriptionRegistry::add(const protocol::Filter& filter, Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    entries_.emplace(id, Entry{filter, std::make_shared<Handler>(std::move(handler))});
    BOOST_LOG_TRIVIAL(debug) << "Subscriptions: Added subscription " << id;
    return id;
}

void SubscriptionRegistry::remove(SubscriptionId id) {
    std::lock_guard<std::recursive_mutex> callback_lock(callback_mutex_);
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.erase(id) > 0) {
        BOOST_LOG_TRIVIAL(debug) << "Subscriptions: Removed subscription " << id;
    }
}

std::size_t SubscriptionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}


//==============================================
// DISPATCH
//==============================================

std::size_t SubscriptionRegistry::dispatch(const protocol::Envelope& envelope) {
    std::lock_guard<std::recursive_mutex> callback_lock(callback_mutex_);
    std::vector<std::shared_ptr<Handler>> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, entry] : entries_) {
            if (entry.filter.matches(envelope)) {
                handlers.push_back(entry.handler);
            }
        }
    }

    BOOST_LOG_TRIVIAL(trace) << "Subscriptions: Dispatching " << protocol::to_string(envelope.kind)
                             << " " << envelope.id << " to " << handlers.size() << " handler(s)";
    invoke(handlers, envelope);
    return handlers.size();
}

bool SubscriptionRegistry::dispatch_to(SubscriptionId id, const protocol::Envelope& envelope) {
    std::lock_guard<std::recursive_mutex> callback_lock(callback_mutex_);
    std::vector<std::shared_ptr<Handler>> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end() || !it->second.filter.matches(envelope)) {
            return false;
        }
        handlers.push_back(it->second.handler);
    }
    invoke(handlers, envelope);
    return true;
}

void SubscriptionRegistry::invoke(const std::vector<std::shared_ptr<Handler>>& handlers,
                                  const protocol::Envelope& envelope) {
    for (const auto& handler : handlers) {
        try {
            (*handler)(envelope);
        } catch (const std::exception& e) {
            BOOST_LOG_TRIVIAL(error) << "Subscriptions: Handler failed for "
                                     << protocol::to_string(envelope.kind) << " " << envelope.id
                                     << ": " << e.what();
        }
    }
}


//==============================================
// ANNOUNCEMENT RETENTION
//==============================================

void SubscriptionRegistry::retain(const protocol::Envelope& envelope) {
    if (envelope.kind != protocol::MessageKind::ANNOUNCEMENT) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = announcements_.find(envelope.author);
    if (it == announcements_.end() || it->second.created_at <= envelope.created_at) {
        announcements_[envelope.author] = envelope;
        BOOST_LOG_TRIVIAL(debug) << "Subscriptions: Retained announcement from " << envelope.author;
    }
}

std::vector<protocol::Envelope> SubscriptionRegistry::retained_matching(const protocol::Filter& filter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<protocol::Envelope> result;
    for (const auto& [author, envelope] : announcements_) {
        if (filter.matches(envelope)) {
            result.push_back(envelope);
        }
    }
    return result;
}

} // namespace transport
} // namespace blobdvm

#ifndef BLOBDVM_CLIENT_CORRELATOR_HPP
#define BLOBDVM_CLIENT_CORRELATOR_HPP

#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include "client/client_error.hpp"
#include "protocol/envelope.hpp"
#include "transport/transport.hpp"

namespace blobdvm {
namespace client {

// Pairs asynchronous response envelopes with the request that caused them.
// Each in-flight request owns a promise keyed by its id; the first response
// referencing that id fulfils it and later duplicates are dropped.
class Correlator {
public:
    static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{30000};

    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    explicit Correlator(transport::Transport& transport);
    ~Correlator();

    Correlator(const Correlator&) = delete;
    Correlator& operator=(const Correlator&) = delete;


    // ---- REQUEST / RESPONSE ----
    // Publishes request and blocks the calling thread until a response
    // referencing request.id arrives. Throws TimeoutError on expiry.
    protocol::Envelope send(const protocol::Envelope& request,
                            std::chrono::milliseconds timeout = DEFAULT_TIMEOUT);


    // ---- QUERY METHODS ----
    std::size_t pending_count() const;

private:
    struct PendingRequest {
        std::chrono::steady_clock::time_point issued_at;
        std::chrono::steady_clock::time_point deadline;
        std::promise<protocol::Envelope> result;
    };

    // ---- PARAMETERS ----
    transport::Transport& transport_;
    transport::Transport::SubscriptionId subscription_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<PendingRequest>> pending_;


    // ---- RESPONSE HANDLING ----
    void on_response(const protocol::Envelope& envelope);
    void release(const std::string& request_id);
};

} // namespace client
} // namespace blobdvm

#endif // BLOBDVM_CLIENT_CORRELATOR_HPP

#ifndef BLOBDVM_TRANSPORT_RELAY_TRANSPORT_HPP
#define BLOBDVM_TRANSPORT_RELAY_TRANSPORT_HPP

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <boost/asio.hpp>
#include "transport/frame_io.hpp"
#include "transport/subscription_registry.hpp"
#include "transport/transport.hpp"

namespace blobdvm {
namespace transport {

// Transport backed by a RelayServer connection. Every frame the relay
// forwards is decoded and dispatched to matching local subscriptions.
class RelayTransport : public Transport {
public:
    // Delete copy operations to prevent socket duplication
    RelayTransport(const RelayTransport&) = delete;
    RelayTransport& operator=(const RelayTransport&) = delete;


    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    RelayTransport(const std::string& host, uint16_t port);
    ~RelayTransport() override;


    // ---- CONNECTION CONTROL ----
    // Connects and starts the receive thread, throws TransportError on failure
    void connect();
    void close();
    bool is_connected() const { return connected_; }


    // ---- TRANSPORT INTERFACE ----
    void publish(const protocol::Envelope& envelope) override;
    SubscriptionId subscribe(const protocol::Filter& filter, Handler handler) override;
    void unsubscribe(SubscriptionId id) override;

private:
    // ---- PARAMETERS ----
    const std::string host_;
    const uint16_t port_;

    // Network components
    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::socket socket_;
    std::mutex write_mutex_;
    std::atomic<bool> connected_{false};

    // Receive state, used only on the io thread
    FrameHeader header_{};
    std::string body_;

    std::unique_ptr<std::thread> io_thread_;
    SubscriptionRegistry registry_;


    // ---- INCOMING FRAME PROCESSING ----
    void async_read_header();
    void async_read_body();
    void handle_frame();
};

} // namespace transport
} // namespace blobdvm

#endif // BLOBDVM_TRANSPORT_RELAY_TRANSPORT_HPP

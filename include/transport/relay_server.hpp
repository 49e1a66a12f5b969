#pragma once

#include <atomic>
#include <boost/asio.hpp>
#include <boost/log/trivial.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "transport/frame_io.hpp"

namespace blobdvm {
namespace transport {

// TCP relay forwarding every frame to every connection.
// Keeps the latest announcement per author and replays them on connect.
class RelayServer {
public:
  // -- CONSTRUCTOR AND DESTRUCTOR ----
  // Port 0 binds an ephemeral port, see port()
  RelayServer(const std::string& address, uint16_t port);
  ~RelayServer();

  RelayServer(const RelayServer&) = delete;
  RelayServer& operator=(const RelayServer&) = delete;


  // ---- INITIALIZATION AND TEARDOWN ----
  bool start();
  void shutdown();


  // ---- GETTERS ----
  uint16_t port() const { return bound_port_; }
  bool is_running() const { return is_running_; }
  std::size_t connection_count() const;
  std::size_t retained_count() const;

private:
  struct Connection {
    explicit Connection(boost::asio::io_context& io_context, uint64_t connection_id)
      : socket(io_context), id(connection_id) {}

    boost::asio::ip::tcp::socket socket;
    uint64_t id;
    FrameHeader header{};
    std::string body;
  };

  struct RetainedFrame {
    uint64_t created_at;
    std::string bytes;
  };

  // ---- PARAMETERS ----
  // Network parameters
  const std::string address_;
  const uint16_t port_;
  std::atomic<uint16_t> bound_port_{0};

  // Server state
  std::unique_ptr<std::thread> io_thread_;
  std::atomic<bool> is_running_{false};
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;

  // Connections and retained announcements, touched on the io thread
  mutable std::mutex mutex_;
  std::map<uint64_t, std::shared_ptr<Connection>> connections_;
  std::map<std::string, RetainedFrame> retained_;
  uint64_t next_connection_id_{1};


  // ---- CONNECTION HANDLING ----
  // Main listening loop that handles incoming connections
  void start_accept();
  // Sends retained announcements to a new connection
  void replay_retained(const std::shared_ptr<Connection>& connection);
  void drop(const std::shared_ptr<Connection>& connection);


  // ---- FRAME PROCESSING ----
  void async_read_header(const std::shared_ptr<Connection>& connection);
  void async_read_body(const std::shared_ptr<Connection>& connection);
  void handle_frame(const std::shared_ptr<Connection>& connection);
  void broadcast(const std::string& payload);
};

} // namespace transport
} // namespace blobdvm

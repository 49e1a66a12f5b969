#ifndef BLOBDVM_SERVER_BLOB_SERVER_HPP
#define BLOBDVM_SERVER_BLOB_SERVER_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include "config/config.hpp"
#include "protocol/messages.hpp"
#include "server/storage_manager.hpp"
#include "transport/transport.hpp"
#include "utils/channel.hpp"

namespace blobdvm {
namespace server {

// Request router: the transport callback only filters and enqueues, a single
// worker thread decodes, executes against the StorageManager and publishes
// chunks followed by the response. The expiry sweep runs on the same worker.
class BlobServer {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  BlobServer(transport::Transport& transport,
             const config::StorageConfig& storage_config,
             const config::ServerConfig& server_config,
             StorageManager::ClockFn clock = &Clock::now);
  ~BlobServer();

  BlobServer(const BlobServer&) = delete;
  BlobServer& operator=(const BlobServer&) = delete;


  // ---- INITIALIZATION AND TEARDOWN ----
  // Subscribes to requests, starts the worker and publishes the announcement
  void start();
  // Stops accepting requests, answers those already queued and joins the worker
  void stop();


  // ---- GETTERS ----
  bool is_running() const { return running_; }
  const std::string& identity() const { return identity_; }
  std::string capability_address() const;
  protocol::ServerAnnouncement announcement() const;
  uint64_t processed_count() const { return processed_count_; }
  // Records held after the worker's last request or sweep
  std::size_t record_count() const { return record_count_; }

private:
  // ---- PARAMETERS ----
  // System components
  transport::Transport& transport_;
  StorageManager storage_;
  config::ServerConfig server_config_;
  std::string identity_;

  // Job queue and worker
  utils::Channel<protocol::Envelope> job_queue_;
  std::unique_ptr<std::thread> worker_thread_;
  std::atomic<bool> running_{false};
  std::atomic<uint64_t> processed_count_{0};
  std::atomic<std::size_t> record_count_{0};
  transport::Transport::SubscriptionId subscription_{0};
  std::chrono::steady_clock::time_point last_sweep_;


  // ---- TRANSPORT CALLBACK ----
  void on_request(const protocol::Envelope& envelope);


  // ---- WORKER ----
  void worker_loop();
  void sweep_if_due();
  void sweep();
  void process(const protocol::Envelope& envelope);


  // ---- REQUEST HANDLERS ----
  void handle_store(const protocol::Request& request, const protocol::StoreRequest& store);
  void handle_retrieve(const protocol::Request& request, const protocol::RetrieveRequest& retrieve);
  void handle_delete(const protocol::Request& request, const protocol::DeleteRequest& remove);


  // ---- OUTGOING MESSAGES ----
  void publish_chunks(const FileRecord& record);
  // record is null for deletions, which carry only the hash
  void send_success(const std::string& request_id, const std::string& request_author,
                    const std::string& status, const FileRecord* record,
                    const crypto::Digest& hash);
  void send_error(const std::string& request_id, const std::string& request_author,
                  protocol::ErrorCode code, const std::string& message);
};

} // namespace server
} // namespace blobdvm

#endif // BLOBDVM_SERVER_BLOB_SERVER_HPP

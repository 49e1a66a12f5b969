#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "chunker/chunker.hpp"
#include "config/config.hpp"
#include "crypto/digest.hpp"
#include "server/storage_error.hpp"

namespace blobdvm {
namespace server {

using Clock = std::chrono::system_clock;

// Stored blob: its chunk set plus lifecycle timestamps
struct FileRecord {
  crypto::Digest content_hash{};
  std::vector<chunker::Chunk> chunks;
  uint64_t total_size{0};
  Clock::time_point created_at;
  Clock::time_point expires_at;
  std::optional<std::string> name;

  // Expiry as unix seconds, the form carried in messages
  uint64_t expires_at_unix() const;
};

// In-memory content-addressed blob store with time based expiry.
// Not thread-safe: owned by the server worker thread.
class StorageManager {
public:
  using ClockFn = std::function<Clock::time_point()>;

  // ---- CONSTRUCTOR ----
  explicit StorageManager(const config::StorageConfig& config, ClockFn clock = &Clock::now);


  // ---- CORE STORAGE OPERATIONS ----
  // Chunks and stores bytes under their SHA-256. Re-storing identical
  // content refreshes the existing record. Throws SizeExceeded, StorageFull.
  std::shared_ptr<const FileRecord> store(const std::string& bytes,
                                          std::optional<std::string> name = std::nullopt);
  // Throws NotFound when absent or expired; expired records are purged here
  std::shared_ptr<const FileRecord> retrieve(const crypto::Digest& hash);
  // Removes a record regardless of expiry, throws NotFound when absent
  void remove(const crypto::Digest& hash);


  // ---- EXPIRATION ----
  // Removes every record with expires_at < now, returns the number removed
  std::size_t sweep(Clock::time_point now);
  std::size_t sweep();


  // ---- QUERY OPERATIONS ----
  bool contains(const crypto::Digest& hash) const;
  std::size_t record_count() const { return records_.size(); }
  uint64_t stored_bytes() const { return stored_bytes_; }
  const config::StorageConfig& config() const { return config_; }

private:
  // ---- PARAMETERS ----
  config::StorageConfig config_;
  ClockFn clock_;
  chunker::Chunker chunker_;
  std::map<crypto::Digest, std::shared_ptr<const FileRecord>> records_;
  uint64_t stored_bytes_{0};

  void erase(std::map<crypto::Digest, std::shared_ptr<const FileRecord>>::iterator it);
};

} // namespace server
} // namespace blobdvm

#include "server/storage_manager.hpp"
#include <boost/log/trivial.hpp>

namespace blobdvm {
namespace server {

uint64_t FileRecord::expires_at_unix() const {
  return static_cast<uint64_t>(
    std::chrono::duration_cast<std::chrono::seconds>(expires_at.time_since_epoch()).count());
}


//==============================================
// CONSTRUCTOR
//==============================================

StorageManager::StorageManager(const config::StorageConfig& config, ClockFn clock)
  : config_(config)
  , clock_(std::move(clock))
  , chunker_(config.chunk_size) {
  BOOST_LOG_TRIVIAL(info) << "Storage manager: Initialized (max file size " << config_.max_file_size
                          << " bytes, chunk size " << config_.chunk_size
                          << " bytes, retention " << config_.retention_seconds << " s)";
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

std::shared_ptr<const FileRecord> StorageManager::store(const std::string& bytes,
                                                        std::optional<std::string> name) {
  // Size is checked before any hashing work
  if (bytes.size() > config_.max_file_size) {
    BOOST_LOG_TRIVIAL(warning) << "Storage manager: Rejecting " << bytes.size()
                               << " bytes, limit is " << config_.max_file_size;
    throw SizeExceeded(bytes.size(), config_.max_file_size);
  }

  crypto::Digest hash = crypto::sha256(bytes);
  Clock::time_point now = clock_();
  auto existing = records_.find(hash);

  if (config_.max_storage_bytes != 0 && existing == records_.end()) {
    if (stored_bytes_ + bytes.size() > config_.max_storage_bytes) {
      sweep(now);
    }
    if (stored_bytes_ + bytes.size() > config_.max_storage_bytes) {
      BOOST_LOG_TRIVIAL(warning) << "Storage manager: Capacity exhausted, " << stored_bytes_
                                 << " of " << config_.max_storage_bytes << " bytes in use";
      throw StorageFull(stored_bytes_ + bytes.size(), config_.max_storage_bytes);
    }
  }

  auto record = std::make_shared<FileRecord>();
  record->content_hash = hash;
  record->total_size = bytes.size();
  record->created_at = now;
  record->expires_at = now + std::chrono::seconds(config_.retention_seconds);
  record->name = std::move(name);

  if (existing != records_.end()) {
    // Same content, same chunks: refresh timestamps only
    record->chunks = existing->second->chunks;
    existing->second = record;
    BOOST_LOG_TRIVIAL(info) << "Storage manager: Refreshed " << crypto::to_hex(hash);
    return record;
  }

  record->chunks = chunker_.split(bytes);
  records_.emplace(hash, record);
  stored_bytes_ += bytes.size();

  BOOST_LOG_TRIVIAL(info) << "Storage manager: Stored " << crypto::to_hex(hash) << " ("
                          << bytes.size() << " bytes, " << record->chunks.size() << " chunks)";
  return record;
}

std::shared_ptr<const FileRecord> StorageManager::retrieve(const crypto::Digest& hash) {
  auto it = records_.find(hash);
  if (it == records_.end()) {
    BOOST_LOG_TRIVIAL(debug) << "Storage manager: No record for " << crypto::to_hex(hash);
    throw NotFound(crypto::to_hex(hash));
  }

  if (clock_() > it->second->expires_at) {
    BOOST_LOG_TRIVIAL(info) << "Storage manager: Purging expired " << crypto::to_hex(hash);
    erase(it);
    throw NotFound(crypto::to_hex(hash));
  }

  return it->second;
}

void StorageManager::remove(const crypto::Digest& hash) {
  auto it = records_.find(hash);
  if (it == records_.end()) {
    throw NotFound(crypto::to_hex(hash));
  }
  erase(it);
  BOOST_LOG_TRIVIAL(info) << "Storage manager: Deleted " << crypto::to_hex(hash);
}


//==============================================
// EXPIRATION
//==============================================

std::size_t StorageManager::sweep(Clock::time_point now) {
  std::size_t removed = 0;
  for (auto it = records_.begin(); it != records_.end();) {
    if (it->second->expires_at < now) {
      auto next = std::next(it);
      erase(it);
      it = next;
      ++removed;
    } else {
      ++it;
    }
  }

  if (removed > 0) {
    BOOST_LOG_TRIVIAL(info) << "Storage manager: Swept " << removed << " expired record(s)";
  }
  return removed;
}

std::size_t StorageManager::sweep() {
  return sweep(clock_());
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool StorageManager::contains(const crypto::Digest& hash) const {
  return records_.count(hash) > 0;
}

void StorageManager::erase(std::map<crypto::Digest, std::shared_ptr<const FileRecord>>::iterator it) {
  stored_bytes_ -= it->second->total_size;
  records_.erase(it);
}

} // namespace server
} // namespace blobdvm

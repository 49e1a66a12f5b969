#ifndef BLOBDVM_CLIENT_CHUNK_COLLECTOR_HPP
#define BLOBDVM_CLIENT_CHUNK_COLLECTOR_HPP

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "chunker/chunker.hpp"
#include "client/client_error.hpp"
#include "crypto/digest.hpp"
#include "transport/transport.hpp"

namespace blobdvm {
namespace client {

// Gathers the chunk messages of a file. Chunks arrive unordered, possibly
// duplicated, and possibly before the response that announces their count.
class ChunkCollector {
public:
    static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{60000};

    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    explicit ChunkCollector(transport::Transport& transport);
    ~ChunkCollector();

    ChunkCollector(const ChunkCollector&) = delete;
    ChunkCollector& operator=(const ChunkCollector&) = delete;


    // ---- COLLECTION ----
    // Opens a collection so chunks are buffered before the count is known.
    // Concurrent retrieves of one hash share the collection; each begin()
    // is released by exactly one collect() or abandon().
    void begin(const crypto::Digest& file_hash);
    // Waits until indices 0..expected_count-1 are all present and returns them
    // sorted by index. Opens the collection if begin() was not called. The
    // collection is torn down when its last waiter returns.
    // Throws TimeoutError (with counts) or CorruptionError.
    std::vector<chunker::Chunk> collect(const crypto::Digest& file_hash,
                                        std::size_t expected_count,
                                        std::chrono::milliseconds timeout = DEFAULT_TIMEOUT);
    // Drops a collection without waiting
    void abandon(const crypto::Digest& file_hash);


    // ---- QUERY METHODS ----
    bool is_collecting(const crypto::Digest& file_hash) const;
    std::size_t active_count() const;

private:
    struct Collection {
        std::map<std::size_t, chunker::Chunk> received;
        std::optional<std::size_t> expected_count;
        std::optional<std::string> corruption;
        std::condition_variable updated;
        std::size_t waiters = 0;
    };

    // ---- PARAMETERS ----
    transport::Transport& transport_;
    transport::Transport::SubscriptionId subscription_;
    mutable std::mutex mutex_;
    std::map<crypto::Digest, std::shared_ptr<Collection>> collections_;


    // ---- CHUNK HANDLING ----
    void on_chunk(const protocol::Envelope& envelope);
    // Caller holds mutex_
    void release(const crypto::Digest& file_hash, const std::shared_ptr<Collection>& collection);
    static std::size_t count_in_range(const Collection& collection, std::size_t expected_count);
};

} // namespace client
} // namespace blobdvm

#endif // BLOBDVM_CLIENT_CHUNK_COLLECTOR_HPP

#include "client/chunk_collector.hpp"
#include "protocol/messages.hpp"
#include <boost/log/trivial.hpp>

namespace blobdvm {
namespace client {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ChunkCollector::ChunkCollector(transport::Transport& transport)
    : transport_(transport) {
    protocol::Filter filter;
    filter.kinds = {protocol::MessageKind::CHUNK};
    subscription_ = transport_.subscribe(filter, [this](const protocol::Envelope& envelope) {
        on_chunk(envelope);
    });
    BOOST_LOG_TRIVIAL(debug) << "Chunk collector: Subscribed to chunks";
}

ChunkCollector::~ChunkCollector() {
    transport_.unsubscribe(subscription_);
}


//==============================================
// COLLECTION
//==============================================

void ChunkCollector::begin(const crypto::Digest& file_hash) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& collection = collections_[file_hash];
    if (!collection) {
        collection = std::make_shared<Collection>();
        BOOST_LOG_TRIVIAL(debug) << "Chunk collector: Opened collection for " << crypto::to_hex(file_hash);
    }
    ++collection->waiters;
}

std::vector<chunker::Chunk> ChunkCollector::collect(const crypto::Digest& file_hash,
                                                    std::size_t expected_count,
                                                    std::chrono::milliseconds timeout) {
    const std::string hash_hex = crypto::to_hex(file_hash);
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    std::unique_lock<std::mutex> lock(mutex_);
    auto& collection_ptr = collections_[file_hash];
    if (!collection_ptr) {
        collection_ptr = std::make_shared<Collection>();
        collection_ptr->waiters = 1;
    }
    std::shared_ptr<Collection> collection = collection_ptr;
    collection->expected_count = expected_count;

    BOOST_LOG_TRIVIAL(debug) << "Chunk collector: Waiting for " << expected_count << " chunk(s) of "
                             << hash_hex << ", " << collection->received.size() << " already buffered";

    bool complete = collection->updated.wait_until(lock, deadline, [&] {
        return collection->corruption.has_value() ||
               count_in_range(*collection, expected_count) == expected_count;
    });

    release(file_hash, collection);

    if (collection->corruption) {
        BOOST_LOG_TRIVIAL(error) << "Chunk collector: " << *collection->corruption;
        throw CorruptionError(*collection->corruption);
    }

    std::size_t received = count_in_range(*collection, expected_count);
    if (!complete) {
        BOOST_LOG_TRIVIAL(warning) << "Chunk collector: Timed out on " << hash_hex << " with "
                                   << received << " of " << expected_count << " chunk(s)";
        throw TimeoutError("chunk collection for " + hash_hex, received, expected_count);
    }

    std::vector<chunker::Chunk> chunks;
    chunks.reserve(expected_count);
    for (const auto& [index, chunk] : collection->received) {
        if (index < expected_count) {
            chunks.push_back(chunk);
        }
    }

    BOOST_LOG_TRIVIAL(info) << "Chunk collector: Collected " << chunks.size() << " chunk(s) of " << hash_hex;
    return chunks;
}

void ChunkCollector::abandon(const crypto::Digest& file_hash) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = collections_.find(file_hash);
    if (it == collections_.end()) {
        return;
    }
    std::shared_ptr<Collection> collection = it->second;
    release(file_hash, collection);
    BOOST_LOG_TRIVIAL(debug) << "Chunk collector: Abandoned collection for " << crypto::to_hex(file_hash);
}

void ChunkCollector::release(const crypto::Digest& file_hash, const std::shared_ptr<Collection>& collection) {
    if (collection->waiters > 0) {
        --collection->waiters;
    }
    // The last waiter tears the collection down so late chunks are dropped
    if (collection->waiters == 0) {
        collections_.erase(file_hash);
    }
}


//==============================================
// CHUNK HANDLING
//==============================================

void ChunkCollector::on_chunk(const protocol::Envelope& envelope) {
    protocol::ChunkMessage message;
    try {
        message = protocol::decode_chunk(envelope);
    } catch (const protocol::ProtocolError& e) {
        BOOST_LOG_TRIVIAL(warning) << "Chunk collector: Dropping malformed chunk " << envelope.id << ": " << e.what();
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = collections_.find(message.file_hash);
    if (it == collections_.end()) {
        BOOST_LOG_TRIVIAL(trace) << "Chunk collector: No collection for chunk of "
                                 << crypto::to_hex(message.file_hash);
        return;
    }

    Collection& collection = *it->second;
    if (collection.expected_count && message.index >= *collection.expected_count) {
        BOOST_LOG_TRIVIAL(debug) << "Chunk collector: Ignoring out of range index " << message.index;
        return;
    }

    chunker::Chunk chunk = message.to_chunk();
    auto existing = collection.received.find(chunk.index);
    if (existing != collection.received.end()) {
        if (existing->second.data != chunk.data || existing->second.hash != chunk.hash) {
            collection.corruption = "conflicting copies of chunk " + std::to_string(chunk.index) +
                                    " of " + crypto::to_hex(message.file_hash);
            collection.updated.notify_all();
        }
        return;
    }

    collection.received.emplace(chunk.index, std::move(chunk));
    collection.updated.notify_all();
}

std::size_t ChunkCollector::count_in_range(const Collection& collection, std::size_t expected_count) {
    // received is ordered by index, so the in-range entries form a prefix
    std::size_t count = 0;
    for (const auto& [index, chunk] : collection.received) {
        if (index >= expected_count) {
            break;
        }
        ++count;
    }
    return count;
}


//==============================================
// QUERY METHODS
//==============================================

bool ChunkCollector::is_collecting(const crypto::Digest& file_hash) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return collections_.count(file_hash) > 0;
}

std::size_t ChunkCollector::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return collections_.size();
}

} // namespace client
} // namespace blobdvm

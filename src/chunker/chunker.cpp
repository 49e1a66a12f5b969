#include "chunker/chunker.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace blobdvm {
namespace chunker {

//==============================================
// CONSTRUCTOR
//==============================================

Chunker::Chunker(std::size_t chunk_size) : chunk_size_(chunk_size) {
  if (chunk_size_ == 0) {
    BOOST_LOG_TRIVIAL(error) << "Chunker: Chunk size must be positive";
    throw std::invalid_argument("Chunker: Chunk size must be positive");
  }
}


//==============================================
// CHUNKING OPERATIONS
//==============================================

std::vector<Chunk> Chunker::split(const std::string& bytes) const {
  return split(bytes, chunk_size_);
}

std::vector<Chunk> Chunker::split(const std::string& bytes, std::size_t chunk_size) {
  if (chunk_size == 0) {
    throw std::invalid_argument("Chunker: Chunk size must be positive");
  }

  std::vector<Chunk> chunks;
  chunks.reserve((bytes.size() + chunk_size - 1) / chunk_size);

  for (std::size_t offset = 0; offset < bytes.size(); offset += chunk_size) {
    std::size_t length = std::min(chunk_size, bytes.size() - offset);
    chunks.push_back(make_chunk(offset / chunk_size, bytes.substr(offset, length)));
  }

  BOOST_LOG_TRIVIAL(debug) << "Chunker: Split " << bytes.size() << " bytes into "
                           << chunks.size() << " chunks of up to " << chunk_size << " bytes";
  return chunks;
}

std::string Chunker::reassemble(std::vector<Chunk> chunks) {
  // Per-chunk verification happens before any concatenation work
  for (const auto& chunk : chunks) {
    if (!verify_chunk(chunk)) {
      BOOST_LOG_TRIVIAL(error) << "Chunker: Hash mismatch for chunk " << chunk.index;
      throw IntegrityError("Chunk " + std::to_string(chunk.index) + " hash mismatch");
    }
  }

  std::sort(chunks.begin(), chunks.end(),
            [](const Chunk& a, const Chunk& b) { return a.index < b.index; });
  check_index_set(chunks);

  std::size_t total_size = 0;
  for (const auto& chunk : chunks) {
    total_size += chunk.data.size();
  }

  std::string bytes;
  bytes.reserve(total_size);
  for (const auto& chunk : chunks) {
    bytes.append(chunk.data);
  }

  BOOST_LOG_TRIVIAL(debug) << "Chunker: Reassembled " << chunks.size() << " chunks into "
                           << bytes.size() << " bytes";
  return bytes;
}

bool Chunker::verify_whole(const std::vector<Chunk>& chunks, const crypto::Digest& expected_hash) {
  std::string bytes = reassemble(chunks);
  bool matches = crypto::sha256(bytes) == expected_hash;
  if (!matches) {
    BOOST_LOG_TRIVIAL(warning) << "Chunker: Whole-file digest does not match "
                               << crypto::to_hex(expected_hash);
  }
  return matches;
}


//==============================================
// SINGLE CHUNK HELPERS
//==============================================

Chunk Chunker::make_chunk(std::size_t index, std::string data) {
  Chunk chunk;
  chunk.index = index;
  chunk.hash = crypto::sha256(data);
  chunk.size = data.size();
  chunk.data = std::move(data);
  return chunk;
}

bool Chunker::verify_chunk(const Chunk& chunk) {
  return chunk.size == chunk.data.size() && crypto::sha256(chunk.data) == chunk.hash;
}

void Chunker::check_index_set(const std::vector<Chunk>& sorted_chunks) {
  for (std::size_t i = 0; i < sorted_chunks.size(); ++i) {
    if (sorted_chunks[i].index == i) {
      continue;
    }
    if (i > 0 && sorted_chunks[i].index == sorted_chunks[i - 1].index) {
      BOOST_LOG_TRIVIAL(error) << "Chunker: Duplicate chunk index " << sorted_chunks[i].index;
      throw StructuralError("Duplicate chunk index " + std::to_string(sorted_chunks[i].index));
    }
    BOOST_LOG_TRIVIAL(error) << "Chunker: Missing chunk index " << i;
    throw StructuralError("Missing chunk index " + std::to_string(i) + " of "
                          + std::to_string(sorted_chunks.size()));
  }
}

} // namespace chunker
} // namespace blobdvm

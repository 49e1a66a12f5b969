#ifndef BLOBDVM_CHUNKER_HPP
#define BLOBDVM_CHUNKER_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include "crypto/digest.hpp"

namespace blobdvm {
namespace chunker {

// Default chunk size in bytes (32 KiB)
static constexpr std::size_t DEFAULT_CHUNK_SIZE = 32768;

// Contiguous byte range of a file with its own digest and position
struct Chunk {
  std::size_t index{0};
  std::string data;
  crypto::Digest hash{};
  std::size_t size{0};
};

class ChunkError : public std::runtime_error {
public:
  explicit ChunkError(const std::string& message) : std::runtime_error(message) {}
};

// A chunk's recorded hash does not match its bytes
class IntegrityError : public ChunkError {
public:
  explicit IntegrityError(const std::string& message)
    : ChunkError("Integrity error: " + message) {}
};

// Chunk index set is not exactly {0, ..., total-1}
class StructuralError : public ChunkError {
public:
  explicit StructuralError(const std::string& message)
    : ChunkError("Structural error: " + message) {}
};

class Chunker {
public:
  // ---- CONSTRUCTOR ----
  explicit Chunker(std::size_t chunk_size = DEFAULT_CHUNK_SIZE);


  // ---- CHUNKING OPERATIONS ----
  // Splits bytes into ceil(size / chunk_size) hashed chunks
  std::vector<Chunk> split(const std::string& bytes) const;
  static std::vector<Chunk> split(const std::string& bytes, std::size_t chunk_size);

  // Verifies every chunk hash and the index set, then concatenates by index
  static std::string reassemble(std::vector<Chunk> chunks);

  // Reassembles and compares the digest of the result with expected_hash.
  // Failures of reassemble() propagate; a digest mismatch returns false.
  static bool verify_whole(const std::vector<Chunk>& chunks, const crypto::Digest& expected_hash);


  // ---- SINGLE CHUNK HELPERS ----
  static Chunk make_chunk(std::size_t index, std::string data);
  static bool verify_chunk(const Chunk& chunk);


  // ---- GETTERS ----
  std::size_t chunk_size() const { return chunk_size_; }

private:
  // ---- PARAMETERS ----
  std::size_t chunk_size_;

  // Throws StructuralError unless indices are exactly 0..n-1 once sorted
  static void check_index_set(const std::vector<Chunk>& sorted_chunks);
};

} // namespace chunker
} // namespace blobdvm

#endif // BLOBDVM_CHUNKER_HPP

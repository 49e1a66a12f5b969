#ifndef BLOBDVM_SERVER_STORAGE_ERROR_HPP
#define BLOBDVM_SERVER_STORAGE_ERROR_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace blobdvm {
namespace server {

class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& message)
        : std::runtime_error(message) {}
};

// Payload larger than the configured maximum file size
class SizeExceeded : public StorageError {
public:
    SizeExceeded(uint64_t size, uint64_t limit)
        : StorageError("File exceeds maximum size limit (" + std::to_string(size) +
                       " > " + std::to_string(limit) + " bytes)"),
          size_(size), limit_(limit) {}

    uint64_t size() const { return size_; }
    uint64_t limit() const { return limit_; }

private:
    uint64_t size_;
    uint64_t limit_;
};

// No live record for the hash; expired records count as absent
class NotFound : public StorageError {
public:
    explicit NotFound(const std::string& hash_hex)
        : StorageError("File not found: " + hash_hex) {}
};

// Storing would exceed the configured total capacity
class StorageFull : public StorageError {
public:
    StorageFull(uint64_t required, uint64_t capacity)
        : StorageError("Storage capacity exceeded (" + std::to_string(required) +
                       " of " + std::to_string(capacity) + " bytes)") {}
};

} // namespace server
} // namespace blobdvm

#endif // BLOBDVM_SERVER_STORAGE_ERROR_HPP

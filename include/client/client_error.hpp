#ifndef BLOBDVM_CLIENT_ERROR_HPP
#define BLOBDVM_CLIENT_ERROR_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include "protocol/error_code.hpp"

namespace blobdvm {
namespace client {

class ClientError : public std::runtime_error {
public:
    explicit ClientError(const std::string& message)
        : std::runtime_error(message) {}
};

// A correlated wait or chunk collection ran out of time
class TimeoutError : public ClientError {
public:
    explicit TimeoutError(const std::string& message)
        : ClientError("Timeout: " + message) {}

    TimeoutError(const std::string& message, std::size_t received, std::size_t expected)
        : ClientError("Timeout: " + message + " (received " + std::to_string(received) +
                      " of " + std::to_string(expected) + ")"),
          received_(received), expected_(expected) {}

    std::size_t received() const { return received_; }
    std::size_t expected() const { return expected_; }

private:
    std::size_t received_{0};
    std::size_t expected_{0};
};

// Two copies of the same chunk index disagree
class CorruptionError : public ClientError {
public:
    explicit CorruptionError(const std::string& message)
        : ClientError("Corruption: " + message) {}
};

// The server answered with an error response
class RemoteError : public ClientError {
public:
    RemoteError(protocol::ErrorCode code, const std::string& message)
        : ClientError(std::string(protocol::error_code_to_string(code)) + ": " + message),
          code_(code), remote_message_(message) {}

    protocol::ErrorCode code() const { return code_; }
    const std::string& remote_message() const { return remote_message_; }

private:
    protocol::ErrorCode code_;
    std::string remote_message_;
};

// No storage server could be found
class DiscoveryError : public ClientError {
public:
    explicit DiscoveryError(const std::string& message)
        : ClientError("Discovery: " + message) {}
};

} // namespace client
} // namespace blobdvm

#endif // BLOBDVM_CLIENT_ERROR_HPP

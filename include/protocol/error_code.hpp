#ifndef BLOBDVM_PROTOCOL_ERROR_CODE_HPP
#define BLOBDVM_PROTOCOL_ERROR_CODE_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace blobdvm {
namespace protocol {

// Error codes carried in error responses
enum class ErrorCode {
    FILE_TOO_LARGE,
    INVALID_HASH,
    FILE_NOT_FOUND,
    CHUNK_MISSING,
    INTEGRITY_FAILED,
    STORAGE_FULL,
    INVALID_ACTION,
    INVALID_REQUEST_FORMAT,
    INTERNAL_ERROR
};

// Wire name of an error code, e.g. "FILE_NOT_FOUND"
const char* error_code_to_string(ErrorCode code);
// Parses a wire name; std::nullopt for unknown names
std::optional<ErrorCode> error_code_from_string(std::string_view name);
// Human readable default message for an error code
const char* default_error_message(ErrorCode code);

// Raised when a message cannot be decoded or violates the schema
class ProtocolError : public std::runtime_error {
public:
    ProtocolError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

} // namespace protocol
} // namespace blobdvm

#endif // BLOBDVM_PROTOCOL_ERROR_CODE_HPP

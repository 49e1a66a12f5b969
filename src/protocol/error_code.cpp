#include "protocol/error_code.hpp"
#include <array>

namespace blobdvm {
namespace protocol {

namespace {

constexpr std::array<ErrorCode, 9> ALL_CODES = {
    ErrorCode::FILE_TOO_LARGE,
    ErrorCode::INVALID_HASH,
    ErrorCode::FILE_NOT_FOUND,
    ErrorCode::CHUNK_MISSING,
    ErrorCode::INTEGRITY_FAILED,
    ErrorCode::STORAGE_FULL,
    ErrorCode::INVALID_ACTION,
    ErrorCode::INVALID_REQUEST_FORMAT,
    ErrorCode::INTERNAL_ERROR
};

} // namespace

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::FILE_TOO_LARGE: return "FILE_TOO_LARGE";
        case ErrorCode::INVALID_HASH: return "INVALID_HASH";
        case ErrorCode::FILE_NOT_FOUND: return "FILE_NOT_FOUND";
        case ErrorCode::CHUNK_MISSING: return "CHUNK_MISSING";
        case ErrorCode::INTEGRITY_FAILED: return "INTEGRITY_FAILED";
        case ErrorCode::STORAGE_FULL: return "STORAGE_FULL";
        case ErrorCode::INVALID_ACTION: return "INVALID_ACTION";
        case ErrorCode::INVALID_REQUEST_FORMAT: return "INVALID_REQUEST_FORMAT";
        case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
        default: return "INTERNAL_ERROR";
    }
}

std::optional<ErrorCode> error_code_from_string(std::string_view name) {
    for (ErrorCode code : ALL_CODES) {
        if (name == error_code_to_string(code)) {
            return code;
        }
    }
    return std::nullopt;
}

const char* default_error_message(ErrorCode code) {
    switch (code) {
        case ErrorCode::FILE_TOO_LARGE: return "File exceeds maximum size limit";
        case ErrorCode::INVALID_HASH: return "Invalid SHA256 hash format";
        case ErrorCode::FILE_NOT_FOUND: return "Requested file not found";
        case ErrorCode::CHUNK_MISSING: return "One or more chunks missing";
        case ErrorCode::INTEGRITY_FAILED: return "File integrity verification failed";
        case ErrorCode::STORAGE_FULL: return "Storage capacity exceeded";
        case ErrorCode::INVALID_ACTION: return "Unknown action";
        case ErrorCode::INVALID_REQUEST_FORMAT: return "Malformed request payload";
        case ErrorCode::INTERNAL_ERROR: return "Internal server error";
        default: return "Undefined error";
    }
}

} // namespace protocol
} // namespace blobdvm

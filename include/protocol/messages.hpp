#ifndef BLOBDVM_PROTOCOL_MESSAGES_HPP
#define BLOBDVM_PROTOCOL_MESSAGES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "chunker/chunker.hpp"
#include "crypto/digest.hpp"
#include "protocol/envelope.hpp"
#include "protocol/error_code.hpp"

namespace blobdvm {
namespace protocol {

// Service identifier advertised in announcements and addressed by requests
inline constexpr const char* SERVICE_ID = "blob-storage-v1";

enum class Action { STORE, RETRIEVE, DELETE };

const char* to_string(Action action);
std::optional<Action> action_from_string(const std::string& name);

// ---- REQUEST ----
struct StoreRequest {
    std::string data;
    std::optional<std::string> filename;
};

struct RetrieveRequest {
    crypto::Digest hash{};
};

struct DeleteRequest {
    crypto::Digest hash{};
};

using RequestPayload = std::variant<StoreRequest, RetrieveRequest, DeleteRequest>;

struct Request {
    std::string id;
    std::string author;
    std::string capability;
    RequestPayload payload;

    Action action() const;
};

// ---- RESPONSE ----
struct SuccessResponse {
    std::string status;         // "stored", "available" or "deleted"
    crypto::Digest hash{};
    std::optional<uint64_t> size;
    std::optional<uint64_t> chunk_count;
    std::optional<uint64_t> expires_at;
};

struct ErrorResponse {
    ErrorCode code{ErrorCode::INTERNAL_ERROR};
    std::string message;
};

struct Response {
    std::string request_id;
    std::string request_author;
    std::variant<SuccessResponse, ErrorResponse> body;

    bool ok() const { return std::holds_alternative<SuccessResponse>(body); }
    const SuccessResponse& success() const { return std::get<SuccessResponse>(body); }
    const ErrorResponse& error() const { return std::get<ErrorResponse>(body); }
};

// ---- CHUNK ----
struct ChunkMessage {
    crypto::Digest file_hash{};
    std::size_t index{0};
    std::size_t total{0};
    crypto::Digest chunk_hash{};
    uint64_t expires_at{0};
    std::string data;

    chunker::Chunk to_chunk() const;
};

// ---- ANNOUNCEMENT ----
struct ServerAnnouncement {
    std::string identity;
    std::vector<Action> accepted_actions;
    uint64_t max_file_size{0};
    uint64_t chunk_size{0};
    uint64_t retention_seconds{0};
    std::string name;
    std::string about;

    std::string capability_address() const;
};

// Address a request must carry to reach the server with this identity
std::string capability_address(const std::string& identity);


// ---- ENCODING ----
Envelope encode_request(const RequestPayload& payload, const std::string& author,
                        const std::string& capability);
Envelope encode_response(const Response& response, const std::string& author);
Envelope encode_chunk(const ChunkMessage& chunk, const std::string& author);
Envelope encode_announcement(const ServerAnnouncement& announcement);


// ---- DECODING ----
// All decoders throw ProtocolError. Request decoding reports
// INVALID_REQUEST_FORMAT, INVALID_ACTION or INVALID_HASH.
Request decode_request(const Envelope& envelope);
Response decode_response(const Envelope& envelope);
ChunkMessage decode_chunk(const Envelope& envelope);
ServerAnnouncement decode_announcement(const Envelope& envelope);

} // namespace protocol
} // namespace blobdvm

#endif // BLOBDVM_PROTOCOL_MESSAGES_HPP

#include "protocol/messages.hpp"
#include "protocol/codec.hpp"
#include <boost/log/trivial.hpp>
#include <sstream>

namespace blobdvm {
namespace protocol {

namespace {

// ---- FIELD NAMES ----
constexpr const char* FIELD_ACTION = "action";
constexpr const char* FIELD_DATA = "data";
constexpr const char* FIELD_FILENAME = "filename";
constexpr const char* FIELD_HASH = "hash";
constexpr const char* FIELD_STATUS = "status";
constexpr const char* FIELD_SIZE = "size";
constexpr const char* FIELD_CHUNKS = "chunks";
constexpr const char* FIELD_EXPIRES = "expires";
constexpr const char* FIELD_ERROR = "error";
constexpr const char* FIELD_MESSAGE = "message";
constexpr const char* FIELD_NAME = "name";
constexpr const char* FIELD_ABOUT = "about";
constexpr const char* FIELD_ACTIONS = "actions";
constexpr const char* FIELD_MAX_FILE_SIZE = "max_file_size";
constexpr const char* FIELD_CHUNK_SIZE = "chunk_size";
constexpr const char* FIELD_RETENTION = "retention_seconds";

constexpr const char* STATUS_ERROR = "error";

[[noreturn]] void malformed(const std::string& message) {
    throw ProtocolError(ErrorCode::INVALID_REQUEST_FORMAT, message);
}

void expect_kind(const Envelope& envelope, MessageKind kind) {
    if (envelope.kind != kind) {
        malformed(std::string("Expected ") + to_string(kind) + " message, got " + to_string(envelope.kind));
    }
}

const std::string& require_field(const FieldMap& fields, const char* name) {
    auto it = fields.find(name);
    if (it == fields.end()) {
        malformed(std::string("Missing required field '") + name + "'");
    }
    return it->second;
}

std::optional<std::string> optional_field(const FieldMap& fields, const char* name) {
    auto it = fields.find(name);
    if (it == fields.end()) {
        return std::nullopt;
    }
    return it->second;
}

uint64_t parse_u64(const std::string& value, const char* what) {
    if (value.empty() || value.size() > 20 ||
        value.find_first_not_of("0123456789") != std::string::npos) {
        malformed(std::string("Invalid numeric value for '") + what + "': '" + value + "'");
    }
    try {
        return std::stoull(value);
    } catch (const std::out_of_range&) {
        malformed(std::string("Numeric value out of range for '") + what + "'");
    }
}

crypto::Digest parse_digest(const std::string& value, ErrorCode code, const char* what) {
    if (!crypto::is_valid_hex_digest(value)) {
        throw ProtocolError(code, std::string("Invalid SHA256 hash for '") + what + "': '" + value + "'");
    }
    return crypto::digest_from_hex(value);
}

std::optional<uint64_t> optional_u64(const FieldMap& fields, const char* name) {
    auto value = optional_field(fields, name);
    if (!value) {
        return std::nullopt;
    }
    return parse_u64(*value, name);
}

const std::string& require_tag(const Envelope& envelope, const char* name,
                               std::optional<std::string>& holder) {
    holder = envelope.tag(name);
    if (!holder) {
        malformed(std::string("Missing required tag '") + name + "'");
    }
    return *holder;
}

FieldMap decode_content(const Envelope& envelope) {
    // Codec::decode_fields raises INVALID_REQUEST_FORMAT on any framing issue
    return Codec::decode_fields(envelope.content);
}

} // namespace


//==============================================
// ACTIONS AND ADDRESSES
//==============================================

const char* to_string(Action action) {
    switch (action) {
        case Action::STORE: return "store";
        case Action::RETRIEVE: return "retrieve";
        case Action::DELETE: return "delete";
        default: return "unknown";
    }
}

std::optional<Action> action_from_string(const std::string& name) {
    if (name == "store") return Action::STORE;
    if (name == "retrieve") return Action::RETRIEVE;
    if (name == "delete") return Action::DELETE;
    return std::nullopt;
}

Action Request::action() const {
    if (std::holds_alternative<StoreRequest>(payload)) return Action::STORE;
    if (std::holds_alternative<RetrieveRequest>(payload)) return Action::RETRIEVE;
    return Action::DELETE;
}

std::string capability_address(const std::string& identity) {
    return identity + ":" + SERVICE_ID;
}

std::string ServerAnnouncement::capability_address() const {
    return protocol::capability_address(identity);
}

chunker::Chunk ChunkMessage::to_chunk() const {
    chunker::Chunk chunk;
    chunk.index = index;
    chunk.data = data;
    chunk.hash = chunk_hash;
    chunk.size = data.size();
    return chunk;
}


//==============================================
// ENCODING
//==============================================

Envelope encode_request(const RequestPayload& payload, const std::string& author,
                        const std::string& capability) {
    Envelope envelope = make_envelope(MessageKind::REQUEST, author);
    envelope.add_tag(TAG_CAPABILITY, capability);

    FieldMap fields;
    if (const auto* store = std::get_if<StoreRequest>(&payload)) {
        fields[FIELD_ACTION] = to_string(Action::STORE);
        fields[FIELD_DATA] = store->data;
        if (store->filename) {
            fields[FIELD_FILENAME] = *store->filename;
        }
    } else if (const auto* retrieve = std::get_if<RetrieveRequest>(&payload)) {
        fields[FIELD_ACTION] = to_string(Action::RETRIEVE);
        fields[FIELD_HASH] = crypto::to_hex(retrieve->hash);
    } else {
        const auto& remove = std::get<DeleteRequest>(payload);
        fields[FIELD_ACTION] = to_string(Action::DELETE);
        fields[FIELD_HASH] = crypto::to_hex(remove.hash);
    }

    envelope.content = Codec::encode_fields(fields);
    return envelope;
}

Envelope encode_response(const Response& response, const std::string& author) {
    Envelope envelope = make_envelope(MessageKind::RESPONSE, author);
    envelope.add_tag(TAG_REQUEST_REF, response.request_id);
    envelope.add_tag(TAG_REQUEST_AUTHOR, response.request_author);

    FieldMap fields;
    if (response.ok()) {
        const auto& success = response.success();
        std::string hash_hex = crypto::to_hex(success.hash);
        fields[FIELD_STATUS] = success.status;
        fields[FIELD_HASH] = hash_hex;
        envelope.add_tag(TAG_FILE_HASH, hash_hex);
        if (success.size) {
            fields[FIELD_SIZE] = std::to_string(*success.size);
        }
        if (success.chunk_count) {
            fields[FIELD_CHUNKS] = std::to_string(*success.chunk_count);
        }
        if (success.expires_at) {
            fields[FIELD_EXPIRES] = std::to_string(*success.expires_at);
            envelope.add_tag(TAG_EXPIRES, std::to_string(*success.expires_at));
        }
    } else {
        const auto& error = response.error();
        fields[FIELD_STATUS] = STATUS_ERROR;
        fields[FIELD_ERROR] = error_code_to_string(error.code);
        fields[FIELD_MESSAGE] = error.message;
    }

    envelope.content = Codec::encode_fields(fields);
    return envelope;
}

Envelope encode_chunk(const ChunkMessage& chunk, const std::string& author) {
    Envelope envelope = make_envelope(MessageKind::CHUNK, author);
    envelope.add_tag(TAG_FILE_HASH, crypto::to_hex(chunk.file_hash));
    envelope.add_tag(TAG_CHUNK_INDEX, std::to_string(chunk.index));
    envelope.add_tag(TAG_CHUNK_TOTAL, std::to_string(chunk.total));
    envelope.add_tag(TAG_CHUNK_HASH, crypto::to_hex(chunk.chunk_hash));
    envelope.add_tag(TAG_EXPIRES, std::to_string(chunk.expires_at));
    envelope.content = chunk.data;
    return envelope;
}

Envelope encode_announcement(const ServerAnnouncement& announcement) {
    Envelope envelope = make_envelope(MessageKind::ANNOUNCEMENT, announcement.identity);
    envelope.add_tag(TAG_SERVICE, SERVICE_ID);
    envelope.add_tag(TAG_ACCEPTED_KIND, std::to_string(static_cast<uint16_t>(MessageKind::REQUEST)));

    std::string actions;
    for (Action action : announcement.accepted_actions) {
        if (!actions.empty()) {
            actions += ",";
        }
        actions += to_string(action);
    }

    FieldMap fields;
    fields[FIELD_NAME] = announcement.name;
    fields[FIELD_ABOUT] = announcement.about;
    fields[FIELD_ACTIONS] = actions;
    fields[FIELD_MAX_FILE_SIZE] = std::to_string(announcement.max_file_size);
    fields[FIELD_CHUNK_SIZE] = std::to_string(announcement.chunk_size);
    fields[FIELD_RETENTION] = std::to_string(announcement.retention_seconds);

    envelope.content = Codec::encode_fields(fields);
    return envelope;
}


//==============================================
// DECODING
//==============================================

Request decode_request(const Envelope& envelope) {
    expect_kind(envelope, MessageKind::REQUEST);

    Request request;
    request.id = envelope.id;
    request.author = envelope.author;
    request.capability = envelope.tag(TAG_CAPABILITY).value_or("");

    FieldMap fields = decode_content(envelope);
    const std::string& action_name = require_field(fields, FIELD_ACTION);
    auto action = action_from_string(action_name);
    if (!action) {
        throw ProtocolError(ErrorCode::INVALID_ACTION, "Unknown action: " + action_name);
    }

    switch (*action) {
        case Action::STORE: {
            StoreRequest store;
            store.data = require_field(fields, FIELD_DATA);
            store.filename = optional_field(fields, FIELD_FILENAME);
            request.payload = std::move(store);
            break;
        }
        case Action::RETRIEVE: {
            RetrieveRequest retrieve;
            retrieve.hash = parse_digest(require_field(fields, FIELD_HASH), ErrorCode::INVALID_HASH, FIELD_HASH);
            request.payload = retrieve;
            break;
        }
        case Action::DELETE: {
            DeleteRequest remove;
            remove.hash = parse_digest(require_field(fields, FIELD_HASH), ErrorCode::INVALID_HASH, FIELD_HASH);
            request.payload = remove;
            break;
        }
    }

    return request;
}

Response decode_response(const Envelope& envelope) {
    expect_kind(envelope, MessageKind::RESPONSE);

    Response response;
    std::optional<std::string> holder;
    response.request_id = require_tag(envelope, TAG_REQUEST_REF, holder);
    response.request_author = envelope.tag(TAG_REQUEST_AUTHOR).value_or("");

    FieldMap fields = decode_content(envelope);
    const std::string& status = require_field(fields, FIELD_STATUS);

    if (status == STATUS_ERROR) {
        ErrorResponse error;
        const std::string& code_name = require_field(fields, FIELD_ERROR);
        auto code = error_code_from_string(code_name);
        if (!code) {
            BOOST_LOG_TRIVIAL(warning) << "Messages: Unknown error code in response: " << code_name;
        }
        error.code = code.value_or(ErrorCode::INTERNAL_ERROR);
        error.message = optional_field(fields, FIELD_MESSAGE).value_or(default_error_message(error.code));
        response.body = std::move(error);
        return response;
    }

    SuccessResponse success;
    success.status = status;
    success.hash = parse_digest(require_field(fields, FIELD_HASH), ErrorCode::INVALID_REQUEST_FORMAT, FIELD_HASH);
    success.size = optional_u64(fields, FIELD_SIZE);
    success.chunk_count = optional_u64(fields, FIELD_CHUNKS);
    success.expires_at = optional_u64(fields, FIELD_EXPIRES);
    response.body = std::move(success);
    return response;
}

ChunkMessage decode_chunk(const Envelope& envelope) {
    expect_kind(envelope, MessageKind::CHUNK);

    std::optional<std::string> holder;
    ChunkMessage chunk;
    chunk.file_hash = parse_digest(require_tag(envelope, TAG_FILE_HASH, holder),
                                   ErrorCode::INVALID_REQUEST_FORMAT, TAG_FILE_HASH);
    chunk.index = static_cast<std::size_t>(parse_u64(require_tag(envelope, TAG_CHUNK_INDEX, holder), TAG_CHUNK_INDEX));
    chunk.total = static_cast<std::size_t>(parse_u64(require_tag(envelope, TAG_CHUNK_TOTAL, holder), TAG_CHUNK_TOTAL));
    chunk.chunk_hash = parse_digest(require_tag(envelope, TAG_CHUNK_HASH, holder),
                                    ErrorCode::INVALID_REQUEST_FORMAT, TAG_CHUNK_HASH);
    chunk.expires_at = parse_u64(envelope.tag(TAG_EXPIRES).value_or("0"), TAG_EXPIRES);
    chunk.data = envelope.content;

    if (chunk.index >= chunk.total) {
        malformed("Chunk index " + std::to_string(chunk.index) + " outside total " + std::to_string(chunk.total));
    }
    return chunk;
}

ServerAnnouncement decode_announcement(const Envelope& envelope) {
    expect_kind(envelope, MessageKind::ANNOUNCEMENT);
    if (!envelope.has_tag(TAG_SERVICE, SERVICE_ID)) {
        malformed("Announcement does not advertise " + std::string(SERVICE_ID));
    }

    FieldMap fields = decode_content(envelope);

    ServerAnnouncement announcement;
    announcement.identity = envelope.author;
    announcement.name = optional_field(fields, FIELD_NAME).value_or("");
    announcement.about = optional_field(fields, FIELD_ABOUT).value_or("");
    announcement.max_file_size = parse_u64(require_field(fields, FIELD_MAX_FILE_SIZE), FIELD_MAX_FILE_SIZE);
    announcement.chunk_size = parse_u64(require_field(fields, FIELD_CHUNK_SIZE), FIELD_CHUNK_SIZE);
    announcement.retention_seconds = parse_u64(require_field(fields, FIELD_RETENTION), FIELD_RETENTION);

    std::stringstream actions(optional_field(fields, FIELD_ACTIONS).value_or(""));
    std::string action_name;
    while (std::getline(actions, action_name, ',')) {
        if (auto action = action_from_string(action_name)) {
            announcement.accepted_actions.push_back(*action);
        }
    }

    if (announcement.identity.empty()) {
        malformed("Announcement without author identity");
    }
    return announcement;
}

} // namespace protocol
} // namespace blobdvm

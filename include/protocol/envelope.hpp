#ifndef BLOBDVM_PROTOCOL_ENVELOPE_HPP
#define BLOBDVM_PROTOCOL_ENVELOPE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace blobdvm {
namespace protocol {

// Categorical kind carried on every message
enum class MessageKind : uint16_t {
    REQUEST = 24210,
    RESPONSE = 24211,
    CHUNK = 24212,
    ANNOUNCEMENT = 31999
};

const char* to_string(MessageKind kind);
bool is_known_kind(uint16_t value);

// Routing metadata visible to transport filters
struct Tag {
    std::string name;
    std::string value;

    bool operator==(const Tag& other) const {
        return name == other.name && value == other.value;
    }
};

// Tag names
inline constexpr const char* TAG_CAPABILITY = "a";
inline constexpr const char* TAG_REQUEST_REF = "e";
inline constexpr const char* TAG_REQUEST_AUTHOR = "p";
inline constexpr const char* TAG_SERVICE = "d";
inline constexpr const char* TAG_ACCEPTED_KIND = "k";
inline constexpr const char* TAG_FILE_HASH = "file_hash";
inline constexpr const char* TAG_EXPIRES = "expires";
inline constexpr const char* TAG_CHUNK_INDEX = "chunk_index";
inline constexpr const char* TAG_CHUNK_TOTAL = "chunk_total";
inline constexpr const char* TAG_CHUNK_HASH = "chunk_hash";

// Transport level message
struct Envelope {
    std::string id;
    MessageKind kind{MessageKind::REQUEST};
    std::string author;
    uint64_t created_at{0};
    std::vector<Tag> tags;
    std::string content;

    // First value of the named tag, if present
    std::optional<std::string> tag(const std::string& name) const;
    bool has_tag(const std::string& name, const std::string& value) const;
    void add_tag(std::string name, std::string value);
};

// Builds an envelope with a fresh random id and the current unix time
Envelope make_envelope(MessageKind kind, const std::string& author);

// Subscription filter: kind must be listed (empty = any kind),
// and every required tag must be present with the given value
struct Filter {
    std::vector<MessageKind> kinds;
    std::vector<Tag> tags;

    bool matches(const Envelope& envelope) const;
};

} // namespace protocol
} // namespace blobdvm

#endif // BLOBDVM_PROTOCOL_ENVELOPE_HPP

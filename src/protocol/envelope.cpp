#include "protocol/envelope.hpp"
#include "crypto/digest.hpp"
#include <algorithm>
#include <chrono>

namespace blobdvm {
namespace protocol {

const char* to_string(MessageKind kind) {
    switch (kind) {
        case MessageKind::REQUEST: return "Request";
        case MessageKind::RESPONSE: return "Response";
        case MessageKind::CHUNK: return "Chunk";
        case MessageKind::ANNOUNCEMENT: return "Announcement";
        default: return "Unknown";
    }
}

bool is_known_kind(uint16_t value) {
    switch (static_cast<MessageKind>(value)) {
        case MessageKind::REQUEST:
        case MessageKind::RESPONSE:
        case MessageKind::CHUNK:
        case MessageKind::ANNOUNCEMENT:
            return true;
        default:
            return false;
    }
}

std::optional<std::string> Envelope::tag(const std::string& name) const {
    for (const auto& t : tags) {
        if (t.name == name) {
            return t.value;
        }
    }
    return std::nullopt;
}

bool Envelope::has_tag(const std::string& name, const std::string& value) const {
    return std::any_of(tags.begin(), tags.end(), [&](const Tag& t) {
        return t.name == name && t.value == value;
    });
}

void Envelope::add_tag(std::string name, std::string value) {
    tags.push_back(Tag{std::move(name), std::move(value)});
}

Envelope make_envelope(MessageKind kind, const std::string& author) {
    Envelope envelope;
    envelope.id = crypto::random_hex_id();
    envelope.kind = kind;
    envelope.author = author;
    envelope.created_at = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
    return envelope;
}

bool Filter::matches(const Envelope& envelope) const {
    if (!kinds.empty() &&
        std::find(kinds.begin(), kinds.end(), envelope.kind) == kinds.end()) {
        return false;
    }
    return std::all_of(tags.begin(), tags.end(), [&](const Tag& required) {
        return envelope.has_tag(required.name, required.value);
    });
}

} // namespace protocol
} // namespace blobdvm

#include "protocol/codec.hpp"
#include <boost/log/trivial.hpp>
#include <sstream>

namespace blobdvm {
namespace protocol {

//==============================================
// ENVELOPE SERIALIZATION
//==============================================

std::size_t Codec::serialize(const Envelope& envelope, std::ostream& output) {
  if (!output.good()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Invalid output stream state";
    throw std::runtime_error("Codec: Invalid output stream");
  }

  if (envelope.tags.size() > MAX_TAGS) {
    throw ProtocolError(ErrorCode::INVALID_REQUEST_FORMAT,
                        "Codec: Too many tags: " + std::to_string(envelope.tags.size()));
  }

  std::size_t total_bytes = 0;

  // Write version and message kind
  uint8_t version = WIRE_VERSION;
  write_bytes(output, &version, sizeof(version));
  total_bytes += sizeof(version);

  uint16_t network_kind = to_network_order(static_cast<uint16_t>(envelope.kind));
  write_bytes(output, &network_kind, sizeof(network_kind));
  total_bytes += sizeof(network_kind);

  total_bytes += write_string<uint32_t>(output, envelope.id);
  total_bytes += write_string<uint32_t>(output, envelope.author);

  uint64_t network_created_at = to_network_order(envelope.created_at);
  write_bytes(output, &network_created_at, sizeof(network_created_at));
  total_bytes += sizeof(network_created_at);

  // Write tags
  uint32_t network_tag_count = to_network_order(static_cast<uint32_t>(envelope.tags.size()));
  write_bytes(output, &network_tag_count, sizeof(network_tag_count));
  total_bytes += sizeof(network_tag_count);
  for (const auto& tag : envelope.tags) {
    total_bytes += write_string<uint32_t>(output, tag.name);
    total_bytes += write_string<uint32_t>(output, tag.value);
  }

  // Write content
  total_bytes += write_string<uint64_t>(output, envelope.content);

  output.flush();
  BOOST_LOG_TRIVIAL(trace) << "Codec: Serialized " << to_string(envelope.kind)
                           << " envelope, total bytes written: " << total_bytes;
  return total_bytes;
}

Envelope Codec::deserialize(std::istream& input) {
  if (!input.good()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Invalid input stream state";
    throw std::runtime_error("Codec: Invalid input stream");
  }

  Envelope envelope;

  uint8_t version;
  read_bytes(input, &version, sizeof(version));
  if (version != WIRE_VERSION) {
    throw ProtocolError(ErrorCode::INVALID_REQUEST_FORMAT,
                        "Codec: Unsupported wire version " + std::to_string(version));
  }

  uint16_t network_kind;
  read_bytes(input, &network_kind, sizeof(network_kind));
  uint16_t kind = from_network_order(network_kind);
  if (!is_known_kind(kind)) {
    throw ProtocolError(ErrorCode::INVALID_REQUEST_FORMAT,
                        "Codec: Unknown message kind " + std::to_string(kind));
  }
  envelope.kind = static_cast<MessageKind>(kind);

  envelope.id = read_string<uint32_t>(input, MAX_FRAME_SIZE);
  envelope.author = read_string<uint32_t>(input, MAX_FRAME_SIZE);

  uint64_t network_created_at;
  read_bytes(input, &network_created_at, sizeof(network_created_at));
  envelope.created_at = from_network_order(network_created_at);

  uint32_t network_tag_count;
  read_bytes(input, &network_tag_count, sizeof(network_tag_count));
  uint32_t tag_count = from_network_order(network_tag_count);
  if (tag_count > MAX_TAGS) {
    throw ProtocolError(ErrorCode::INVALID_REQUEST_FORMAT,
                        "Codec: Too many tags: " + std::to_string(tag_count));
  }

  envelope.tags.reserve(tag_count);
  for (uint32_t i = 0; i < tag_count; ++i) {
    Tag tag;
    tag.name = read_string<uint32_t>(input, MAX_FRAME_SIZE);
    tag.value = read_string<uint32_t>(input, MAX_FRAME_SIZE);
    envelope.tags.push_back(std::move(tag));
  }

  envelope.content = read_string<uint64_t>(input, MAX_FRAME_SIZE);

  BOOST_LOG_TRIVIAL(trace) << "Codec: Deserialized " << to_string(envelope.kind)
                           << " envelope " << envelope.id;
  return envelope;
}

std::string Codec::encode(const Envelope& envelope) {
  std::ostringstream output;
  serialize(envelope, output);
  return output.str();
}

Envelope Codec::decode(const std::string& bytes) {
  std::istringstream input(bytes);
  Envelope envelope = deserialize(input);
  if (input.peek() != std::char_traits<char>::eof()) {
    throw ProtocolError(ErrorCode::INVALID_REQUEST_FORMAT, "Codec: Trailing bytes after envelope");
  }
  return envelope;
}


//==============================================
// FIELD RECORD SERIALIZATION
//==============================================

std::string Codec::encode_fields(const FieldMap& fields) {
  std::ostringstream output;

  uint32_t network_count = to_network_order(static_cast<uint32_t>(fields.size()));
  write_bytes(output, &network_count, sizeof(network_count));

  for (const auto& [key, value] : fields) {
    write_string<uint32_t>(output, key);
    write_string<uint64_t>(output, value);
  }
  return output.str();
}

FieldMap Codec::decode_fields(const std::string& bytes) {
  std::istringstream input(bytes);
  FieldMap fields;

  uint32_t network_count;
  read_bytes(input, &network_count, sizeof(network_count));
  uint32_t count = from_network_order(network_count);
  if (count > MAX_FIELDS) {
    throw ProtocolError(ErrorCode::INVALID_REQUEST_FORMAT,
                        "Codec: Too many fields: " + std::to_string(count));
  }

  for (uint32_t i = 0; i < count; ++i) {
    std::string key = read_string<uint32_t>(input, bytes.size());
    std::string value = read_string<uint64_t>(input, bytes.size());
    if (!fields.emplace(std::move(key), std::move(value)).second) {
      throw ProtocolError(ErrorCode::INVALID_REQUEST_FORMAT, "Codec: Duplicate field in record");
    }
  }

  if (input.peek() != std::char_traits<char>::eof()) {
    throw ProtocolError(ErrorCode::INVALID_REQUEST_FORMAT, "Codec: Trailing bytes after field record");
  }
  return fields;
}


//==============================================
// STREAM OPERATIONS
//==============================================

template <typename LengthType>
std::size_t Codec::write_string(std::ostream& output, const std::string& value) {
  LengthType network_length = to_network_order(static_cast<LengthType>(value.size()));
  write_bytes(output, &network_length, sizeof(network_length));
  write_bytes(output, value.data(), value.size());
  return sizeof(network_length) + value.size();
}

template <typename LengthType>
std::string Codec::read_string(std::istream& input, uint64_t max_size) {
  LengthType network_length;
  read_bytes(input, &network_length, sizeof(network_length));
  uint64_t length = from_network_order(network_length);

  if (length > max_size || length > MAX_FRAME_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Length field " << length << " exceeds limit " << max_size;
    throw ProtocolError(ErrorCode::INVALID_REQUEST_FORMAT,
                        "Codec: Length field exceeds limit: " + std::to_string(length));
  }

  std::string value(static_cast<std::size_t>(length), '\0');
  if (length > 0) {
    read_bytes(input, &value[0], value.size());
  }
  return value;
}

void Codec::write_bytes(std::ostream& output, const void* data, std::size_t size) {
  if (!output.write(static_cast<const char*>(data), size)) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Failed to write " << size << " bytes to output stream";
    throw std::runtime_error("Codec: Failed to write to output stream");
  }
}

void Codec::read_bytes(std::istream& input, void* data, std::size_t size) {
  if (!input.read(static_cast<char*>(data), size)) {
    BOOST_LOG_TRIVIAL(debug) << "Codec: Failed to read " << size << " bytes from input stream";
    throw ProtocolError(ErrorCode::INVALID_REQUEST_FORMAT, "Codec: Truncated input");
  }
}

} // namespace protocol
} // namespace blobdvm

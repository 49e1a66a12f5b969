#ifndef BLOBDVM_PROTOCOL_CODEC_HPP
#define BLOBDVM_PROTOCOL_CODEC_HPP

#include <cstdint>
#include <iostream>
#include <map>
#include <string>
#include <boost/endian/conversion.hpp>
#include "protocol/envelope.hpp"
#include "protocol/error_code.hpp"

namespace blobdvm {
namespace protocol {

// Key/value record carried in request, response and announcement content
using FieldMap = std::map<std::string, std::string>;

class Codec {
public:
  static constexpr uint8_t WIRE_VERSION = 1;
  // Upper bound for any single length field and for a whole frame
  static constexpr uint64_t MAX_FRAME_SIZE = 64ull * 1024 * 1024;
  static constexpr uint32_t MAX_TAGS = 256;
  static constexpr uint32_t MAX_FIELDS = 256;


  // ---- ENVELOPE SERIALIZATION ----
  // Serializes an envelope to an output stream, returns bytes written
  static std::size_t serialize(const Envelope& envelope, std::ostream& output);
  // Deserializes one envelope, throws ProtocolError on malformed input
  static Envelope deserialize(std::istream& input);

  static std::string encode(const Envelope& envelope);
  static Envelope decode(const std::string& bytes);


  // ---- FIELD RECORD SERIALIZATION ----
  static std::string encode_fields(const FieldMap& fields);
  static FieldMap decode_fields(const std::string& bytes);

private:
  // ---- STREAM OPERATIONS ----
  // Writes bytes to an output stream
  static void write_bytes(std::ostream& output, const void* data, std::size_t size);
  // Reads bytes from an input stream
  static void read_bytes(std::istream& input, void* data, std::size_t size);

  // Length-prefixed strings, prefix width given by the LengthType
  template <typename LengthType>
  static std::size_t write_string(std::ostream& output, const std::string& value);
  template <typename LengthType>
  static std::string read_string(std::istream& input, uint64_t max_size);


  // ---- HOST TO NETWORK BYTE ORDER CONVERSION ----
  template <typename T>
  static T to_network_order(T host_value) {
    return boost::endian::native_to_big(host_value);
  }


  // ---- NETWORK TO HOST BYTE ORDER CONVERSION ----
  template <typename T>
  static T from_network_order(T network_value) {
    return boost::endian::big_to_native(network_value);
  }
};

} // namespace protocol
} // namespace blobdvm

#endif // BLOBDVM_PROTOCOL_CODEC_HPP

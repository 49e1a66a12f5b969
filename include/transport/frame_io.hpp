#ifndef BLOBDVM_TRANSPORT_FRAME_IO_HPP
#define BLOBDVM_TRANSPORT_FRAME_IO_HPP

#include <array>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>
#include <boost/asio.hpp>
#include <boost/endian/conversion.hpp>

namespace blobdvm {
namespace transport {

// Socket frames are a big-endian u64 payload size followed by the payload
static constexpr std::size_t FRAME_HEADER_SIZE = sizeof(uint64_t);

using FrameHeader = std::array<uint8_t, FRAME_HEADER_SIZE>;

inline FrameHeader encode_frame_header(uint64_t payload_size) {
    FrameHeader header;
    uint64_t network_size = boost::endian::native_to_big(payload_size);
    std::memcpy(header.data(), &network_size, sizeof(network_size));
    return header;
}

inline uint64_t decode_frame_header(const FrameHeader& header) {
    uint64_t network_size;
    std::memcpy(&network_size, header.data(), sizeof(network_size));
    return boost::endian::big_to_native(network_size);
}

// Blocking write of one frame; throws boost::system::system_error
inline void write_frame(boost::asio::ip::tcp::socket& socket, const std::string& payload) {
    FrameHeader header = encode_frame_header(payload.size());
    std::vector<boost::asio::const_buffer> buffers{
        boost::asio::buffer(header),
        boost::asio::buffer(payload)
    };
    boost::asio::write(socket, buffers);
}

} // namespace transport
} // namespace blobdvm

#endif // BLOBDVM_TRANSPORT_FRAME_IO_HPP

#ifndef BLOBDVM_CRYPTO_DIGEST_HPP
#define BLOBDVM_CRYPTO_DIGEST_HPP

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include "crypto/crypto_error.hpp"

namespace blobdvm::crypto {

static constexpr std::size_t DIGEST_SIZE = 32;      // SHA-256
static constexpr std::size_t DIGEST_HEX_SIZE = 64;

using Digest = std::array<uint8_t, DIGEST_SIZE>;


// ---- HASHING ----
// SHA-256 of a byte range using OpenSSL EVP
Digest sha256(const void* data, std::size_t size);
Digest sha256(std::string_view data);


// ---- HEX ENCODING ----
// Lowercase hexadecimal representation
std::string to_hex(const Digest& digest);
// Parses exactly 64 hex characters, throws EncodingError otherwise
Digest digest_from_hex(std::string_view hex);
// True if hex is 64 lowercase hexadecimal characters
bool is_valid_hex_digest(std::string_view hex);


// ---- RANDOM IDENTIFIERS ----
// Random 256-bit token rendered as hex, used for message ids and identities
std::string random_hex_id();

} // namespace blobdvm::crypto

#endif // BLOBDVM_CRYPTO_DIGEST_HPP

#include "crypto/digest.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <boost/log/trivial.hpp>
#include <iomanip>
#include <sstream>

namespace blobdvm::crypto {

//==============================================
// RAII WRAPPER FOR DIGEST CONTEXT
//==============================================

namespace {

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw DigestError("Failed to create hash context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  DigestContext(const DigestContext&) = delete;
  DigestContext& operator=(const DigestContext&) = delete;

  EVP_MD_CTX* get() { return ctx; }
};

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  return -1;
}

} // namespace


//==============================================
// HASHING
//==============================================

Digest sha256(const void* data, std::size_t size) {
  DigestContext context;

  // Initialize the context with SHA-256 algorithm
  if (!EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr)) {
    throw DigestError("Failed to initialize hash context");
  }

  if (size > 0 && !EVP_DigestUpdate(context.get(), data, size)) {
    throw DigestError("Failed to update hash");
  }

  Digest digest{};
  unsigned int digest_len = 0;
  if (!EVP_DigestFinal_ex(context.get(), digest.data(), &digest_len)) {
    throw DigestError("Failed to finalize hash");
  }

  if (digest_len != DIGEST_SIZE) {
    throw DigestError("Unexpected digest length: " + std::to_string(digest_len));
  }

  return digest;
}

Digest sha256(std::string_view data) {
  return sha256(data.data(), data.size());
}


//==============================================
// HEX ENCODING
//==============================================

std::string to_hex(const Digest& digest) {
  std::stringstream ss;
  for (uint8_t byte : digest) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(byte);
  }
  return ss.str();
}

bool is_valid_hex_digest(std::string_view hex) {
  if (hex.size() != DIGEST_HEX_SIZE) {
    return false;
  }
  for (char c : hex) {
    if (hex_value(c) < 0) {
      return false;
    }
  }
  return true;
}

Digest digest_from_hex(std::string_view hex) {
  if (!is_valid_hex_digest(hex)) {
    throw EncodingError("Invalid SHA-256 hex digest: '" + std::string(hex) + "'");
  }

  Digest digest{};
  for (std::size_t i = 0; i < DIGEST_SIZE; ++i) {
    digest[i] = static_cast<uint8_t>((hex_value(hex[2 * i]) << 4) | hex_value(hex[2 * i + 1]));
  }
  return digest;
}


//==============================================
// RANDOM IDENTIFIERS
//==============================================

std::string random_hex_id() {
  Digest bytes{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    BOOST_LOG_TRIVIAL(error) << "Digest: Failed to generate random identifier";
    throw CryptoError("Failed to generate random identifier");
  }
  return to_hex(bytes);
}

} // namespace blobdvm::crypto

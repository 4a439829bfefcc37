#ifndef FRAGNET_CRYPTO_HASHER_HPP
#define FRAGNET_CRYPTO_HASHER_HPP

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include "crypto_error.hpp"

namespace fragnet::crypto {

class Hasher {
public:
  // Length of a hex encoded SHA-256 digest
  static constexpr std::size_t HEX_DIGEST_SIZE = 64;

  // ---- DIGEST OPERATIONS ----
  // Lowercase hex SHA-256 of a byte range, throws HashError on OpenSSL failure
  static std::string sha256_hex(const uint8_t* data, std::size_t size);
  static std::string sha256_hex(const std::vector<uint8_t>& data);
  static std::string sha256_hex(const std::string& data);

  // ---- VALIDATION ----
  // True if value looks like a digest produced by sha256_hex
  static bool is_hex_digest(const std::string& value);

private:
  static std::string to_hex(const unsigned char* bytes, unsigned int length);
};

} // namespace fragnet::crypto

#endif // FRAGNET_CRYPTO_HASHER_HPP

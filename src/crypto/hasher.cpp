#include "crypto/hasher.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <memory>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace fragnet::crypto {

//==============================================
// RAII WRAPPER FOR THE DIGEST CONTEXT
//==============================================

namespace {

struct DigestContextDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

} // namespace

//==============================================
// DIGEST OPERATIONS
//==============================================

std::string Hasher::sha256_hex(const uint8_t* data, std::size_t size) {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;

  // Create a new message digest context for the hashing operation
  DigestContext ctx(EVP_MD_CTX_new());
  if (!ctx) {
    BOOST_LOG_TRIVIAL(error) << "Hasher: Failed to create hash context";
    throw HashError("Failed to create hash context");
  }

  if (!EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr)) {
    throw HashError("Failed to initialize hash context");
  }

  // An empty range still produces the digest of the empty string
  if (size > 0 && !EVP_DigestUpdate(ctx.get(), data, size)) {
    throw HashError("Failed to update hash");
  }

  if (!EVP_DigestFinal_ex(ctx.get(), hash, &hash_len)) {
    throw HashError("Failed to finalize hash");
  }

  return to_hex(hash, hash_len);
}

std::string Hasher::sha256_hex(const std::vector<uint8_t>& data) {
  return sha256_hex(data.data(), data.size());
}

std::string Hasher::sha256_hex(const std::string& data) {
  return sha256_hex(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

//==============================================
// VALIDATION
//==============================================

bool Hasher::is_hex_digest(const std::string& value) {
  if (value.size() != HEX_DIGEST_SIZE) {
    return false;
  }
  for (char c : value) {
    bool digit = c >= '0' && c <= '9';
    bool lower_hex = c >= 'a' && c <= 'f';
    if (!digit && !lower_hex) {
      return false;
    }
  }
  return true;
}

std::string Hasher::to_hex(const unsigned char* bytes, unsigned int length) {
  std::stringstream ss;
  for (unsigned int i = 0; i < length; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') 
       << static_cast<int>(bytes[i]);
  }
  return ss.str();
}

} // namespace fragnet::crypto

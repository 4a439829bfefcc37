#ifndef FRAGNET_CRYPTO_ERROR_HPP
#define FRAGNET_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace fragnet::crypto {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message) 
        : std::runtime_error(message) {}
};

class HashError : public CryptoError {
public:
    explicit HashError(const std::string& message) 
        : CryptoError("Hash error: " + message) {}
};

} // namespace fragnet::crypto

#endif // FRAGNET_CRYPTO_ERROR_HPP

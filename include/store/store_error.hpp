#ifndef FRAGNET_STORE_ERROR_HPP
#define FRAGNET_STORE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace fragnet {
namespace store {

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

// Data offered under a hash it does not hash to
class HashMismatchError : public StoreError {
public:
  explicit HashMismatchError(const std::string& message) 
    : StoreError("Hash mismatch: " + message) {}
};

} // namespace store
} // namespace fragnet

#endif // FRAGNET_STORE_ERROR_HPP

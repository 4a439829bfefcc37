#ifndef FRAGNET_FRAGMENT_ERROR_HPP
#define FRAGNET_FRAGMENT_ERROR_HPP

#include <stdexcept>
#include <string>

namespace fragnet {
namespace fragment {

class FragmentError : public std::runtime_error {
public:
  explicit FragmentError(const std::string& message) 
    : std::runtime_error(message) {}
};

// Local file could not be read
class ReadError : public FragmentError {
public:
  explicit ReadError(const std::string& message) 
    : FragmentError("Read error: " + message) {}
};

// Reassembled file could not be written
class WriteError : public FragmentError {
public:
  explicit WriteError(const std::string& message) 
    : FragmentError("Write error: " + message) {}
};

// A fragment's data does not hash to its declared hash
class IntegrityError : public FragmentError {
public:
  explicit IntegrityError(const std::string& message) 
    : FragmentError("Integrity error: " + message) {}
};

// Missing, duplicate or miscounted fragments
class IncompleteError : public FragmentError {
public:
  explicit IncompleteError(const std::string& message) 
    : FragmentError("Incomplete error: " + message) {}
};

} // namespace fragment
} // namespace fragnet

#endif // FRAGNET_FRAGMENT_ERROR_HPP

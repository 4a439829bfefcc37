#ifndef FRAGNET_INDEX_ERROR_HPP
#define FRAGNET_INDEX_ERROR_HPP

#include <stdexcept>
#include <string>

namespace fragnet {
namespace index {

// Transport failure of the distributed index itself
class IndexError : public std::runtime_error {
public:
  explicit IndexError(const std::string& message) : std::runtime_error(message) {}
};

class PublishError : public IndexError {
public:
  explicit PublishError(const std::string& message) 
    : IndexError("Publish error: " + message) {}
};

class ResolveError : public IndexError {
public:
  explicit ResolveError(const std::string& message) 
    : IndexError("Resolve error: " + message) {}
};

} // namespace index
} // namespace fragnet

#endif // FRAGNET_INDEX_ERROR_HPP

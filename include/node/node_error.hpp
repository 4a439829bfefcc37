#ifndef FRAGNET_NODE_ERROR_HPP
#define FRAGNET_NODE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace fragnet {
namespace node {

class NodeError : public std::runtime_error {
public:
  explicit NodeError(const std::string& message) : std::runtime_error(message) {}
};

// The upload sequence did not complete. When locally_stored() is true the fragments
// and catalog entry exist and are servable by hash, but the file was not published
// and other nodes cannot find it by name.
class UploadError : public NodeError {
public:
  UploadError(const std::string& message, bool locally_stored)
    : NodeError("Upload error: " + message)
    , locally_stored_(locally_stored) {}

  bool locally_stored() const { return locally_stored_; }

private:
  bool locally_stored_;
};

// The filename resolves to nothing in the distributed index
class FileNotFoundError : public NodeError {
public:
  explicit FileNotFoundError(const std::string& filename)
    : NodeError("File not found: " + filename) {}
};

// Every candidate holder of a fragment was tried without success
class FragmentUnavailableError : public NodeError {
public:
  explicit FragmentUnavailableError(const std::string& hash)
    : NodeError("Fragment unavailable: " + hash)
    , hash_(hash) {}

  const std::string& hash() const { return hash_; }

private:
  std::string hash_;
};

} // namespace node
} // namespace fragnet

#endif // FRAGNET_NODE_ERROR_HPP

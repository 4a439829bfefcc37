#ifndef FRAGNET_MEMORY_INDEX_HPP
#define FRAGNET_MEMORY_INDEX_HPP

#include <shared_mutex>
#include <unordered_map>
#include "index/distributed_index.hpp"

namespace fragnet {
namespace index {

// In-process index. Shared between nodes of one process, or hosted for remote
// nodes by IndexServer.
class MemoryIndex : public DistributedIndex {
public:
  MemoryIndex() = default;

  void put(const std::string& key, const Bytes& value) override;
  std::optional<Bytes> get(const std::string& key) override;

  std::size_t size() const;

private:
  std::unordered_map<std::string, Bytes> entries_;
  mutable std::shared_mutex mutex_;
};

} // namespace index
} // namespace fragnet

#endif // FRAGNET_MEMORY_INDEX_HPP

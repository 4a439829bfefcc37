#ifndef FRAGNET_DISTRIBUTED_INDEX_HPP
#define FRAGNET_DISTRIBUTED_INDEX_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "index/index_error.hpp"

namespace fragnet {
namespace index {

using Bytes = std::vector<uint8_t>;

// Key-value directory shared by the peer population. Eventually consistent,
// best effort. Implementations throw IndexError on transport failure.
class DistributedIndex {
public:
  virtual ~DistributedIndex() = default;

  virtual void put(const std::string& key, const Bytes& value) = 0;
  // nullopt when nothing was ever stored under key
  virtual std::optional<Bytes> get(const std::string& key) = 0;

protected:
  DistributedIndex() = default;
};

} // namespace index
} // namespace fragnet

#endif // FRAGNET_DISTRIBUTED_INDEX_HPP

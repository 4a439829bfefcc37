#include "index/memory_index.hpp"
#include <mutex>
#include <boost/log/trivial.hpp>

namespace fragnet {
namespace index {

void MemoryIndex::put(const std::string& key, const Bytes& value) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  entries_[key] = value;
  BOOST_LOG_TRIVIAL(trace) << "Memory index: Stored " << value.size() << " bytes under " << key;
}

std::optional<Bytes> MemoryIndex::get(const std::string& key) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t MemoryIndex::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entries_.size();
}

} // namespace index
} // namespace fragnet

#include "store/file_catalog.hpp"
#include <mutex>
#include <boost/log/trivial.hpp>

namespace fragnet {
namespace store {

void FileCatalog::put(const std::string& filename, const fragment::FileInfo& info) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  bool replaced = files_.count(filename) > 0;
  files_[filename] = info;
  BOOST_LOG_TRIVIAL(debug) << "File catalog: " << (replaced ? "Replaced " : "Added ") << filename
                           << " with " << info.total_fragments << " fragments";
}

std::optional<fragment::FileInfo> FileCatalog::get(const std::string& filename) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = files_.find(filename);
  if (it == files_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<std::string> FileCatalog::list() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<std::string> names;
  names.reserve(files_.size());
  for (const auto& entry : files_) {
    names.push_back(entry.first);
  }
  return names;
}

std::size_t FileCatalog::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return files_.size();
}

} // namespace store
} // namespace fragnet

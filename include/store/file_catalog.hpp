#ifndef FRAGNET_FILE_CATALOG_HPP
#define FRAGNET_FILE_CATALOG_HPP

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include "fragment/fragment.hpp"

namespace fragnet {
namespace store {

// Local record of files this node has fragmented, keyed by filename
class FileCatalog {
public:
  FileCatalog() = default;
  FileCatalog(const FileCatalog&) = delete;
  FileCatalog& operator=(const FileCatalog&) = delete;

  // Replaces any previous entry for the same filename
  void put(const std::string& filename, const fragment::FileInfo& info);
  std::optional<fragment::FileInfo> get(const std::string& filename) const;

  // Sorted filenames
  std::vector<std::string> list() const;
  std::size_t size() const;

private:
  std::map<std::string, fragment::FileInfo> files_;
  mutable std::shared_mutex mutex_;
};

} // namespace store
} // namespace fragnet

#endif // FRAGNET_FILE_CATALOG_HPP

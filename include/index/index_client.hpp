#ifndef FRAGNET_INDEX_CLIENT_HPP
#define FRAGNET_INDEX_CLIENT_HPP

#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "fragment/fragment.hpp"
#include "index/distributed_index.hpp"
#include "network/types.hpp"

namespace fragnet {
namespace index {

// Publishes and resolves file metadata and fragment provider records through the
// distributed index. Callers needing to tell apart unrelated files with the same
// name must namespace the filenames themselves.
class IndexClient {
public:
  explicit IndexClient(DistributedIndex& index);

  // ---- CONTENT IDENTIFIERS ----
  // "file/" + sha256_hex(filename)
  static std::string content_id(const std::string& filename);
  // "providers/" + fragment hash
  static std::string provider_key(const std::string& hash);


  // ---- FILE METADATA ----
  // Throws PublishError wrapping any index or encoding failure
  void publish(const std::string& filename, const fragment::FileInfo& info);
  // nullopt if never published. Throws ResolveError on transport failure or a
  // record that does not decode to a FileInfo for filename.
  std::optional<fragment::FileInfo> resolve(const std::string& filename);


  // ---- PROVIDER RECORDS ----
  // Adds provider to the holders of hash, throws PublishError
  void announce_provider(const std::string& hash, const network::PeerAddress& provider);
  // Known holders of hash in announcement order, throws ResolveError
  std::vector<network::PeerAddress> find_providers(const std::string& hash);

private:
  DistributedIndex& index_;
  // Serializes this node's read-modify-write of provider records
  std::mutex announce_mutex_;
};

} // namespace index
} // namespace fragnet

#endif // FRAGNET_INDEX_CLIENT_HPP

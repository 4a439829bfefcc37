#ifndef FRAGNET_PROVIDER_LOCATOR_HPP
#define FRAGNET_PROVIDER_LOCATOR_HPP

#include <mutex>
#include <string>
#include <vector>
#include "index/index_client.hpp"
#include "network/types.hpp"

namespace fragnet {
namespace node {

// Supplies the peers worth asking for a fragment, in the order to try them
class ProviderLocator {
public:
  virtual ~ProviderLocator() = default;
  virtual std::vector<network::PeerAddress> candidates(const std::string& hash) = 0;

protected:
  ProviderLocator() = default;
};

// Provider records from the index first, then statically configured peers
class IndexProviderLocator : public ProviderLocator {
public:
  explicit IndexProviderLocator(index::IndexClient& index_client);

  std::vector<network::PeerAddress> candidates(const std::string& hash) override;

  void add_static_peer(const network::PeerAddress& peer);
  std::vector<network::PeerAddress> static_peers() const;

private:
  index::IndexClient& index_client_;
  std::vector<network::PeerAddress> static_peers_;
  mutable std::mutex mutex_;
};

} // namespace node
} // namespace fragnet

#endif // FRAGNET_PROVIDER_LOCATOR_HPP

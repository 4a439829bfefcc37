#include "node/provider_locator.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace fragnet {
namespace node {

IndexProviderLocator::IndexProviderLocator(index::IndexClient& index_client)
  : index_client_(index_client) {
}

std::vector<network::PeerAddress> IndexProviderLocator::candidates(const std::string& hash) {
  std::vector<network::PeerAddress> result;

  try {
    result = index_client_.find_providers(hash);
  } catch (const index::ResolveError& e) {
    // Static peers may still hold the fragment
    BOOST_LOG_TRIVIAL(warning) << "Provider locator: Provider lookup for " << hash << " failed: " << e.what();
  }

  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& peer : static_peers_) {
    if (std::find(result.begin(), result.end(), peer) == result.end()) {
      result.push_back(peer);
    }
  }

  BOOST_LOG_TRIVIAL(trace) << "Provider locator: " << result.size() << " candidates for " << hash;
  return result;
}

void IndexProviderLocator::add_static_peer(const network::PeerAddress& peer) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (std::find(static_peers_.begin(), static_peers_.end(), peer) == static_peers_.end()) {
    static_peers_.push_back(peer);
    BOOST_LOG_TRIVIAL(info) << "Provider locator: Added static peer " << peer.to_string();
  }
}

std::vector<network::PeerAddress> IndexProviderLocator::static_peers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_peers_;
}

} // namespace node
} // namespace fragnet

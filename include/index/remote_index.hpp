#ifndef FRAGNET_REMOTE_INDEX_HPP
#define FRAGNET_REMOTE_INDEX_HPP

#include "index/distributed_index.hpp"
#include "network/message_frame.hpp"
#include "network/tcp_server.hpp"

namespace fragnet {
namespace index {

// Index hosted by another node's IndexServer
class RemoteIndex : public DistributedIndex {
public:
  RemoteIndex(const network::TCP_Server& transport, const network::PeerAddress& index_peer);

  void put(const std::string& key, const Bytes& value) override;
  std::optional<Bytes> get(const std::string& key) override;

private:
  const network::TCP_Server& transport_;
  network::PeerAddress index_peer_;

  // One request/response exchange, any network failure becomes IndexError
  network::IndexResponse exchange(const network::IndexRequest& request);
};

} // namespace index
} // namespace fragnet

#endif // FRAGNET_REMOTE_INDEX_HPP

#ifndef FRAGNET_INDEX_SERVER_HPP
#define FRAGNET_INDEX_SERVER_HPP

#include <string>
#include "index/distributed_index.hpp"
#include "network/stream.hpp"

namespace fragnet {
namespace index {

// Protocol spoken between RemoteIndex and IndexServer
inline const std::string INDEX_PROTOCOL_ID = "/fragnet/index/1.0.0";

// Serves a local index to remote nodes, one request per stream
class IndexServer {
public:
  explicit IndexServer(DistributedIndex& backing);

  // Inbound handler, register with TCP_Server under INDEX_PROTOCOL_ID
  void handle_stream(network::Stream& stream);

private:
  DistributedIndex& backing_;
};

} // namespace index
} // namespace fragnet

#endif // FRAGNET_INDEX_SERVER_HPP

#include "index/index_server.hpp"
#include "network/codec.hpp"
#include <boost/log/trivial.hpp>

namespace fragnet {
namespace index {

IndexServer::IndexServer(DistributedIndex& backing) : backing_(backing) {
}

void IndexServer::handle_stream(network::Stream& stream) {
  network::IndexRequest request;
  try {
    request = network::Codec::decode<network::IndexRequest>(stream.read_frame());
  } catch (const network::NetworkException& e) {
    // No error frame in the protocol, drop the stream
    BOOST_LOG_TRIVIAL(warning) << "Index server: Dropping malformed request from "
                               << stream.remote_endpoint() << ": " << e.what();
    stream.close();
    return;
  }

  network::IndexResponse response;
  try {
    if (request.operation == network::IndexOperation::PUT) {
      backing_.put(request.key, request.value);
      response.status = network::IndexStatus::OK;
      BOOST_LOG_TRIVIAL(debug) << "Index server: Stored " << request.value.size() << " bytes under "
                               << request.key << " for " << stream.remote_endpoint();
    } else {
      auto value = backing_.get(request.key);
      if (value) {
        response.status = network::IndexStatus::OK;
        response.value = std::move(*value);
      } else {
        response.status = network::IndexStatus::NOT_FOUND;
      }
      BOOST_LOG_TRIVIAL(debug) << "Index server: Lookup of " << request.key << " for "
                               << stream.remote_endpoint() << ": "
                               << (response.status == network::IndexStatus::OK ? "found" : "not found");
    }
  } catch (const IndexError& e) {
    BOOST_LOG_TRIVIAL(error) << "Index server: Backing index failed: " << e.what();
    response.status = network::IndexStatus::FAILED;
    response.value.clear();
  }

  stream.write_frame(network::Codec::encode(response));
  stream.close();
}

} // namespace index
} // namespace fragnet

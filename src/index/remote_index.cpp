#include "index/remote_index.hpp"
#include "index/index_server.hpp"
#include "network/codec.hpp"
#include <boost/log/trivial.hpp>

namespace fragnet {
namespace index {

RemoteIndex::RemoteIndex(const network::TCP_Server& transport, const network::PeerAddress& index_peer)
  : transport_(transport)
  , index_peer_(index_peer) {
  BOOST_LOG_TRIVIAL(info) << "Remote index: Using index hosted at " << index_peer_.to_string();
}

void RemoteIndex::put(const std::string& key, const Bytes& value) {
  network::IndexRequest request;
  request.operation = network::IndexOperation::PUT;
  request.key = key;
  request.value = value;

  network::IndexResponse response = exchange(request);
  if (response.status != network::IndexStatus::OK) {
    throw IndexError("index at " + index_peer_.to_string() + " rejected put of " + key);
  }
}

std::optional<Bytes> RemoteIndex::get(const std::string& key) {
  network::IndexRequest request;
  request.operation = network::IndexOperation::GET;
  request.key = key;

  network::IndexResponse response = exchange(request);
  switch (response.status) {
    case network::IndexStatus::OK:
      return std::move(response.value);
    case network::IndexStatus::NOT_FOUND:
      return std::nullopt;
    default:
      throw IndexError("index at " + index_peer_.to_string() + " failed lookup of " + key);
  }
}

network::IndexResponse RemoteIndex::exchange(const network::IndexRequest& request) {
  try {
    auto stream = transport_.open_stream(index_peer_, INDEX_PROTOCOL_ID);
    stream->write_frame(network::Codec::encode(request));
    auto response = network::Codec::decode<network::IndexResponse>(stream->read_frame());
    stream->close();
    return response;
  } catch (const network::NetworkException& e) {
    BOOST_LOG_TRIVIAL(error) << "Remote index: Exchange with " << index_peer_.to_string()
                             << " failed: " << e.what();
    throw IndexError("index at " + index_peer_.to_string() + " unavailable: " + e.what());
  }
}

} // namespace index
} // namespace fragnet

#include "exchange/fragment_exchange.hpp"
#include "network/codec.hpp"
#include <boost/log/trivial.hpp>

namespace fragnet {
namespace exchange {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

FragmentExchange::FragmentExchange(store::FragmentStore& store, const network::TCP_Server& transport)
  : store_(store)
  , transport_(transport) {
}

//==============================================
// SERVER SIDE
//==============================================

void FragmentExchange::handle_stream(network::Stream& stream) {
  network::FragmentRequest request;
  try {
    request = network::Codec::decode<network::FragmentRequest>(stream.read_frame());
  } catch (const network::NetworkException& e) {
    ++requests_rejected_;
    BOOST_LOG_TRIVIAL(warning) << "Fragment exchange: Dropping malformed request from "
                               << stream.remote_endpoint() << ": " << e.what();
    stream.close();
    return;
  }

  network::FragmentResponse response;
  response.hash = request.hash;

  auto data = store_.get(request.hash);
  if (data) {
    response.data = std::move(*data);
    response.found = true;
    ++fragments_served_;
  } else {
    ++requests_missed_;
  }

  BOOST_LOG_TRIVIAL(debug) << "Fragment exchange: Request from " << stream.remote_endpoint() << " for "
                           << request.hash << ": "
                           << (response.found ? std::to_string(response.data.size()) + " bytes" : "not found");

  stream.write_frame(network::Codec::encode(response));
  stream.close();
}

//==============================================
// CLIENT SIDE
//==============================================

network::FragmentResponse FragmentExchange::request(const network::PeerAddress& peer,
                                                    const std::string& hash) const {
  BOOST_LOG_TRIVIAL(debug) << "Fragment exchange: Requesting " << hash << " from " << peer.to_string();

  auto stream = transport_.open_stream(peer, FRAGMENT_PROTOCOL_ID);

  network::FragmentRequest request;
  request.hash = hash;

  network::Bytes frame;
  try {
    stream->write_frame(network::Codec::encode(request));
    frame = stream->read_frame();
  } catch (const network::ProtocolError&) {
    throw;
  } catch (const network::NetworkException& e) {
    // Timeouts and dropped connections mean this peer cannot serve us right now
    throw network::PeerUnreachableError("exchange with " + peer.to_string() + " failed: " + e.what());
  }
  stream->close();

  auto response = network::Codec::decode<network::FragmentResponse>(frame);
  if (response.hash != hash) {
    BOOST_LOG_TRIVIAL(warning) << "Fragment exchange: " << peer.to_string() << " answered for "
                               << response.hash << " instead of " << hash;
    throw network::ProtocolError("response from " + peer.to_string() + " echoes a different hash");
  }

  return response;
}

} // namespace exchange
} // namespace fragnet

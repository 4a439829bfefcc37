#ifndef FRAGNET_FRAGMENT_EXCHANGE_HPP
#define FRAGNET_FRAGMENT_EXCHANGE_HPP

#include <atomic>
#include <string>
#include "network/message_frame.hpp"
#include "network/stream.hpp"
#include "network/tcp_server.hpp"
#include "store/fragment_store.hpp"

namespace fragnet {
namespace exchange {

inline const std::string FRAGMENT_PROTOCOL_ID = "/fragnet/fragment/1.0.0";

// Request/response fetch of single fragments, one stream per request
class FragmentExchange {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  FragmentExchange(store::FragmentStore& store, const network::TCP_Server& transport);

  FragmentExchange(const FragmentExchange&) = delete;
  FragmentExchange& operator=(const FragmentExchange&) = delete;


  // ---- SERVER SIDE ----
  // Decodes one request, answers from the local store and closes the stream.
  // A request that fails to decode is logged and dropped without a response.
  void handle_stream(network::Stream& stream);


  // ---- CLIENT SIDE ----
  // Asks peer for hash. found == false is a normal answer, not an error.
  // Throws PeerUnreachableError if the stream cannot be opened or times out,
  // ProtocolError if the response is malformed or answers a different hash.
  network::FragmentResponse request(const network::PeerAddress& peer, const std::string& hash) const;


  // ---- STATISTICS ----
  uint64_t fragments_served() const { return fragments_served_; }
  uint64_t requests_missed() const { return requests_missed_; }
  uint64_t requests_rejected() const { return requests_rejected_; }

private:
  // ---- PARAMETERS ----
  store::FragmentStore& store_;
  const network::TCP_Server& transport_;

  std::atomic<uint64_t> fragments_served_{0};
  std::atomic<uint64_t> requests_missed_{0};
  std::atomic<uint64_t> requests_rejected_{0};
};

} // namespace exchange
} // namespace fragnet

#endif // FRAGNET_FRAGMENT_EXCHANGE_HPP

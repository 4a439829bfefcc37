#ifndef FRAGNET_NETWORK_TCP_SERVER_HPP
#define FRAGNET_NETWORK_TCP_SERVER_HPP

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <boost/asio.hpp>
#include <boost/asio/thread_pool.hpp>
#include "network/stream.hpp"
#include "network/tcp_stream.hpp"
#include "network/types.hpp"

namespace fragnet {
namespace network {

// Accepts inbound streams and hands each one, after its protocol handshake, to the
// handler registered for that protocol. Each stream runs on a pool worker, so many
// handlers execute at the same time.
class TCP_Server {
public:
  using StreamHandler = std::function<void(Stream&)>;

  static constexpr std::size_t DEFAULT_WORKER_COUNT = 16;

  TCP_Server(const TCP_Server&) = delete;
  TCP_Server& operator=(const TCP_Server&) = delete;


  // -- CONSTRUCTOR AND DESTRUCTOR ----
  TCP_Server(uint16_t port, const std::string& address,
             std::chrono::milliseconds timeout,
             std::size_t worker_count = DEFAULT_WORKER_COUNT);
  ~TCP_Server();

  
  // ---- INITIALIZATION AND TEARDOWN ----
  bool start_listener();
  void shutdown();
  bool is_running() const { return is_running_; }

  
  // ---- PROTOCOL REGISTRATION ----
  // Registers handler for streams opened with protocol_id, replacing any previous one
  void set_handler(const std::string& protocol_id, StreamHandler handler);

  
  // ---- CONNECTION INITIATION ----
  // Connects to peer and performs the handshake for protocol_id.
  // Throws PeerUnreachableError if the stream cannot be opened.
  std::unique_ptr<Stream> open_stream(const PeerAddress& peer, const std::string& protocol_id) const;

  
  // ---- GETTERS ----
  // Bound port, differs from the configured one when that was 0
  uint16_t local_port() const { return bound_port_; }
  PeerAddress local_address() const { return PeerAddress{address_, bound_port_}; }
  std::chrono::milliseconds timeout() const { return timeout_; }

private:
  // ---- PARAMETERS ----
  // Network Parameters
  const uint16_t port_;
  const std::string address_;
  const std::chrono::milliseconds timeout_;
  const std::size_t worker_count_;
  std::atomic<uint16_t> bound_port_{0};

  // Server state
  std::unique_ptr<std::thread> io_thread_;
  std::atomic<bool> is_running_{false};

  // Incoming connection handlers
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  std::unique_ptr<boost::asio::thread_pool> workers_;

  // Registered protocols
  std::map<std::string, StreamHandler> handlers_;
  mutable std::mutex handlers_mutex_;

  
  // ---- INITIALIZATION AND TEARDOWN ----
  // Main listening loop that handles incoming connections
  void start_accept();

  
  // ---- HANDSHAKE RECEPTION ----
  // Reads the protocol id and runs the matching handler, runs on a pool worker
  void receive_handshake(std::shared_ptr<TCP_Stream> stream);
  StreamHandler find_handler(const std::string& protocol_id) const;
};

} // namespace network
} // namespace fragnet

#endif // FRAGNET_NETWORK_TCP_SERVER_HPP

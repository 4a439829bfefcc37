#include "network/tcp_server.hpp"
#include "network/codec.hpp"
#include <boost/log/trivial.hpp>

namespace fragnet {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TCP_Server::TCP_Server(uint16_t port, const std::string& address,
                       std::chrono::milliseconds timeout, std::size_t worker_count)
  : port_(port)
  , address_(address)
  , timeout_(timeout)
  , worker_count_(worker_count == 0 ? 1 : worker_count) {
  BOOST_LOG_TRIVIAL(info) << "TCP server: Initializing TCP server on " << address << ":" << port;
}

TCP_Server::~TCP_Server() {
  shutdown();
}

//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool TCP_Server::start_listener() {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "TCP server: Server already running";
    return false;
  }

  try {
    // Create endpoint
    boost::asio::ip::tcp::endpoint endpoint(
      boost::asio::ip::make_address(address_),
      port_
    );

    io_context_.restart();

    // Create acceptor
    acceptor_ = std::make_unique<boost::asio::ip::tcp::acceptor>(io_context_);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen();
    bound_port_ = acceptor_->local_endpoint().port();

    workers_ = std::make_unique<boost::asio::thread_pool>(worker_count_);
    is_running_ = true;

    // Start accepting connections
    BOOST_LOG_TRIVIAL(debug) << "TCP server: Starting to accept connections";
    start_accept();

    // Start io_context in a separate thread
    io_thread_ = std::make_unique<std::thread>([this]() {
      try {
        auto work_guard = boost::asio::make_work_guard(io_context_);
        io_context_.run();
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "TCP server: IO context error: " << e.what();
        is_running_ = false;
      }
    });

    BOOST_LOG_TRIVIAL(info) << "TCP server: Server started successfully on " << address_ << ":" << bound_port_;
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "TCP server: Failed to start server: " << e.what();
    acceptor_.reset();
    workers_.reset();
    return false;
  }
}

void TCP_Server::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  // Each inbound connection gets its own stream with a private io_context
  auto stream = std::make_shared<TCP_Stream>(timeout_);

  acceptor_->async_accept(stream->get_socket(),
    [this, stream](const boost::system::error_code& error) {
      if (!error) {
        stream->on_accepted();
        BOOST_LOG_TRIVIAL(debug) << "TCP server: Accepted connection from " << stream->remote_endpoint();
        boost::asio::post(*workers_, [this, stream]() { receive_handshake(stream); });
      } else if (error == boost::asio::error::operation_aborted) {
        return;
      } else {
        BOOST_LOG_TRIVIAL(error) << "TCP server: Accept error: " << error.message();
      }
      start_accept();  // Continue accepting new connections
    });
}

void TCP_Server::shutdown() {
  if (!is_running_.exchange(false)) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "TCP server: Initiating server shutdown";

  // Stop accepting new connections
  if (acceptor_ && acceptor_->is_open()) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "TCP server: Error closing acceptor: " << ec.message();
    }
  }

  // Stop io_context
  io_context_.stop();

  // Wait for io_thread to finish
  if (io_thread_ && io_thread_->joinable()) {
    io_thread_->join();
  }
  io_thread_.reset();

  // In-flight handlers are bounded by the stream timeout
  if (workers_) {
    workers_->join();
    workers_.reset();
  }
  acceptor_.reset();

  BOOST_LOG_TRIVIAL(info) << "TCP server: Server shutdown complete";
}

//==============================================
// PROTOCOL REGISTRATION
//==============================================

void TCP_Server::set_handler(const std::string& protocol_id, StreamHandler handler) {
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  handlers_[protocol_id] = std::move(handler);
  BOOST_LOG_TRIVIAL(info) << "TCP server: Registered handler for protocol " << protocol_id;
}

TCP_Server::StreamHandler TCP_Server::find_handler(const std::string& protocol_id) const {
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  auto it = handlers_.find(protocol_id);
  if (it == handlers_.end()) {
    return nullptr;
  }
  return it->second;
}

//==============================================
// HANDSHAKE RECEPTION
//==============================================

void TCP_Server::receive_handshake(std::shared_ptr<TCP_Stream> stream) {
  try {
    Handshake handshake = Codec::decode<Handshake>(stream->read_frame());
    BOOST_LOG_TRIVIAL(debug) << "TCP server: " << stream->remote_endpoint()
                             << " requested protocol " << handshake.protocol_id;

    StreamHandler handler = find_handler(handshake.protocol_id);
    if (!handler) {
      BOOST_LOG_TRIVIAL(warning) << "TCP server: No handler for protocol " << handshake.protocol_id
                                 << " from " << stream->remote_endpoint();
      stream->close();
      return;
    }

    handler(*stream);
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "TCP server: Stream from " << stream->remote_endpoint()
                             << " failed: " << e.what();
  }
  stream->close();
}

//==============================================
// CONNECTION INITIATION
//==============================================

std::unique_ptr<Stream> TCP_Server::open_stream(const PeerAddress& peer, const std::string& protocol_id) const {
  auto stream = std::make_unique<TCP_Stream>(timeout_);
  stream->connect(peer);

  try {
    Handshake handshake;
    handshake.protocol_id = protocol_id;
    stream->write_frame(Codec::encode(handshake));
  } catch (const NetworkException& e) {
    BOOST_LOG_TRIVIAL(error) << "TCP server: Handshake with " << peer.to_string() << " failed: " << e.what();
    throw PeerUnreachableError("handshake with " + peer.to_string() + " failed: " + e.what());
  }

  return stream;
}

} // namespace network
} // namespace fragnet

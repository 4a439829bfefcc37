#include "network/tcp_stream.hpp"
#include <array>
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>

namespace fragnet {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TCP_Stream::TCP_Stream(std::chrono::milliseconds timeout)
  : socket_(io_context_)
  , timeout_(timeout) {
}

TCP_Stream::~TCP_Stream() {
  close();
}

//==============================================
// CONNECTION
//==============================================

void TCP_Stream::connect(const PeerAddress& peer) {
  remote_endpoint_ = peer.to_string();
  BOOST_LOG_TRIVIAL(debug) << "TCP stream: Connecting to " << remote_endpoint_;

  boost::asio::ip::tcp::resolver::results_type endpoints;
  try {
    boost::asio::ip::tcp::resolver resolver(io_context_);
    endpoints = resolver.resolve(peer.host, std::to_string(peer.port));
  } catch (const boost::system::system_error& e) {
    BOOST_LOG_TRIVIAL(error) << "TCP stream: Failed to resolve " << remote_endpoint_ << ": " << e.what();
    throw PeerUnreachableError("cannot resolve " + remote_endpoint_ + ": " + e.what());
  }

  boost::system::error_code result = boost::asio::error::would_block;
  boost::asio::async_connect(socket_, endpoints,
    [&result](const boost::system::error_code& ec, const boost::asio::ip::tcp::endpoint&) {
      result = ec;
    });

  try {
    run_with_timeout("connect");
  } catch (const TimeoutError&) {
    throw PeerUnreachableError("connect to " + remote_endpoint_ + " timed out");
  }

  if (result) {
    BOOST_LOG_TRIVIAL(debug) << "TCP stream: Connection to " << remote_endpoint_ << " failed: " << result.message();
    throw PeerUnreachableError("cannot connect to " + remote_endpoint_ + ": " + result.message());
  }

  BOOST_LOG_TRIVIAL(debug) << "TCP stream: Connected to " << remote_endpoint_;
}

void TCP_Stream::on_accepted() {
  boost::system::error_code ec;
  auto endpoint = socket_.remote_endpoint(ec);
  if (!ec) {
    remote_endpoint_ = endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
  }
}

//==============================================
// FRAME OPERATIONS
//==============================================

void TCP_Stream::write_frame(const Bytes& frame) {
  if (!socket_.is_open()) {
    throw NetworkException(NetworkError::CONNECTION_LOST, "write on closed stream");
  }

  // Length prefix in network byte order
  uint64_t network_size = boost::endian::native_to_big(static_cast<uint64_t>(frame.size()));
  std::array<boost::asio::const_buffer, 2> buffers = {
    boost::asio::buffer(&network_size, sizeof(network_size)),
    boost::asio::buffer(frame)
  };

  boost::system::error_code result = boost::asio::error::would_block;
  boost::asio::async_write(socket_, buffers,
    [&result](const boost::system::error_code& ec, std::size_t) { result = ec; });

  run_with_timeout("write");

  if (result) {
    BOOST_LOG_TRIVIAL(error) << "TCP stream: Write to " << remote_endpoint_ << " failed: " << result.message();
    throw NetworkException(NetworkError::CONNECTION_LOST, result.message());
  }

  BOOST_LOG_TRIVIAL(trace) << "TCP stream: Sent frame of " << frame.size() << " bytes to " << remote_endpoint_;
}

Bytes TCP_Stream::read_frame() {
  if (!socket_.is_open()) {
    throw NetworkException(NetworkError::CONNECTION_LOST, "read on closed stream");
  }

  // First read the size
  uint64_t network_size = 0;
  boost::system::error_code result = boost::asio::error::would_block;
  boost::asio::async_read(socket_, boost::asio::buffer(&network_size, sizeof(network_size)),
    [&result](const boost::system::error_code& ec, std::size_t) { result = ec; });

  run_with_timeout("read");

  if (result) {
    throw NetworkException(NetworkError::CONNECTION_LOST, "reading frame size from " + remote_endpoint_ +
                           ": " + result.message());
  }

  uint64_t frame_size = boost::endian::big_to_native(network_size);
  if (frame_size > MAX_FRAME_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "TCP stream: Frame of " << frame_size << " bytes from "
                             << remote_endpoint_ << " exceeds limit";
    throw ProtocolError("frame size " + std::to_string(frame_size) + " exceeds limit");
  }

  // Now read the actual data
  Bytes frame(static_cast<std::size_t>(frame_size));
  if (frame_size > 0) {
    result = boost::asio::error::would_block;
    boost::asio::async_read(socket_, boost::asio::buffer(frame),
      [&result](const boost::system::error_code& ec, std::size_t) { result = ec; });

    run_with_timeout("read");

    if (result) {
      throw NetworkException(NetworkError::CONNECTION_LOST, "reading frame body from " + remote_endpoint_ +
                             ": " + result.message());
    }
  }

  BOOST_LOG_TRIVIAL(trace) << "TCP stream: Received frame of " << frame_size << " bytes from " << remote_endpoint_;
  return frame;
}

//==============================================
// TEARDOWN
//==============================================

void TCP_Stream::close() {
  if (!socket_.is_open()) {
    return;
  }

  boost::system::error_code ec;

  // Shutdown both send and receive operations
  socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  if (ec && ec != boost::asio::error::not_connected) {
    BOOST_LOG_TRIVIAL(debug) << "TCP stream: Socket shutdown error: " << ec.message();
  }

  socket_.close(ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "TCP stream: Socket close error: " << ec.message();
  }
}

//==============================================
// DEADLINE HANDLING
//==============================================

void TCP_Stream::run_with_timeout(const std::string& operation) {
  io_context_.restart();
  io_context_.run_for(timeout_);

  // Still work left means the deadline expired before the operation completed
  if (!io_context_.stopped()) {
    boost::system::error_code ec;
    socket_.close(ec);
    io_context_.run();
    BOOST_LOG_TRIVIAL(warning) << "TCP stream: " << operation << " with " << remote_endpoint_
                               << " timed out after " << timeout_.count() << " ms";
    throw TimeoutError(operation + " with " + remote_endpoint_ + " timed out");
  }
}

} // namespace network
} // namespace fragnet

#ifndef FRAGNET_NETWORK_TCP_STREAM_HPP
#define FRAGNET_NETWORK_TCP_STREAM_HPP

#include <chrono>
#include <string>
#include <boost/asio.hpp>
#include "network/stream.hpp"
#include "network/network_error.hpp"

namespace fragnet {
namespace network {

// Stream over a TCP socket. Frames are an 8-byte big-endian length followed by the body.
// Every operation runs the stream's private io_context for at most the configured
// timeout, so a silent peer cannot block a caller indefinitely.
class TCP_Stream : public Stream {
public:
    // Delete copy operations to prevent socket duplication
    TCP_Stream(const TCP_Stream&) = delete;
    TCP_Stream& operator=(const TCP_Stream&) = delete;


    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    explicit TCP_Stream(std::chrono::milliseconds timeout);
    ~TCP_Stream() override;


    // ---- CONNECTION ----
    // Resolves and connects, throws PeerUnreachableError or TimeoutError
    void connect(const PeerAddress& peer);
    // Records the remote endpoint after the socket was accepted by a server
    void on_accepted();


    // ---- FRAME OPERATIONS ----
    void write_frame(const Bytes& frame) override;
    Bytes read_frame() override;


    // ---- TEARDOWN ----
    void close() override;


    // ---- GETTERS ----
    std::string remote_endpoint() const override { return remote_endpoint_; }
    boost::asio::ip::tcp::socket& get_socket() { return socket_; }

private:
    // ---- PARAMETERS ----
    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::socket socket_;
    std::chrono::milliseconds timeout_;
    std::string remote_endpoint_;


    // ---- DEADLINE HANDLING ----
    // Runs pending asynchronous work until it finishes or the timeout expires
    void run_with_timeout(const std::string& operation);
};

} // namespace network
} // namespace fragnet

#endif // FRAGNET_NETWORK_TCP_STREAM_HPP

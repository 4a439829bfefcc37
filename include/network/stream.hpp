#ifndef FRAGNET_NETWORK_STREAM_HPP
#define FRAGNET_NETWORK_STREAM_HPP

#include <string>
#include "network/types.hpp"

namespace fragnet {
namespace network {

// Bidirectional, message-framed byte stream between two peers. One exchange per stream.
class Stream {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    virtual ~Stream() = default;


    // ---- FRAME OPERATIONS ----
    // Both throw NetworkException (or a subclass) on failure
    virtual void write_frame(const Bytes& frame) = 0;
    virtual Bytes read_frame() = 0;


    // ---- TEARDOWN ----
    virtual void close() = 0;


    // ---- GETTERS ----
    virtual std::string remote_endpoint() const = 0;

protected:
    Stream() = default;
};

} // namespace network
} // namespace fragnet

#endif // FRAGNET_NETWORK_STREAM_HPP

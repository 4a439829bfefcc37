#ifndef FRAGNET_NETWORK_TYPES_HPP
#define FRAGNET_NETWORK_TYPES_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace fragnet::network {

using Bytes = std::vector<uint8_t>;

// Largest frame accepted from the wire, bounds allocation for a hostile length prefix
constexpr uint64_t MAX_FRAME_SIZE = 64ull * 1024 * 1024;
// Largest fragment that still fits a fragment response frame with its header
constexpr uint64_t MAX_FRAGMENT_SIZE = MAX_FRAME_SIZE - 1024;

// Where a peer can be reached
struct PeerAddress {
    std::string host;
    uint16_t port = 0;

    std::string to_string() const;
    // Parses "host:port", throws std::invalid_argument on malformed input
    static PeerAddress parse(const std::string& text);

    bool operator==(const PeerAddress& other) const {
        return host == other.host && port == other.port;
    }
    bool operator!=(const PeerAddress& other) const { return !(*this == other); }
};

} // namespace fragnet::network

#endif // FRAGNET_NETWORK_TYPES_HPP

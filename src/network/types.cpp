#include "network/types.hpp"
#include <stdexcept>

namespace fragnet::network {

std::string PeerAddress::to_string() const {
    return host + ":" + std::to_string(port);
}

PeerAddress PeerAddress::parse(const std::string& text) {
    size_t delimiter_pos = text.rfind(':');
    if (delimiter_pos == std::string::npos || delimiter_pos == 0 || delimiter_pos + 1 == text.size()) {
        throw std::invalid_argument("Invalid peer address, expected host:port: " + text);
    }

    const std::string port_str = text.substr(delimiter_pos + 1);
    for (char c : port_str) {
        if (c < '0' || c > '9') {
            throw std::invalid_argument("Invalid port in peer address: " + text);
        }
    }

    unsigned long port = 0;
    try {
        port = std::stoul(port_str);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid port in peer address: " + text);
    }
    if (port == 0 || port > 65535) {
        throw std::invalid_argument("Port out of range in peer address: " + text);
    }

    PeerAddress address;
    address.host = text.substr(0, delimiter_pos);
    address.port = static_cast<uint16_t>(port);
    return address;
}

} // namespace fragnet::network

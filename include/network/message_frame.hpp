#ifndef FRAGNET_NETWORK_MESSAGE_FRAME_HPP
#define FRAGNET_NETWORK_MESSAGE_FRAME_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "network/types.hpp"

namespace fragnet {
namespace network {

// First byte of every encoded message, used to reject a message of the wrong kind
enum class MessageType : uint8_t {
    HANDSHAKE = 0x00,
    FRAGMENT_REQUEST = 0x01,
    FRAGMENT_RESPONSE = 0x02,
    INDEX_REQUEST = 0x10,
    INDEX_RESPONSE = 0x11,
    FILE_INFO = 0x20,
    PROVIDER_RECORD = 0x21
};

// Opens every connection, names the protocol the rest of the stream speaks
struct Handshake {
    std::string protocol_id;
};

struct FragmentRequest {
    std::string hash;
};

// data is empty and found is false when the responder does not hold the fragment
struct FragmentResponse {
    std::string hash;
    Bytes data;
    bool found = false;
};

enum class IndexOperation : uint8_t {
    PUT = 0,
    GET = 1
};

struct IndexRequest {
    IndexOperation operation = IndexOperation::GET;
    std::string key;
    Bytes value;
};

enum class IndexStatus : uint8_t {
    OK = 0,
    NOT_FOUND = 1,
    FAILED = 2
};

struct IndexResponse {
    IndexStatus status = IndexStatus::FAILED;
    Bytes value;
};

// Peers known to hold the fragment with the given hash
struct ProviderRecord {
    std::string hash;
    std::vector<PeerAddress> providers;
};

} // namespace network
} // namespace fragnet

#endif // FRAGNET_NETWORK_MESSAGE_FRAME_HPP

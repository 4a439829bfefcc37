#ifndef FRAGNET_NETWORK_CODEC_HPP
#define FRAGNET_NETWORK_CODEC_HPP

#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <boost/endian/conversion.hpp>
#include "fragment/fragment.hpp"
#include "network/message_frame.hpp"
#include "network/network_error.hpp"

namespace fragnet {
namespace network {

// Binary encoding of protocol messages and index records.
// Layout: message type byte, then fields in declaration order. Strings carry a
// 4-byte length, byte payloads an 8-byte length, all in network byte order.
// Deserialization throws ProtocolError on truncated, oversized or mistyped input.
class Codec {
public:
  // ---- SERIALIZATION ----
  static void serialize(const Handshake& message, std::ostream& output);
  static void serialize(const FragmentRequest& message, std::ostream& output);
  static void serialize(const FragmentResponse& message, std::ostream& output);
  static void serialize(const IndexRequest& message, std::ostream& output);
  static void serialize(const IndexResponse& message, std::ostream& output);
  static void serialize(const fragment::FileInfo& info, std::ostream& output);
  static void serialize(const ProviderRecord& record, std::ostream& output);

  
  // ---- DESERIALIZATION ----
  static void deserialize(std::istream& input, Handshake& message);
  static void deserialize(std::istream& input, FragmentRequest& message);
  static void deserialize(std::istream& input, FragmentResponse& message);
  static void deserialize(std::istream& input, IndexRequest& message);
  static void deserialize(std::istream& input, IndexResponse& message);
  static void deserialize(std::istream& input, fragment::FileInfo& info);
  static void deserialize(std::istream& input, ProviderRecord& record);

  
  // ---- FRAME HELPERS ----
  // Encodes a whole message into one frame body
  template <typename Message>
  static Bytes encode(const Message& message) {
    std::ostringstream output(std::ios::binary);
    serialize(message, output);
    const std::string buffer = output.str();
    return Bytes(buffer.begin(), buffer.end());
  }

  // Decodes one frame body, which must hold exactly one message
  template <typename Message>
  static Message decode(const Bytes& frame) {
    std::istringstream input(std::string(frame.begin(), frame.end()), std::ios::binary);
    Message message;
    deserialize(input, message);
    if (input.peek() != std::char_traits<char>::eof()) {
      throw ProtocolError("Codec: Trailing bytes after message");
    }
    return message;
  }

private:
  // ---- STREAM OPERATIONS ----
  static void write_bytes(std::ostream& output, const void* data, std::size_t size);
  static void read_bytes(std::istream& input, void* data, std::size_t size);

  static void write_type(std::ostream& output, MessageType type);
  // Reads the type byte and throws unless it equals expected
  static void expect_type(std::istream& input, MessageType expected);

  static void write_u8(std::ostream& output, uint8_t value);
  static uint8_t read_u8(std::istream& input);
  static void write_u16(std::ostream& output, uint16_t value);
  static uint16_t read_u16(std::istream& input);
  static void write_u32(std::ostream& output, uint32_t value);
  static uint32_t read_u32(std::istream& input);
  static void write_u64(std::ostream& output, uint64_t value);
  static uint64_t read_u64(std::istream& input);

  static void write_string(std::ostream& output, const std::string& value);
  static std::string read_string(std::istream& input);
  static void write_blob(std::ostream& output, const Bytes& value);
  static Bytes read_blob(std::istream& input);
  static void write_address(std::ostream& output, const PeerAddress& address);
  static PeerAddress read_address(std::istream& input);
};

} // namespace network
} // namespace fragnet

#endif // FRAGNET_NETWORK_CODEC_HPP

#include "network/codec.hpp"
#include <boost/log/trivial.hpp>

namespace fragnet {
namespace network {

//==============================================
// SERIALIZATION
//==============================================

void Codec::serialize(const Handshake& message, std::ostream& output) {
  write_type(output, MessageType::HANDSHAKE);
  write_string(output, message.protocol_id);
}

void Codec::serialize(const FragmentRequest& message, std::ostream& output) {
  write_type(output, MessageType::FRAGMENT_REQUEST);
  write_string(output, message.hash);
}

void Codec::serialize(const FragmentResponse& message, std::ostream& output) {
  write_type(output, MessageType::FRAGMENT_RESPONSE);
  write_string(output, message.hash);
  write_u8(output, message.found ? 1 : 0);
  write_blob(output, message.data);
}

void Codec::serialize(const IndexRequest& message, std::ostream& output) {
  write_type(output, MessageType::INDEX_REQUEST);
  write_u8(output, static_cast<uint8_t>(message.operation));
  write_string(output, message.key);
  write_blob(output, message.value);
}

void Codec::serialize(const IndexResponse& message, std::ostream& output) {
  write_type(output, MessageType::INDEX_RESPONSE);
  write_u8(output, static_cast<uint8_t>(message.status));
  write_blob(output, message.value);
}

void Codec::serialize(const fragment::FileInfo& info, std::ostream& output) {
  if (info.fragment_hashes.size() != info.total_fragments) {
    BOOST_LOG_TRIVIAL(error) << "Codec: File info for " << info.filename << " lists "
                             << info.fragment_hashes.size() << " hashes but declares "
                             << info.total_fragments << " fragments";
    throw std::invalid_argument("Codec: Inconsistent file info for " + info.filename);
  }

  write_type(output, MessageType::FILE_INFO);
  write_string(output, info.filename);
  write_u64(output, info.file_size);
  write_u32(output, info.total_fragments);
  for (const auto& hash : info.fragment_hashes) {
    write_string(output, hash);
  }
}

void Codec::serialize(const ProviderRecord& record, std::ostream& output) {
  write_type(output, MessageType::PROVIDER_RECORD);
  write_string(output, record.hash);
  write_u32(output, static_cast<uint32_t>(record.providers.size()));
  for (const auto& provider : record.providers) {
    write_address(output, provider);
  }
}

//==============================================
// DESERIALIZATION
//==============================================

void Codec::deserialize(std::istream& input, Handshake& message) {
  expect_type(input, MessageType::HANDSHAKE);
  message.protocol_id = read_string(input);
}

void Codec::deserialize(std::istream& input, FragmentRequest& message) {
  expect_type(input, MessageType::FRAGMENT_REQUEST);
  message.hash = read_string(input);
}

void Codec::deserialize(std::istream& input, FragmentResponse& message) {
  expect_type(input, MessageType::FRAGMENT_RESPONSE);
  message.hash = read_string(input);

  uint8_t found = read_u8(input);
  if (found > 1) {
    throw ProtocolError("Codec: Invalid found flag: " + std::to_string(found));
  }
  message.found = found == 1;
  message.data = read_blob(input);

  if (!message.found && !message.data.empty()) {
    throw ProtocolError("Codec: Not-found response carries data");
  }
}

void Codec::deserialize(std::istream& input, IndexRequest& message) {
  expect_type(input, MessageType::INDEX_REQUEST);

  uint8_t operation = read_u8(input);
  if (operation > static_cast<uint8_t>(IndexOperation::GET)) {
    throw ProtocolError("Codec: Unknown index operation: " + std::to_string(operation));
  }
  message.operation = static_cast<IndexOperation>(operation);
  message.key = read_string(input);
  message.value = read_blob(input);
}

void Codec::deserialize(std::istream& input, IndexResponse& message) {
  expect_type(input, MessageType::INDEX_RESPONSE);

  uint8_t status = read_u8(input);
  if (status > static_cast<uint8_t>(IndexStatus::FAILED)) {
    throw ProtocolError("Codec: Unknown index status: " + std::to_string(status));
  }
  message.status = static_cast<IndexStatus>(status);
  message.value = read_blob(input);
}

void Codec::deserialize(std::istream& input, fragment::FileInfo& info) {
  expect_type(input, MessageType::FILE_INFO);
  info.filename = read_string(input);
  info.file_size = read_u64(input);
  info.total_fragments = read_u32(input);

  // Count is untrusted, let truncation end the loop instead of reserving up front
  info.fragment_hashes.clear();
  for (uint32_t i = 0; i < info.total_fragments; ++i) {
    info.fragment_hashes.push_back(read_string(input));
  }
}

void Codec::deserialize(std::istream& input, ProviderRecord& record) {
  expect_type(input, MessageType::PROVIDER_RECORD);
  record.hash = read_string(input);

  uint32_t count = read_u32(input);
  record.providers.clear();
  for (uint32_t i = 0; i < count; ++i) {
    record.providers.push_back(read_address(input));
  }
}

//==============================================
// FIELD ENCODING
//==============================================

void Codec::write_type(std::ostream& output, MessageType type) {
  write_u8(output, static_cast<uint8_t>(type));
}

void Codec::expect_type(std::istream& input, MessageType expected) {
  uint8_t type = read_u8(input);
  if (type != static_cast<uint8_t>(expected)) {
    BOOST_LOG_TRIVIAL(debug) << "Codec: Expected message type " << static_cast<int>(expected)
                             << ", got " << static_cast<int>(type);
    throw ProtocolError("Codec: Unexpected message type " + std::to_string(type));
  }
}

void Codec::write_u8(std::ostream& output, uint8_t value) {
  write_bytes(output, &value, sizeof(value));
}

uint8_t Codec::read_u8(std::istream& input) {
  uint8_t value;
  read_bytes(input, &value, sizeof(value));
  return value;
}

void Codec::write_u16(std::ostream& output, uint16_t value) {
  uint16_t network_value = boost::endian::native_to_big(value);
  write_bytes(output, &network_value, sizeof(network_value));
}

uint16_t Codec::read_u16(std::istream& input) {
  uint16_t network_value;
  read_bytes(input, &network_value, sizeof(network_value));
  return boost::endian::big_to_native(network_value);
}

void Codec::write_u32(std::ostream& output, uint32_t value) {
  uint32_t network_value = boost::endian::native_to_big(value);
  write_bytes(output, &network_value, sizeof(network_value));
}

uint32_t Codec::read_u32(std::istream& input) {
  uint32_t network_value;
  read_bytes(input, &network_value, sizeof(network_value));
  return boost::endian::big_to_native(network_value);
}

void Codec::write_u64(std::ostream& output, uint64_t value) {
  uint64_t network_value = boost::endian::native_to_big(value);
  write_bytes(output, &network_value, sizeof(network_value));
}

uint64_t Codec::read_u64(std::istream& input) {
  uint64_t network_value;
  read_bytes(input, &network_value, sizeof(network_value));
  return boost::endian::big_to_native(network_value);
}

void Codec::write_string(std::ostream& output, const std::string& value) {
  write_u32(output, static_cast<uint32_t>(value.size()));
  write_bytes(output, value.data(), value.size());
}

std::string Codec::read_string(std::istream& input) {
  uint32_t length = read_u32(input);
  if (length > MAX_FRAME_SIZE) {
    throw ProtocolError("Codec: String length " + std::to_string(length) + " exceeds frame limit");
  }
  std::string value(length, '\0');
  read_bytes(input, value.data(), length);
  return value;
}

void Codec::write_blob(std::ostream& output, const Bytes& value) {
  write_u64(output, value.size());
  write_bytes(output, value.data(), value.size());
}

Bytes Codec::read_blob(std::istream& input) {
  uint64_t length = read_u64(input);
  if (length > MAX_FRAME_SIZE) {
    throw ProtocolError("Codec: Payload length " + std::to_string(length) + " exceeds frame limit");
  }
  Bytes value(static_cast<std::size_t>(length));
  read_bytes(input, value.data(), value.size());
  return value;
}

void Codec::write_address(std::ostream& output, const PeerAddress& address) {
  write_string(output, address.host);
  write_u16(output, address.port);
}

PeerAddress Codec::read_address(std::istream& input) {
  PeerAddress address;
  address.host = read_string(input);
  address.port = read_u16(input);
  return address;
}

//==============================================
// STREAM OPERATIONS
//==============================================

void Codec::write_bytes(std::ostream& output, const void* data, std::size_t size) {
  if (size == 0) {
    return;
  }
  if (!output.write(static_cast<const char*>(data), static_cast<std::streamsize>(size))) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Failed to write " << size << " bytes to output stream";
    throw std::runtime_error("Codec: Failed to write to output stream");
  }
}

void Codec::read_bytes(std::istream& input, void* data, std::size_t size) {
  if (size == 0) {
    return;
  }
  if (!input.read(static_cast<char*>(data), static_cast<std::streamsize>(size))) {
    throw ProtocolError("Codec: Truncated message, needed " + std::to_string(size) + " more bytes");
  }
}

} // namespace network
} // namespace fragnet

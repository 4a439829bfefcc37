#ifndef FRAGNET_CONFIG_NODE_CONFIG_HPP
#define FRAGNET_CONFIG_NODE_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>
#include "network/types.hpp"

namespace fragnet {
namespace config {

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message)
    : std::runtime_error("Configuration error: " + message) {}
};

struct NodeConfig {
  // Network
  std::string address = "127.0.0.1";
  uint16_t port = 0;
  std::chrono::milliseconds request_timeout{5000};
  std::size_t worker_count = 16;

  // Index: host one when index_peer is empty
  std::optional<network::PeerAddress> index_peer;
  std::vector<network::PeerAddress> peers;

  // Storage and transfer
  std::size_t fragment_size = 256 * 1024;
  std::string store_dir;
  std::size_t download_parallelism = 4;

  // Logging
  std::string log_file;
  std::string log_level = "info";

  // Startup actions
  std::vector<std::string> upload_files;
  bool shell = true;
};

// Throws ConfigError on an unknown flag, a missing value or an invalid value.
// The port is required.
NodeConfig parse_command_line(int argc, const char* const argv[]);

void print_usage(std::ostream& out, const std::string& program_name);

} // namespace config
} // namespace fragnet

#endif // FRAGNET_CONFIG_NODE_CONFIG_HPP

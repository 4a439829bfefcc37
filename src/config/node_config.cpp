#include "config/node_config.hpp"
#include <limits>
#include <boost/log/trivial.hpp>
#include "logger/logger.hpp"

namespace fragnet {
namespace config {

namespace {

unsigned long long parse_number(const std::string& flag, const std::string& value,
                                unsigned long long min, unsigned long long max) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    throw ConfigError("invalid value for " + flag + ": " + value);
  }

  unsigned long long number = 0;
  try {
    number = std::stoull(value);
  } catch (const std::exception&) {
    throw ConfigError("invalid value for " + flag + ": " + value);
  }

  if (number < min || number > max) {
    throw ConfigError(flag + " must be between " + std::to_string(min) + " and " + std::to_string(max));
  }
  return number;
}

network::PeerAddress parse_peer(const std::string& flag, const std::string& value) {
  try {
    return network::PeerAddress::parse(value);
  } catch (const std::invalid_argument& e) {
    throw ConfigError("invalid address for " + flag + ": " + e.what());
  }
}

} // namespace

//==============================================
// COMMAND LINE PARSING
//==============================================

NodeConfig parse_command_line(int argc, const char* const argv[]) {
  NodeConfig config;
  bool port_given = false;

  for (int i = 1; i < argc; ++i) {
    const std::string flag(argv[i]);

    // Flags without a value
    if (flag == "--no-shell") {
      config.shell = false;
      continue;
    }

    if (i + 1 >= argc) {
      throw ConfigError("missing value for " + flag);
    }
    const std::string value(argv[++i]);

    if (flag == "-h" || flag == "--host") {
      if (value.empty()) {
        throw ConfigError("host must not be empty");
      }
      config.address = value;
    } else if (flag == "-p" || flag == "--port") {
      config.port = static_cast<uint16_t>(parse_number(flag, value, 0, std::numeric_limits<uint16_t>::max()));
      port_given = true;
    } else if (flag == "-s" || flag == "--fragment-size") {
      config.fragment_size = parse_number(flag, value, 1, network::MAX_FRAGMENT_SIZE);
    } else if (flag == "-d" || flag == "--store-dir") {
      config.store_dir = value;
    } else if (flag == "-i" || flag == "--index") {
      config.index_peer = parse_peer(flag, value);
    } else if (flag == "--peer") {
      config.peers.push_back(parse_peer(flag, value));
    } else if (flag == "-t" || flag == "--timeout") {
      config.request_timeout = std::chrono::milliseconds(parse_number(flag, value, 1, 3600 * 1000));
    } else if (flag == "-j" || flag == "--parallel") {
      config.download_parallelism = parse_number(flag, value, 1, 256);
    } else if (flag == "-w" || flag == "--workers") {
      config.worker_count = parse_number(flag, value, 1, 1024);
    } else if (flag == "-l" || flag == "--log-file") {
      config.log_file = value;
    } else if (flag == "-v" || flag == "--log-level") {
      try {
        logger::parse_severity(value);
      } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
      }
      config.log_level = value;
    } else if (flag == "-u" || flag == "--upload") {
      config.upload_files.push_back(value);
    } else {
      throw ConfigError("unknown argument: " + flag);
    }
  }

  if (!port_given) {
    throw ConfigError("port is required");
  }

  BOOST_LOG_TRIVIAL(debug) << "Config: Parsed " << argc - 1 << " arguments";
  return config;
}

void print_usage(std::ostream& out, const std::string& program_name) {
  out << "Usage: " << program_name << " -p <port> [options]\n"
      << "Required arguments:\n"
      << "  -p, --port <n>            Listen port, 0 picks a free one\n"
      << "Options:\n"
      << "  -h, --host <addr>         Listen address (default 127.0.0.1)\n"
      << "  -s, --fragment-size <n>   Fragment size in bytes (default 262144)\n"
      << "  -d, --store-dir <dir>     Persist fragments under <dir>\n"
      << "  -i, --index <host:port>   Use the index hosted by this node\n"
      << "      --peer <host:port>    Static peer to ask for fragments, repeatable\n"
      << "  -t, --timeout <ms>        Per-request timeout (default 5000)\n"
      << "  -j, --parallel <n>        Fragments fetched at once (default 4)\n"
      << "  -w, --workers <n>         Inbound stream workers (default 16)\n"
      << "  -l, --log-file <file>     Also log to <file>\n"
      << "  -v, --log-level <level>   trace, debug, info, warning, error or fatal\n"
      << "  -u, --upload <file>       Upload <file> at startup, repeatable\n"
      << "      --no-shell            Run without the interactive shell\n"
      << "Example: " << program_name << " -h 127.0.0.1 -p 3001 -i 127.0.0.1:3000\n";
}

} // namespace config
} // namespace fragnet

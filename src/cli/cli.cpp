#include "cli/cli.hpp"
#include <sstream>
#include <boost/log/trivial.hpp>

namespace fragnet {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(std::istream& in, std::ostream& out,
         node::Node& node, node::IndexProviderLocator& locator,
         QuitCallback on_quit)
  : stopped_(false)
  , in_(in)
  , out_(out)
  , node_(node)
  , locator_(locator)
  , on_quit_(std::move(on_quit)) {
  BOOST_LOG_TRIVIAL(info) << "CLI: Initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "CLI: Starting CLI loop";
  out_ << "fragnet> " << std::flush;

  while (std::getline(in_, line)) {
    {
      // stop() may have been called while getline was blocked
      std::lock_guard<std::mutex> lock(command_mutex_);
      if (stopped_) {
        break;
      }
      if (!execute(line)) {
        stopped_ = true;
        break;
      }
    }
    out_ << "fragnet> " << std::flush;
  }

  BOOST_LOG_TRIVIAL(info) << "CLI: CLI loop ended";
}

void CLI::stop() {
  std::lock_guard<std::mutex> lock(command_mutex_);
  stopped_ = true;
}

bool CLI::execute(const std::string& line) {
  std::istringstream iss(line);
  std::string command, argument, extra;
  iss >> command >> argument >> extra;

  if (command.empty()) {
    return true;
  }

  BOOST_LOG_TRIVIAL(debug) << "CLI: Processing command: " << command << " with argument: " << argument;

  if (command == "quit" || command == "exit") {
    if (on_quit_) {
      on_quit_();
    }
    return false;
  }
  else if (command == "help") {
    handle_help_command();
  }
  else if (command == "ls") {
    handle_ls_command();
  }
  else if (command == "stats") {
    handle_stats_command();
  }
  else if (argument.empty()) {
    out_ << "Invalid input. Usage: <command> [argument], type help for the list" << std::endl;
  }
  else if (command == "upload") {
    handle_upload_command(argument);
  }
  else if (command == "download") {
    handle_download_command(argument, extra.empty() ? argument : extra);
  }
  else if (command == "search") {
    handle_search_command(argument);
  }
  else if (command == "peer") {
    handle_peer_command(argument);
  }
  else {
    out_ << "Unknown command or invalid arguments" << std::endl;
  }
  return true;
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::handle_upload_command(const std::string& path) {
  try {
    const auto info = node_.upload(path);
    out_ << "Uploaded " << info.filename << ": " << info.total_fragments << " fragments, "
         << info.file_size << " bytes" << std::endl;
  } catch (const node::UploadError& e) {
    if (e.locally_stored()) {
      log_and_display_error("Stored locally but not published", e.what());
    } else {
      log_and_display_error("Error uploading file", e.what());
    }
  } catch (const std::exception& e) {
    log_and_display_error("Error uploading file", e.what());
  }
}

void CLI::handle_download_command(const std::string& filename, const std::string& output) {
  try {
    const auto info = node_.download(filename, output);
    out_ << "Downloaded " << info.filename << " to " << output << " (" << info.file_size
         << " bytes)" << std::endl;
  } catch (const node::FileNotFoundError& e) {
    log_and_display_error("File not found", e.what());
  } catch (const node::FragmentUnavailableError& e) {
    log_and_display_error("Download incomplete", e.what());
  } catch (const std::exception& e) {
    log_and_display_error("Error downloading file", e.what());
  }
}

void CLI::handle_search_command(const std::string& filename) {
  try {
    const auto info = node_.search(filename);
    if (!info) {
      out_ << "No record for " << filename << std::endl;
      return;
    }
    out_ << info->filename << ": " << info->total_fragments << " fragments, "
         << info->file_size << " bytes" << std::endl;
    for (std::size_t i = 0; i < info->fragment_hashes.size(); ++i) {
      out_ << "  [" << i << "] " << info->fragment_hashes[i] << std::endl;
    }
  } catch (const std::exception& e) {
    log_and_display_error("Error searching", e.what());
  }
}

void CLI::handle_ls_command() {
  const auto files = node_.list_files();
  if (files.empty()) {
    out_ << "No files uploaded from this node" << std::endl;
    return;
  }
  for (const auto& file : files) {
    out_ << file << std::endl;
  }
}

void CLI::handle_stats_command() {
  const auto stats = node_.stats();
  out_ << "Stored fragments:  " << stats.stored_fragments << std::endl
       << "Catalog files:     " << stats.catalog_files << std::endl
       << "Uploads:           " << stats.uploads << std::endl
       << "Downloads:         " << stats.downloads << std::endl
       << "Fragments served:  " << stats.fragments_served << std::endl
       << "Requests missed:   " << stats.requests_missed << std::endl
       << "Requests rejected: " << stats.requests_rejected << std::endl;
}

void CLI::handle_peer_command(const std::string& address) {
  try {
    const auto peer = network::PeerAddress::parse(address);
    locator_.add_static_peer(peer);
    out_ << "Added peer " << peer.to_string() << std::endl;
  } catch (const std::invalid_argument& e) {
    out_ << "Invalid format. Usage: peer ip:port (e.g., peer 127.0.0.1:3002)" << std::endl;
  }
}

void CLI::handle_help_command() {
  out_ << "Available commands:" << std::endl;
  out_ << "  help                     Display this help message" << std::endl;
  out_ << "  upload <path>            Fragment <path> and publish it" << std::endl;
  out_ << "  download <name> [out]    Fetch <name> and write it to [out]" << std::endl;
  out_ << "  search <name>            Show the published record for <name>" << std::endl;
  out_ << "  ls                       List files uploaded from this node" << std::endl;
  out_ << "  stats                    Show node statistics" << std::endl;
  out_ << "  peer <ip:port>           Ask <ip:port> for fragments too" << std::endl;
  out_ << "  quit                     Stop the node" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << "CLI: " << message << ": " << error;
  out_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace fragnet

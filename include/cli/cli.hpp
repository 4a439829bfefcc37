#ifndef FRAGNET_CLI_HPP
#define FRAGNET_CLI_HPP

#include <functional>
#include <istream>
#include <mutex>
#include <ostream>
#include <string>
#include "node/node.hpp"
#include "node/provider_locator.hpp"

namespace fragnet {
namespace cli {

class CLI {
public:
  using QuitCallback = std::function<void()>;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  CLI(std::istream& in, std::ostream& out,
      node::Node& node, node::IndexProviderLocator& locator,
      QuitCallback on_quit = nullptr);


  // ---- STARTUP ----
  // Reads commands until quit, stop() or end of input
  void run();
  // Waits for a running command to finish. No command starts after stop() returns,
  // so the node may be torn down even while run() is still blocked on input.
  void stop();

private:
  // ---- PARAMETERS ----
  // Held while a command runs
  std::mutex command_mutex_;
  bool stopped_;
  std::istream& in_;
  std::ostream& out_;
  // System components
  node::Node& node_;
  node::IndexProviderLocator& locator_;
  QuitCallback on_quit_;


  // ---- COMMAND PROCESSING ----
  // Runs a single command line, returns false once the shell should exit
  bool execute(const std::string& line);
  void handle_upload_command(const std::string& path);
  void handle_download_command(const std::string& filename, const std::string& output);
  void handle_search_command(const std::string& filename);
  void handle_ls_command();
  void handle_stats_command();
  void handle_peer_command(const std::string& address);
  void handle_help_command();
  void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace fragnet

#endif // FRAGNET_CLI_HPP

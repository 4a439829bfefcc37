#include "cli/cli.hpp"
#include "config/node_config.hpp"
#include "logger/logger.hpp"
#include "node/bootstrap.hpp"
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/log/trivial.hpp>

namespace {

void upload_startup_files(fragnet::node::Node& node, const std::vector<std::string>& files) {
  for (const auto& file : files) {
    try {
      const auto info = node.upload(file);
      std::cout << "Uploaded " << info.filename << " (" << info.total_fragments << " fragments)\n";
    } catch (const fragnet::node::UploadError& e) {
      std::cerr << "Error: Failed to upload " << file << ": " << e.what() << '\n';
    }
  }
}

bool run_bootstrap(const fragnet::config::NodeConfig& config) {
  try {
    fragnet::node::Bootstrap peer(config);
    if (!peer.start()) {
      std::cerr << "Error: Failed to start node\n";
      return false;
    }
    std::cout << "Node listening on " << peer.get_transport().local_address().to_string()
              << (peer.hosts_index() ? " (hosting index)" : "") << '\n';

    upload_startup_files(peer.get_node(), config.upload_files);

    // SIGINT and SIGTERM stop the node
    boost::asio::io_context signal_context;
    boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
    signals.async_wait([&peer](const boost::system::error_code& error, int signal_number) {
      if (!error) {
        BOOST_LOG_TRIVIAL(info) << "Main: Received signal " << signal_number;
        peer.request_stop();
      }
    });
    std::thread signal_thread([&signal_context]() { signal_context.run(); });

    std::unique_ptr<fragnet::cli::CLI> cli;
    if (config.shell) {
      cli = std::make_unique<fragnet::cli::CLI>(std::cin, std::cout, peer.get_node(), peer.get_locator(),
                                                [&peer]() { peer.request_stop(); });
      std::thread([shell = cli.get()]() { shell->run(); }).detach();
    }

    peer.run_until_stopped();

    if (cli) {
      // Waits out a running command, after this the shell no longer touches the node.
      // The detached shell may still be blocked on stdin, so the CLI itself stays allocated.
      cli->stop();
      static_cast<void>(cli.release());
    }

    signal_context.stop();
    signal_thread.join();
    peer.shutdown();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to run node: " << e.what() << '\n';
    return false;
  }
}

} // namespace

int main(int argc, char* argv[]) {
  fragnet::config::NodeConfig config;
  try {
    config = fragnet::config::parse_command_line(argc, argv);
    fragnet::logger::init_logging(config.log_file, fragnet::logger::parse_severity(config.log_level));
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    fragnet::config::print_usage(std::cerr, argv[0]);
    return 1;
  }

  if (!run_bootstrap(config)) {
    return 1;
  }
  return 0;
}

#ifndef FRAGNET_NODE_BOOTSTRAP_HPP
#define FRAGNET_NODE_BOOTSTRAP_HPP

#include <condition_variable>
#include <memory>
#include <mutex>
#include "config/node_config.hpp"
#include "index/distributed_index.hpp"
#include "index/index_client.hpp"
#include "index/index_server.hpp"
#include "network/tcp_server.hpp"
#include "node/node.hpp"
#include "node/provider_locator.hpp"

namespace fragnet {
namespace node {

// Builds every component of a node from its configuration and owns them
class Bootstrap {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Bootstrap(const config::NodeConfig& config);
  ~Bootstrap();

  Bootstrap(const Bootstrap&) = delete;
  Bootstrap& operator=(const Bootstrap&) = delete;


  // ---- INITIALIZATION AND DESTRUCTION METHODS ----
  // Starts the listener and registers the protocol handlers
  bool start();
  // Stops the listener, idempotent
  void shutdown();
  // Blocks until request_stop() is called
  void run_until_stopped();
  void request_stop();


  // ---- GETTERS AND SETTERS ----
  Node& get_node() { return *node_; }
  network::TCP_Server& get_transport() { return *tcp_server_; }
  index::IndexClient& get_index_client() { return *index_client_; }
  IndexProviderLocator& get_locator() { return *locator_; }
  bool hosts_index() const { return index_server_ != nullptr; }

private:
  // ---- PARAMETERS ----
  config::NodeConfig config_;

  // System components, in construction order
  std::unique_ptr<network::TCP_Server> tcp_server_;
  std::unique_ptr<index::DistributedIndex> index_;
  std::unique_ptr<index::IndexServer> index_server_;
  std::unique_ptr<index::IndexClient> index_client_;
  std::unique_ptr<IndexProviderLocator> locator_;
  std::unique_ptr<Node> node_;

  // Stop signalling
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  bool stop_requested_ = false;
};

} // namespace node
} // namespace fragnet

#endif // FRAGNET_NODE_BOOTSTRAP_HPP

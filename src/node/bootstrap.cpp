#include "node/bootstrap.hpp"
#include <boost/log/trivial.hpp>
#include "index/memory_index.hpp"
#include "index/remote_index.hpp"

namespace fragnet {
namespace node {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Bootstrap::Bootstrap(const config::NodeConfig& config)
  : config_(config) {

  BOOST_LOG_TRIVIAL(info) << "Bootstrap: Initializing node on " << config_.address << ":" << config_.port;

  try {
    tcp_server_ = std::make_unique<network::TCP_Server>(config_.port, config_.address,
                                                        config_.request_timeout, config_.worker_count);
    BOOST_LOG_TRIVIAL(debug) << "Bootstrap: TCP Server created successfully";

    if (config_.index_peer) {
      index_ = std::make_unique<index::RemoteIndex>(*tcp_server_, *config_.index_peer);
      BOOST_LOG_TRIVIAL(debug) << "Bootstrap: Using index hosted by " << config_.index_peer->to_string();
    } else {
      index_ = std::make_unique<index::MemoryIndex>();
      index_server_ = std::make_unique<index::IndexServer>(*index_);
      BOOST_LOG_TRIVIAL(debug) << "Bootstrap: Hosting the index";
    }

    index_client_ = std::make_unique<index::IndexClient>(*index_);

    locator_ = std::make_unique<IndexProviderLocator>(*index_client_);
    for (const auto& peer : config_.peers) {
      locator_->add_static_peer(peer);
    }

    std::unique_ptr<store::FragmentStore> store;
    if (config_.store_dir.empty()) {
      store = std::make_unique<store::FragmentStore>();
    } else {
      store = std::make_unique<store::FragmentStore>(config_.store_dir);
    }

    NodeOptions options;
    options.fragment_size = config_.fragment_size;
    options.download_parallelism = config_.download_parallelism;
    node_ = std::make_unique<Node>(options, std::move(store), *tcp_server_, *index_client_, *locator_);

    BOOST_LOG_TRIVIAL(info) << "Bootstrap: Successfully created all components";
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Bootstrap: Failed to initialize components: " << e.what();
    throw;
  }
}

Bootstrap::~Bootstrap() {
  shutdown();
}

//==============================================
// INITIALIZATION AND DESTRUCTION METHODS
//==============================================

bool Bootstrap::start() {
  // Handlers go in before the listener so no inbound stream finds them missing
  node_->register_handlers();
  if (index_server_) {
    index::IndexServer* server = index_server_.get();
    tcp_server_->set_handler(index::INDEX_PROTOCOL_ID,
                             [server](network::Stream& stream) { server->handle_stream(stream); });
  }

  if (!tcp_server_->start_listener()) {
    BOOST_LOG_TRIVIAL(error) << "Bootstrap: Failed to start TCP server";
    return false;
  }

  BOOST_LOG_TRIVIAL(info) << "Bootstrap: Node listening on " << tcp_server_->local_address().to_string();
  return true;
}

void Bootstrap::shutdown() {
  if (tcp_server_ && tcp_server_->is_running()) {
    BOOST_LOG_TRIVIAL(info) << "Bootstrap: Initiating shutdown sequence";
    tcp_server_->shutdown();
    BOOST_LOG_TRIVIAL(info) << "Bootstrap: Shutdown complete";
  }
  request_stop();
}

void Bootstrap::run_until_stopped() {
  std::unique_lock<std::mutex> lock(stop_mutex_);
  stop_cv_.wait(lock, [this] { return stop_requested_; });
}

void Bootstrap::request_stop() {
  {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    stop_requested_ = true;
  }
  stop_cv_.notify_all();
}

} // namespace node
} // namespace fragnet

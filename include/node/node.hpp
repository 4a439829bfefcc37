#ifndef FRAGNET_NODE_HPP
#define FRAGNET_NODE_HPP

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "exchange/fragment_exchange.hpp"
#include "fragment/fragmenter.hpp"
#include "index/index_client.hpp"
#include "network/tcp_server.hpp"
#include "node/node_error.hpp"
#include "node/provider_locator.hpp"
#include "store/file_catalog.hpp"
#include "store/fragment_store.hpp"

namespace fragnet {
namespace node {

struct NodeOptions {
  std::size_t fragment_size = fragment::DEFAULT_FRAGMENT_SIZE;
  // Fragments fetched at the same time during one download
  std::size_t download_parallelism = 4;
};

struct NodeStats {
  std::size_t stored_fragments = 0;
  std::size_t catalog_files = 0;
  uint64_t uploads = 0;
  uint64_t downloads = 0;
  uint64_t fragments_served = 0;
  uint64_t requests_missed = 0;
  uint64_t requests_rejected = 0;
};

// Drives upload and download and answers other peers' fragment requests.
// Owns the fragment store and the file catalog.
class Node {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Node(const NodeOptions& options,
       std::unique_ptr<store::FragmentStore> store,
       network::TCP_Server& transport,
       index::IndexClient& index_client,
       ProviderLocator& locator);

  Node(const Node&) = delete;
  Node& operator=(const Node&) = delete;

  // Registers the fragment protocol handler with the transport
  void register_handlers();


  // ---- PROCESSING OF USER REQUESTS ----
  // Fragments, stores, catalogs and publishes the file. Throws UploadError; see
  // UploadError::locally_stored() for the published-or-not distinction.
  fragment::FileInfo upload(const std::filesystem::path& file_path);
  // Resolves filename, fetches and verifies every fragment, writes the reassembled
  // file to output_path. Throws FileNotFoundError, FragmentUnavailableError,
  // index::ResolveError, fragment::FragmentError.
  fragment::FileInfo download(const std::string& filename, const std::filesystem::path& output_path);
  // Resolve only
  std::optional<fragment::FileInfo> search(const std::string& filename);
  std::vector<std::string> list_files() const;
  NodeStats stats() const;


  // ---- PROCESSING OF INCOMING DATA ----
  void handle_fragment_stream(network::Stream& stream);


  // ---- GETTERS ----
  store::FragmentStore& get_store() { return *store_; }
  store::FileCatalog& get_catalog() { return catalog_; }
  exchange::FragmentExchange& get_exchange() { return exchange_; }

private:
  // ---- PARAMETERS ----
  NodeOptions options_;
  std::unique_ptr<store::FragmentStore> store_;
  store::FileCatalog catalog_;
  network::TCP_Server& transport_;
  index::IndexClient& index_client_;
  ProviderLocator& locator_;
  exchange::FragmentExchange exchange_;

  std::atomic<uint64_t> uploads_{0};
  std::atomic<uint64_t> downloads_{0};


  // ---- UPLOAD STEPS ----
  void publish(const fragment::FileInfo& info);


  // ---- DOWNLOAD STEPS ----
  // Local store first, then each candidate peer until one returns verified bytes
  fragment::Fragment fetch_fragment(const fragment::FileInfo& info, uint32_t index);
  std::optional<fragment::Bytes> fetch_from_peer(const network::PeerAddress& peer, const std::string& hash);
  std::vector<fragment::Fragment> fetch_all(const fragment::FileInfo& info);
};

} // namespace node
} // namespace fragnet

#endif // FRAGNET_NODE_HPP

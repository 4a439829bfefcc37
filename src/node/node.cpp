#include "node/node.hpp"
#include "crypto/hasher.hpp"
#include <algorithm>
#include <exception>
#include <set>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/log/trivial.hpp>

namespace fragnet {
namespace node {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Node::Node(const NodeOptions& options,
           std::unique_ptr<store::FragmentStore> store,
           network::TCP_Server& transport,
           index::IndexClient& index_client,
           ProviderLocator& locator)
  : options_(options)
  , store_(std::move(store))
  , transport_(transport)
  , index_client_(index_client)
  , locator_(locator)
  , exchange_(*store_, transport) {

  if (options_.fragment_size == 0) {
    throw std::invalid_argument("Node: Fragment size must be positive");
  }
  if (options_.fragment_size > network::MAX_FRAGMENT_SIZE) {
    throw std::invalid_argument("Node: Fragment size " + std::to_string(options_.fragment_size) +
                                " exceeds the largest servable fragment of " +
                                std::to_string(network::MAX_FRAGMENT_SIZE) + " bytes");
  }
  if (options_.download_parallelism == 0) {
    options_.download_parallelism = 1;
  }

  BOOST_LOG_TRIVIAL(info) << "Node: Initialized with fragment size " << options_.fragment_size
                          << " and download parallelism " << options_.download_parallelism;
}

void Node::register_handlers() {
  transport_.set_handler(exchange::FRAGMENT_PROTOCOL_ID,
                         [this](network::Stream& stream) { handle_fragment_stream(stream); });
}

//==============================================
// UPLOAD
//==============================================

fragment::FileInfo Node::upload(const std::filesystem::path& file_path) {
  const std::string filename = file_path.filename().string();
  BOOST_LOG_TRIVIAL(info) << "Node: Uploading " << file_path.string();

  std::vector<fragment::Fragment> fragments;
  try {
    fragments = fragment::Fragmenter::fragment_file(file_path, options_.fragment_size);
  } catch (const fragment::FragmentError& e) {
    BOOST_LOG_TRIVIAL(error) << "Node: Failed to fragment " << file_path.string() << ": " << e.what();
    throw UploadError(e.what(), false);
  } catch (const crypto::CryptoError& e) {
    BOOST_LOG_TRIVIAL(error) << "Node: Failed to hash fragments of " << file_path.string() << ": " << e.what();
    throw UploadError(e.what(), false);
  }

  // Store fragments locally
  try {
    for (const auto& fragment : fragments) {
      store_->put(fragment.hash, fragment.data);
    }
  } catch (const store::StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Node: Failed to store fragments of " << filename << ": " << e.what();
    throw UploadError(e.what(), false);
  } catch (const crypto::CryptoError& e) {
    BOOST_LOG_TRIVIAL(error) << "Node: Failed to verify fragments of " << filename << ": " << e.what();
    throw UploadError(e.what(), false);
  }

  fragment::FileInfo info = fragment::Fragmenter::describe(filename, fragments);
  catalog_.put(filename, info);

  try {
    publish(info);
  } catch (const index::PublishError& e) {
    BOOST_LOG_TRIVIAL(error) << "Node: " << filename << " is stored locally but not published: " << e.what();
    throw UploadError(std::string(e.what()) + " (stored locally, not discoverable by name)", true);
  }

  ++uploads_;
  BOOST_LOG_TRIVIAL(info) << "Node: Uploaded " << filename << " with " << info.total_fragments
                          << " fragments (" << info.file_size << " bytes)";
  return info;
}

void Node::publish(const fragment::FileInfo& info) {
  index_client_.publish(info.filename, info);

  // Identical fragments within one file share a hash, announce each once
  const network::PeerAddress self = transport_.local_address();
  std::set<std::string> announced;
  for (const auto& hash : info.fragment_hashes) {
    if (announced.insert(hash).second) {
      index_client_.announce_provider(hash, self);
    }
  }
}

//==============================================
// DOWNLOAD
//==============================================

std::optional<fragment::FileInfo> Node::search(const std::string& filename) {
  return index_client_.resolve(filename);
}

fragment::FileInfo Node::download(const std::string& filename, const std::filesystem::path& output_path) {
  BOOST_LOG_TRIVIAL(info) << "Node: Downloading " << filename << " to " << output_path.string();

  auto resolved = index_client_.resolve(filename);
  if (!resolved) {
    throw FileNotFoundError(filename);
  }

  const fragment::FileInfo& info = *resolved;
  if (info.fragment_hashes.size() != info.total_fragments) {
    throw index::ResolveError("record for " + filename + " lists " +
                              std::to_string(info.fragment_hashes.size()) + " hashes for " +
                              std::to_string(info.total_fragments) + " fragments");
  }

  std::vector<fragment::Fragment> fragments = fetch_all(info);
  fragment::Bytes data = fragment::Fragmenter::assemble(std::move(fragments), info.total_fragments);
  fragment::Fragmenter::write_file(output_path, data);

  ++downloads_;
  BOOST_LOG_TRIVIAL(info) << "Node: Downloaded " << filename << " (" << data.size() << " bytes, "
                          << info.total_fragments << " fragments)";
  return info;
}

std::vector<fragment::Fragment> Node::fetch_all(const fragment::FileInfo& info) {
  const std::size_t total = info.total_fragments;
  std::vector<fragment::Fragment> fragments(total);
  std::vector<std::exception_ptr> errors(total);

  {
    boost::asio::thread_pool pool(std::min(options_.download_parallelism, std::max<std::size_t>(total, 1)));
    for (std::size_t i = 0; i < total; ++i) {
      boost::asio::post(pool, [this, &info, &fragments, &errors, i]() {
        try {
          fragments[i] = fetch_fragment(info, static_cast<uint32_t>(i));
        } catch (const std::exception&) {
          errors[i] = std::current_exception();
        }
      });
    }
    pool.join();
  }

  for (const auto& error : errors) {
    if (error) {
      std::rethrow_exception(error);
    }
  }
  return fragments;
}

fragment::Fragment Node::fetch_fragment(const fragment::FileInfo& info, uint32_t index) {
  fragment::Fragment fragment;
  fragment.hash = info.fragment_hashes[index];
  fragment.index = index;
  fragment.total_fragments = info.total_fragments;
  fragment.filename = info.filename;

  auto local = store_->get(fragment.hash);
  if (local && crypto::Hasher::sha256_hex(*local) != fragment.hash) {
    BOOST_LOG_TRIVIAL(warning) << "Node: Local copy of " << fragment.hash << " is corrupted, refetching";
    local.reset();
  }
  if (local) {
    BOOST_LOG_TRIVIAL(debug) << "Node: Fragment " << index << " of " << info.filename << " found locally";
    fragment.data = std::move(*local);
    return fragment;
  }

  const network::PeerAddress self = transport_.local_address();
  for (const auto& peer : locator_.candidates(fragment.hash)) {
    if (peer == self) {
      continue;
    }

    auto data = fetch_from_peer(peer, fragment.hash);
    if (!data) {
      continue;
    }

    // Consumer write, makes the fragment servable from here on
    store_->put(fragment.hash, *data);
    fragment.data = std::move(*data);
    BOOST_LOG_TRIVIAL(debug) << "Node: Fragment " << index << " of " << info.filename
                             << " fetched from " << peer.to_string();
    return fragment;
  }

  BOOST_LOG_TRIVIAL(error) << "Node: No candidate could supply fragment " << index << " of "
                           << info.filename << " (" << fragment.hash << ")";
  throw FragmentUnavailableError(fragment.hash);
}

std::optional<fragment::Bytes> Node::fetch_from_peer(const network::PeerAddress& peer, const std::string& hash) {
  network::FragmentResponse response;
  try {
    response = exchange_.request(peer, hash);
  } catch (const network::NetworkException& e) {
    BOOST_LOG_TRIVIAL(warning) << "Node: Peer " << peer.to_string() << " failed for " << hash << ": " << e.what();
    return std::nullopt;
  }

  if (!response.found) {
    BOOST_LOG_TRIVIAL(debug) << "Node: Peer " << peer.to_string() << " does not hold " << hash;
    return std::nullopt;
  }

  if (crypto::Hasher::sha256_hex(response.data) != hash) {
    BOOST_LOG_TRIVIAL(warning) << "Node: Peer " << peer.to_string() << " sent corrupted data for " << hash;
    return std::nullopt;
  }

  return std::move(response.data);
}

//==============================================
// QUERIES
//==============================================

std::vector<std::string> Node::list_files() const {
  return catalog_.list();
}

NodeStats Node::stats() const {
  NodeStats stats;
  stats.stored_fragments = store_->size();
  stats.catalog_files = catalog_.size();
  stats.uploads = uploads_;
  stats.downloads = downloads_;
  stats.fragments_served = exchange_.fragments_served();
  stats.requests_missed = exchange_.requests_missed();
  stats.requests_rejected = exchange_.requests_rejected();
  return stats;
}

//==============================================
// PROCESSING OF INCOMING DATA
//==============================================

void Node::handle_fragment_stream(network::Stream& stream) {
  exchange_.handle_stream(stream);
}

} // namespace node
} // namespace fragnet

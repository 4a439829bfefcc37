#include "index/index_client.hpp"
#include "crypto/hasher.hpp"
#include "network/codec.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace fragnet {
namespace index {

IndexClient::IndexClient(DistributedIndex& index) : index_(index) {
}

//==============================================
// CONTENT IDENTIFIERS
//==============================================

std::string IndexClient::content_id(const std::string& filename) {
  return "file/" + crypto::Hasher::sha256_hex(filename);
}

std::string IndexClient::provider_key(const std::string& hash) {
  return "providers/" + hash;
}

//==============================================
// FILE METADATA
//==============================================

void IndexClient::publish(const std::string& filename, const fragment::FileInfo& info) {
  const std::string key = content_id(filename);
  BOOST_LOG_TRIVIAL(info) << "Index client: Publishing " << filename << " as " << key;

  try {
    index_.put(key, network::Codec::encode(info));
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Index client: Failed to publish " << filename << ": " << e.what();
    throw PublishError("failed to publish " + filename + ": " + e.what());
  }

  BOOST_LOG_TRIVIAL(debug) << "Index client: Published " << filename << " with "
                           << info.total_fragments << " fragments";
}

std::optional<fragment::FileInfo> IndexClient::resolve(const std::string& filename) {
  const std::string key = content_id(filename);
  BOOST_LOG_TRIVIAL(info) << "Index client: Resolving " << filename << " as " << key;

  std::optional<Bytes> record;
  try {
    record = index_.get(key);
  } catch (const IndexError& e) {
    BOOST_LOG_TRIVIAL(error) << "Index client: Lookup of " << filename << " failed: " << e.what();
    throw ResolveError("lookup of " + filename + " failed: " + e.what());
  }

  if (!record) {
    BOOST_LOG_TRIVIAL(info) << "Index client: " << filename << " is not published";
    return std::nullopt;
  }

  fragment::FileInfo info;
  try {
    info = network::Codec::decode<fragment::FileInfo>(*record);
  } catch (const network::ProtocolError& e) {
    BOOST_LOG_TRIVIAL(error) << "Index client: Record for " << filename << " is corrupt: " << e.what();
    throw ResolveError("record for " + filename + " is corrupt: " + e.what());
  }

  if (info.filename != filename) {
    throw ResolveError("record under " + key + " describes " + info.filename + ", not " + filename);
  }

  return info;
}

//==============================================
// PROVIDER RECORDS
//==============================================

void IndexClient::announce_provider(const std::string& hash, const network::PeerAddress& provider) {
  std::lock_guard<std::mutex> lock(announce_mutex_);
  const std::string key = provider_key(hash);

  try {
    network::ProviderRecord record;
    record.hash = hash;

    auto existing = index_.get(key);
    if (existing) {
      record = network::Codec::decode<network::ProviderRecord>(*existing);
    }

    if (std::find(record.providers.begin(), record.providers.end(), provider) != record.providers.end()) {
      return;
    }

    record.providers.push_back(provider);
    index_.put(key, network::Codec::encode(record));
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Index client: Failed to announce " << provider.to_string()
                             << " for " << hash << ": " << e.what();
    throw PublishError("failed to announce provider for " + hash + ": " + e.what());
  }

  BOOST_LOG_TRIVIAL(trace) << "Index client: Announced " << provider.to_string() << " as provider of " << hash;
}

std::vector<network::PeerAddress> IndexClient::find_providers(const std::string& hash) {
  const std::string key = provider_key(hash);

  try {
    auto existing = index_.get(key);
    if (!existing) {
      return {};
    }
    return network::Codec::decode<network::ProviderRecord>(*existing).providers;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Index client: Provider lookup for " << hash << " failed: " << e.what();
    throw ResolveError("provider lookup for " + hash + " failed: " + e.what());
  }
}

} // namespace index
} // namespace fragnet

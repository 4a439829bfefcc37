#include "store/fragment_store.hpp"
#include "crypto/hasher.hpp"
#include <fstream>
#include <iterator>
#include <mutex>
#include <boost/log/trivial.hpp>

namespace fragnet {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

FragmentStore::FragmentStore(const std::filesystem::path& base_path) : base_path_(base_path) {
  BOOST_LOG_TRIVIAL(info) << "Fragment store: Initializing with base path: " << base_path.string();

  std::error_code ec;
  std::filesystem::create_directories(base_path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Fragment store: Failed to create base path: " << ec.message();
    throw StoreError("Fragment store: Failed to create directory " + base_path.string());
  }
}

//==============================================
// CORE STORAGE OPERATIONS
//==============================================

void FragmentStore::put(const std::string& hash, const fragment::Bytes& data) {
  // Hash outside the lock, it is the expensive part
  std::string actual = crypto::Hasher::sha256_hex(data);
  if (actual != hash) {
    BOOST_LOG_TRIVIAL(error) << "Fragment store: Rejecting " << data.size() << " bytes offered as "
                             << hash << ", content hashes to " << actual;
    throw HashMismatchError("data for " + hash + " hashes to " + actual);
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (fragments_.count(hash) > 0) {
    BOOST_LOG_TRIVIAL(trace) << "Fragment store: Fragment already stored: " << hash;
    return;
  }

  if (base_path_) {
    write_to_disk(hash, data);
  }

  fragments_.emplace(hash, data);
  BOOST_LOG_TRIVIAL(debug) << "Fragment store: Stored " << data.size() << " bytes with hash: " << hash;
}

std::optional<fragment::Bytes> FragmentStore::get(const std::string& hash) const {
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = fragments_.find(hash);
    if (it != fragments_.end()) {
      return it->second;
    }
  }

  if (!base_path_ || !crypto::Hasher::is_hex_digest(hash)) {
    return std::nullopt;
  }

  return read_from_disk(hash);
}

//==============================================
// QUERY OPERATIONS
//==============================================

bool FragmentStore::has(const std::string& hash) const {
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (fragments_.count(hash) > 0) {
      return true;
    }
  }

  if (!base_path_ || !crypto::Hasher::is_hex_digest(hash)) {
    return false;
  }

  std::error_code ec;
  return std::filesystem::exists(get_path_for_hash(hash), ec);
}

std::size_t FragmentStore::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return fragments_.size();
}

std::vector<std::string> FragmentStore::hashes() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<std::string> result;
  result.reserve(fragments_.size());
  for (const auto& entry : fragments_) {
    result.push_back(entry.first);
  }
  return result;
}

//==============================================
// CAS STORAGE SUPPORT
//==============================================

std::filesystem::path FragmentStore::get_path_for_hash(const std::string& hash) const {
  std::filesystem::path path = *base_path_;

  for (size_t i = 0; i < 6; i += 2) {
    path /= hash.substr(i, 2);
  }

  path /= hash.substr(6);
  return path;
}

void FragmentStore::write_to_disk(const std::string& hash, const fragment::Bytes& data) const {
  std::filesystem::path file_path = get_path_for_hash(hash);

  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  if (ec) {
    throw StoreError("Fragment store: Failed to create directory: " + file_path.parent_path().string());
  }

  // Open output file in binary mode for cross-platform consistency
  std::ofstream file(file_path, std::ios::binary | std::ios::trunc);
  if (!file) {
    throw StoreError("Fragment store: Failed to create file: " + file_path.string());
  }

  file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
  file.close();
  if (!file) {
    throw StoreError("Fragment store: Failed to write file: " + file_path.string());
  }

  BOOST_LOG_TRIVIAL(trace) << "Fragment store: Persisted fragment to " << file_path.string();
}

std::optional<fragment::Bytes> FragmentStore::read_from_disk(const std::string& hash) const {
  std::filesystem::path file_path = get_path_for_hash(hash);

  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    return std::nullopt;
  }

  fragment::Bytes data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (file.bad()) {
    BOOST_LOG_TRIVIAL(error) << "Fragment store: Failed to read " << file_path.string();
    throw StoreError("Fragment store: Failed to read file: " + file_path.string());
  }

  // Files on disk may have been altered since they were written
  if (crypto::Hasher::sha256_hex(data) != hash) {
    BOOST_LOG_TRIVIAL(warning) << "Fragment store: Ignoring corrupted fragment on disk: " << file_path.string();
    return std::nullopt;
  }

  return data;
}

} // namespace store
} // namespace fragnet

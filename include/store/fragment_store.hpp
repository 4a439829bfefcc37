#ifndef FRAGNET_FRAGMENT_STORE_HPP
#define FRAGNET_FRAGMENT_STORE_HPP

#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "fragment/fragment.hpp"
#include "store/store_error.hpp"

namespace fragnet {
namespace store {

// Content-addressed map from fragment hash to fragment bytes.
// Readers share the lock, so any number of request handlers can look up concurrently.
class FragmentStore {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Memory only
  FragmentStore() = default;
  // Memory with write-through to base_path
  explicit FragmentStore(const std::filesystem::path& base_path);

  FragmentStore(const FragmentStore&) = delete;
  FragmentStore& operator=(const FragmentStore&) = delete;


  // ---- CORE STORAGE OPERATIONS ----
  // Stores data under hash. Throws HashMismatchError if data does not hash to hash,
  // StoreError if persisting to disk fails. Re-inserting a stored hash is a no-op.
  void put(const std::string& hash, const fragment::Bytes& data);
  // Returns the bytes for hash, or nullopt if absent
  std::optional<fragment::Bytes> get(const std::string& hash) const;


  // ---- QUERY OPERATIONS ----
  bool has(const std::string& hash) const;
  std::size_t size() const;
  std::vector<std::string> hashes() const;
  bool is_persistent() const { return base_path_.has_value(); }

private:
  // ---- PARAMETERS ----
  std::optional<std::filesystem::path> base_path_;
  std::unordered_map<std::string, fragment::Bytes> fragments_;
  mutable std::shared_mutex mutex_;


  // ---- CAS STORAGE SUPPORT ----
  // {base_path}/{hash[0:2]}/{hash[2:4]}/{hash[4:6]}/{remaining_hash}
  std::filesystem::path get_path_for_hash(const std::string& hash) const;
  void write_to_disk(const std::string& hash, const fragment::Bytes& data) const;
  std::optional<fragment::Bytes> read_from_disk(const std::string& hash) const;
};

} // namespace store
} // namespace fragnet

#endif // FRAGNET_FRAGMENT_STORE_HPP

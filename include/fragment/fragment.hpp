#ifndef FRAGNET_FRAGMENT_HPP
#define FRAGNET_FRAGMENT_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace fragnet {
namespace fragment {

using Bytes = std::vector<uint8_t>;

// Default fragment size, 256 KiB
constexpr std::size_t DEFAULT_FRAGMENT_SIZE = 256 * 1024;

// A hashed, ordered chunk of a file.
// Invariant: hash == sha256_hex(data)
struct Fragment {
  std::string hash;
  Bytes data;
  uint32_t index = 0;
  uint32_t total_fragments = 0;
  std::string filename;
};

// Reassembly recipe for one file. fragment_hashes[i] is the hash of fragment i.
struct FileInfo {
  std::string filename;
  std::vector<std::string> fragment_hashes;
  uint32_t total_fragments = 0;
  uint64_t file_size = 0;

  bool operator==(const FileInfo& other) const {
    return filename == other.filename
        && fragment_hashes == other.fragment_hashes
        && total_fragments == other.total_fragments
        && file_size == other.file_size;
  }
  bool operator!=(const FileInfo& other) const { return !(*this == other); }
};

} // namespace fragment
} // namespace fragnet

#endif // FRAGNET_FRAGMENT_HPP

#ifndef FRAGNET_FRAGMENTER_HPP
#define FRAGNET_FRAGMENTER_HPP

#include <filesystem>
#include <string>
#include <vector>
#include "fragment/fragment.hpp"
#include "fragment/fragment_error.hpp"

namespace fragnet {
namespace fragment {

// Stateless file <-> fragment sequence transformation
class Fragmenter {
public:
  // ---- FRAGMENTATION ----
  // Splits bytes into ceil(N / fragment_size) hashed fragments. An empty input yields
  // no fragments. Throws std::invalid_argument if fragment_size is zero.
  static std::vector<Fragment> fragment(const Bytes& data, const std::string& filename,
                                        std::size_t fragment_size = DEFAULT_FRAGMENT_SIZE);
  // Reads the whole file and fragments it under its final path component.
  // Throws ReadError if the file is missing, not regular, or unreadable.
  static std::vector<Fragment> fragment_file(const std::filesystem::path& path,
                                             std::size_t fragment_size = DEFAULT_FRAGMENT_SIZE);

  
  // ---- REASSEMBLY ----
  // Verifies count, index range and every hash, then concatenates in index order.
  // Throws IncompleteError or IntegrityError. The input is not modified.
  static Bytes assemble(std::vector<Fragment> fragments, uint32_t expected_total);

  
  // ---- FILE INFO ----
  // Builds the catalog record for a fragment sequence produced by fragment()
  static FileInfo describe(const std::string& filename, const std::vector<Fragment>& fragments);

  
  // ---- FILE I/O ----
  static Bytes read_file(const std::filesystem::path& path);
  static void write_file(const std::filesystem::path& path, const Bytes& data);
};

} // namespace fragment
} // namespace fragnet

#endif // FRAGNET_FRAGMENTER_HPP

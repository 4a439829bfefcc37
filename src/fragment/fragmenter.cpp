#include "fragment/fragmenter.hpp"
#include "crypto/hasher.hpp"
#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace fragnet {
namespace fragment {

//==============================================
// FRAGMENTATION
//==============================================

std::vector<Fragment> Fragmenter::fragment(const Bytes& data, const std::string& filename,
                                           std::size_t fragment_size) {
  if (fragment_size == 0) {
    BOOST_LOG_TRIVIAL(error) << "Fragmenter: Fragment size must be positive";
    throw std::invalid_argument("Fragmenter: Fragment size must be positive");
  }

  const std::size_t total = (data.size() + fragment_size - 1) / fragment_size;
  BOOST_LOG_TRIVIAL(debug) << "Fragmenter: Splitting " << data.size() << " bytes of " << filename
                           << " into " << total << " fragments of up to " << fragment_size << " bytes";

  std::vector<Fragment> fragments;
  fragments.reserve(total);

  for (std::size_t i = 0; i < total; ++i) {
    const std::size_t start = i * fragment_size;
    const std::size_t end = std::min(start + fragment_size, data.size());

    Fragment fragment;
    fragment.data.assign(data.begin() + start, data.begin() + end);
    fragment.hash = crypto::Hasher::sha256_hex(fragment.data);
    fragment.index = static_cast<uint32_t>(i);
    fragment.total_fragments = static_cast<uint32_t>(total);
    fragment.filename = filename;
    fragments.push_back(std::move(fragment));
  }

  return fragments;
}

std::vector<Fragment> Fragmenter::fragment_file(const std::filesystem::path& path,
                                                std::size_t fragment_size) {
  Bytes data = read_file(path);
  auto fragments = fragment(data, path.filename().string(), fragment_size);
  BOOST_LOG_TRIVIAL(info) << "Fragmenter: Fragmented " << path.string() << " into "
                          << fragments.size() << " fragments";
  return fragments;
}

//==============================================
// REASSEMBLY
//==============================================

Bytes Fragmenter::assemble(std::vector<Fragment> fragments, uint32_t expected_total) {
  if (fragments.size() != expected_total) {
    BOOST_LOG_TRIVIAL(error) << "Fragmenter: Incomplete fragment set: " << fragments.size()
                             << "/" << expected_total;
    throw IncompleteError("have " + std::to_string(fragments.size()) + " of " +
                          std::to_string(expected_total) + " fragments");
  }

  // Arrival order is irrelevant, concatenation is always by index
  std::sort(fragments.begin(), fragments.end(),
            [](const Fragment& a, const Fragment& b) { return a.index < b.index; });

  std::size_t total_size = 0;
  for (std::size_t i = 0; i < fragments.size(); ++i) {
    const Fragment& fragment = fragments[i];

    if (fragment.total_fragments != expected_total) {
      throw IncompleteError("fragment " + std::to_string(fragment.index) + " belongs to a " +
                            std::to_string(fragment.total_fragments) + "-fragment file, expected " +
                            std::to_string(expected_total));
    }

    // Sorted, so any gap or duplicate shows up as index != position
    if (fragment.index != i) {
      BOOST_LOG_TRIVIAL(error) << "Fragmenter: Fragment index " << fragment.index
                               << " found at position " << i;
      throw IncompleteError("fragment indices are not contiguous at position " + std::to_string(i));
    }

    std::string actual = crypto::Hasher::sha256_hex(fragment.data);
    if (actual != fragment.hash) {
      BOOST_LOG_TRIVIAL(error) << "Fragmenter: Hash mismatch for fragment " << fragment.index
                               << ": declared " << fragment.hash << ", computed " << actual;
      throw IntegrityError("fragment " + std::to_string(fragment.index) + " does not match hash " +
                           fragment.hash);
    }

    total_size += fragment.data.size();
  }

  Bytes output;
  output.reserve(total_size);
  for (const auto& fragment : fragments) {
    output.insert(output.end(), fragment.data.begin(), fragment.data.end());
  }

  BOOST_LOG_TRIVIAL(debug) << "Fragmenter: Assembled " << fragments.size() << " fragments into "
                           << output.size() << " bytes";
  return output;
}

//==============================================
// FILE INFO
//==============================================

FileInfo Fragmenter::describe(const std::string& filename, const std::vector<Fragment>& fragments) {
  FileInfo info;
  info.filename = filename;
  info.total_fragments = static_cast<uint32_t>(fragments.size());
  info.fragment_hashes.resize(fragments.size());

  for (const auto& fragment : fragments) {
    if (fragment.index >= fragments.size()) {
      throw IncompleteError("fragment index " + std::to_string(fragment.index) + " out of range");
    }
    info.fragment_hashes[fragment.index] = fragment.hash;
    info.file_size += fragment.data.size();
  }
  return info;
}

//==============================================
// FILE I/O
//==============================================

Bytes Fragmenter::read_file(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    BOOST_LOG_TRIVIAL(error) << "Fragmenter: Not a regular file: " << path.string();
    throw ReadError("file does not exist or is not a regular file: " + path.string());
  }

  // Open file in binary mode to handle all file types correctly
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw ReadError("failed to open file: " + path.string());
  }

  Bytes data;
  char buffer[4096];

  while (file.read(buffer, sizeof(buffer))) {
    data.insert(data.end(), buffer, buffer + file.gcount());
  }

  // Handle final partial chunk if present
  if (file.gcount() > 0) {
    data.insert(data.end(), buffer, buffer + file.gcount());
  }

  if (file.bad()) {
    throw ReadError("failed while reading file: " + path.string());
  }

  BOOST_LOG_TRIVIAL(debug) << "Fragmenter: Read " << data.size() << " bytes from " << path.string();
  return data;
}

void Fragmenter::write_file(const std::filesystem::path& path, const Bytes& data) {
  if (path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      throw WriteError("failed to create directory " + path.parent_path().string() + ": " + ec.message());
    }
  }

  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file) {
    throw WriteError("failed to create file: " + path.string());
  }

  file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
  file.close();
  if (!file) {
    throw WriteError("failed to write file: " + path.string());
  }

  BOOST_LOG_TRIVIAL(debug) << "Fragmenter: Wrote " << data.size() << " bytes to " << path.string();
}

} // namespace fragment
} // namespace fragnet

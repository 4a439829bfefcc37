#ifndef FRAGNET_TEST_UTILS_HPP
#define FRAGNET_TEST_UTILS_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <vector>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>

// Keeps test output readable, raise to debug when chasing a failure
inline void init_test_logging(boost::log::trivial::severity_level level = boost::log::trivial::warning) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
}

inline std::vector<uint8_t> random_bytes(std::size_t size, uint32_t seed = 42) {
  std::mt19937 gen(seed);
  std::uniform_int_distribution<int> dis(0, 255);
  std::vector<uint8_t> data(size);
  for (auto& byte : data) {
    byte = static_cast<uint8_t>(dis(gen));
  }
  return data;
}

// Unique directory under the system temp dir, removed on destruction
class TempDir {
public:
  explicit TempDir(const std::string& prefix) {
    path_ = std::filesystem::temp_directory_path() /
      (prefix + "_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) +
       "_" + std::to_string(counter()++));
    std::filesystem::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }

  std::filesystem::path write_file(const std::string& name, const std::vector<uint8_t>& data) const {
    const auto file = path_ / name;
    std::ofstream out(file, std::ios::binary);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    return file;
  }

  std::vector<uint8_t> read_file(const std::string& name) const {
    std::ifstream in(path_ / name, std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  }

private:
  std::filesystem::path path_;

  static int& counter() {
    static int value = 0;
    return value;
  }
};

#endif // FRAGNET_TEST_UTILS_HPP

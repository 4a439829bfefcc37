#include <gtest/gtest.h>
#include "store/file_catalog.hpp"

using namespace fragnet::store;
using fragnet::fragment::FileInfo;

namespace {

FileInfo make_info(const std::string& filename, uint32_t total) {
  FileInfo info;
  info.filename = filename;
  info.total_fragments = total;
  for (uint32_t i = 0; i < total; ++i) {
    info.fragment_hashes.push_back(std::string(64, static_cast<char>('a' + i % 6)));
  }
  info.file_size = total * 1024;
  return info;
}

} // namespace

TEST(FileCatalogTest, PutThenGet) {
  FileCatalog catalog;
  const auto info = make_info("a.txt", 3);
  catalog.put("a.txt", info);

  auto result = catalog.get("a.txt");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, info);
  EXPECT_FALSE(catalog.get("b.txt").has_value());
}

TEST(FileCatalogTest, PutOverwrites) {
  FileCatalog catalog;
  catalog.put("a.txt", make_info("a.txt", 3));
  catalog.put("a.txt", make_info("a.txt", 5));

  EXPECT_EQ(catalog.size(), 1u);
  EXPECT_EQ(catalog.get("a.txt")->total_fragments, 5u);
}

TEST(FileCatalogTest, ListIsSorted) {
  FileCatalog catalog;
  catalog.put("zeta", make_info("zeta", 1));
  catalog.put("alpha", make_info("alpha", 1));
  catalog.put("mid", make_info("mid", 1));

  EXPECT_EQ(catalog.list(), (std::vector<std::string>{"alpha", "mid", "zeta"}));
}

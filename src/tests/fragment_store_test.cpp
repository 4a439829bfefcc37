#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <fstream>
#include <thread>
#include <vector>
#include "crypto/hasher.hpp"
#include "store/fragment_store.hpp"
#include "test_utils.hpp"

using namespace fragnet::store;
using fragnet::crypto::Hasher;

class FragmentStoreTest : public ::testing::Test {
protected:
  FragmentStore store;

  void SetUp() override {
    init_test_logging();
  }

  // Stores data under its own hash and returns the hash
  std::string put_bytes(FragmentStore& target, const std::vector<uint8_t>& data) {
    const std::string hash = Hasher::sha256_hex(data);
    target.put(hash, data);
    return hash;
  }
};

TEST_F(FragmentStoreTest, PutThenGet) {
  const auto data = random_bytes(1024);
  const auto hash = put_bytes(store, data);

  EXPECT_TRUE(store.has(hash));
  auto result = store.get(hash);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, data);
  EXPECT_EQ(store.size(), 1u);
}

TEST_F(FragmentStoreTest, UnknownHashIsAbsent) {
  const std::string hash = Hasher::sha256_hex(std::string("never stored"));
  EXPECT_FALSE(store.has(hash));
  EXPECT_FALSE(store.get(hash).has_value());
  EXPECT_FALSE(store.get("not-a-hash").has_value());
}

TEST_F(FragmentStoreTest, MismatchedDataIsRejected) {
  const auto data = random_bytes(64);
  const std::string wrong_hash = Hasher::sha256_hex(random_bytes(64, 99));

  EXPECT_THROW(store.put(wrong_hash, data), HashMismatchError);
  EXPECT_FALSE(store.has(wrong_hash));
  EXPECT_EQ(store.size(), 0u);
}

TEST_F(FragmentStoreTest, ReinsertIsNoOp) {
  const auto data = random_bytes(256);
  const auto hash = put_bytes(store, data);
  EXPECT_NO_THROW(store.put(hash, data));

  EXPECT_EQ(store.size(), 1u);
  EXPECT_EQ(*store.get(hash), data);
}

TEST_F(FragmentStoreTest, IdenticalContentSharesOneEntry) {
  const std::vector<uint8_t> data(512, 0x00);
  put_bytes(store, data);
  put_bytes(store, data);
  EXPECT_EQ(store.size(), 1u);
}

TEST_F(FragmentStoreTest, HashesListsEveryEntry) {
  std::vector<std::string> expected;
  for (uint32_t i = 0; i < 5; ++i) {
    expected.push_back(put_bytes(store, random_bytes(100, i)));
  }

  auto listed = store.hashes();
  std::sort(listed.begin(), listed.end());
  std::sort(expected.begin(), expected.end());
  EXPECT_EQ(listed, expected);
  EXPECT_FALSE(store.is_persistent());
}

TEST_F(FragmentStoreTest, ConcurrentReadersAndWriters) {
  const int num_threads = 8;
  const int per_thread = 25;
  std::atomic<int> failures{0};
  std::vector<std::thread> threads;

  for (int t = 0; t < num_threads; ++t) {
    threads.emplace_back([this, t, per_thread, &failures]() {
      for (int i = 0; i < per_thread; ++i) {
        const auto data = random_bytes(200, static_cast<uint32_t>(t * 1000 + i));
        const auto hash = Hasher::sha256_hex(data);
        store.put(hash, data);
        auto result = store.get(hash);
        if (!result || *result != data) {
          ++failures;
        }
      }
    });
  }

  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(failures.load(), 0);
  EXPECT_EQ(store.size(), static_cast<std::size_t>(num_threads * per_thread));
}

TEST_F(FragmentStoreTest, PersistentStoreUsesCasLayout) {
  TempDir dir("fragment_store_test");
  FragmentStore disk_store(dir.path());
  ASSERT_TRUE(disk_store.is_persistent());

  const auto data = random_bytes(300);
  const auto hash = put_bytes(disk_store, data);

  const auto expected_path = dir.path() / hash.substr(0, 2) / hash.substr(2, 2) / hash.substr(4, 2) / hash.substr(6);
  EXPECT_TRUE(std::filesystem::exists(expected_path));
}

TEST_F(FragmentStoreTest, PersistentStoreSurvivesReopen) {
  TempDir dir("fragment_store_test");
  const auto data = random_bytes(300);
  std::string hash;
  {
    FragmentStore disk_store(dir.path());
    hash = put_bytes(disk_store, data);
  }

  FragmentStore reopened(dir.path());
  EXPECT_TRUE(reopened.has(hash));
  auto result = reopened.get(hash);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, data);
}

TEST_F(FragmentStoreTest, CorruptedFileOnDiskIsIgnored) {
  TempDir dir("fragment_store_test");
  const auto data = random_bytes(300);
  std::string hash;
  {
    FragmentStore disk_store(dir.path());
    hash = put_bytes(disk_store, data);
  }

  const auto path = dir.path() / hash.substr(0, 2) / hash.substr(2, 2) / hash.substr(4, 2) / hash.substr(6);
  {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << "tampered";
  }

  FragmentStore reopened(dir.path());
  EXPECT_FALSE(reopened.get(hash).has_value());
}

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "crypto/hasher.hpp"
#include "index/index_client.hpp"
#include "index/index_error.hpp"
#include "index/memory_index.hpp"
#include "network/codec.hpp"
#include "test_utils.hpp"

using namespace fragnet::index;
using fragnet::fragment::FileInfo;
using fragnet::network::PeerAddress;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

class MockDistributedIndex : public DistributedIndex {
public:
  MOCK_METHOD(void, put, (const std::string& key, const Bytes& value), (override));
  MOCK_METHOD(std::optional<Bytes>, get, (const std::string& key), (override));
};

class IndexClientTest : public ::testing::Test {
protected:
  MemoryIndex index;
  IndexClient client{index};

  void SetUp() override {
    init_test_logging(boost::log::trivial::fatal);
  }

  static FileInfo make_info(const std::string& filename) {
    FileInfo info;
    info.filename = filename;
    info.fragment_hashes = {fragnet::crypto::Hasher::sha256_hex(std::string("one")),
                            fragnet::crypto::Hasher::sha256_hex(std::string("two"))};
    info.total_fragments = 2;
    info.file_size = 6;
    return info;
  }
};

TEST_F(IndexClientTest, ContentIdIsDeterministic) {
  EXPECT_EQ(IndexClient::content_id("report.pdf"), IndexClient::content_id("report.pdf"));
  EXPECT_NE(IndexClient::content_id("report.pdf"), IndexClient::content_id("report2.pdf"));
  EXPECT_EQ(IndexClient::content_id("a"), "file/" + fragnet::crypto::Hasher::sha256_hex(std::string("a")));
}

TEST_F(IndexClientTest, PublishThenResolve) {
  const auto info = make_info("report.pdf");
  client.publish("report.pdf", info);

  auto resolved = client.resolve("report.pdf");
  ASSERT_TRUE(resolved.has_value());
  EXPECT_EQ(*resolved, info);
}

TEST_F(IndexClientTest, UnpublishedNameResolvesToNothing) {
  EXPECT_FALSE(client.resolve("missing.bin").has_value());
}

TEST_F(IndexClientTest, RepublishReplacesRecord) {
  client.publish("a.txt", make_info("a.txt"));

  auto updated = make_info("a.txt");
  updated.fragment_hashes.pop_back();
  updated.total_fragments = 1;
  updated.file_size = 3;
  client.publish("a.txt", updated);

  EXPECT_EQ(*client.resolve("a.txt"), updated);
}

TEST_F(IndexClientTest, CorruptRecordFailsResolve) {
  index.put(IndexClient::content_id("bad.bin"), Bytes{0x20, 0x01});
  EXPECT_THROW(client.resolve("bad.bin"), ResolveError);
}

TEST_F(IndexClientTest, RecordForAnotherNameFailsResolve) {
  index.put(IndexClient::content_id("one.bin"), fragnet::network::Codec::encode(make_info("two.bin")));
  EXPECT_THROW(client.resolve("one.bin"), ResolveError);
}

TEST_F(IndexClientTest, ProvidersAccumulateWithoutDuplicates) {
  const std::string hash = make_info("x").fragment_hashes[0];
  const PeerAddress first{"127.0.0.1", 3001};
  const PeerAddress second{"127.0.0.1", 3002};

  EXPECT_TRUE(client.find_providers(hash).empty());

  client.announce_provider(hash, first);
  client.announce_provider(hash, second);
  client.announce_provider(hash, first);

  EXPECT_EQ(client.find_providers(hash), (std::vector<PeerAddress>{first, second}));
}

TEST(IndexClientMockTest, PublishFailureBecomesPublishError) {
  init_test_logging(boost::log::trivial::fatal);
  MockDistributedIndex index;
  IndexClient client(index);

  EXPECT_CALL(index, put(IndexClient::content_id("a.txt"), _))
    .WillOnce(Throw(IndexError("index unreachable")));

  FileInfo info;
  info.filename = "a.txt";
  EXPECT_THROW(client.publish("a.txt", info), PublishError);
}

TEST(IndexClientMockTest, LookupFailureBecomesResolveError) {
  init_test_logging(boost::log::trivial::fatal);
  MockDistributedIndex index;
  IndexClient client(index);

  EXPECT_CALL(index, get(_)).WillRepeatedly(Throw(IndexError("index unreachable")));

  EXPECT_THROW(client.resolve("a.txt"), ResolveError);
  EXPECT_THROW(client.find_providers(std::string(64, 'a')), ResolveError);
}

TEST(IndexClientMockTest, ResolveReadsContentId) {
  MockDistributedIndex index;
  IndexClient client(index);

  EXPECT_CALL(index, get(IndexClient::content_id("a.txt"))).WillOnce(Return(std::optional<Bytes>()));
  EXPECT_FALSE(client.resolve("a.txt").has_value());
}

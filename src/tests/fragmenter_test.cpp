#include <gtest/gtest.h>
#include <algorithm>
#include <random>
#include "crypto/hasher.hpp"
#include "fragment/fragmenter.hpp"
#include "test_utils.hpp"

using namespace fragnet::fragment;

class FragmenterTest : public ::testing::Test {
protected:
  void SetUp() override {
    init_test_logging();
  }

  static void expect_valid_sequence(const std::vector<Fragment>& fragments, const std::string& filename) {
    for (std::size_t i = 0; i < fragments.size(); ++i) {
      EXPECT_EQ(fragments[i].index, i);
      EXPECT_EQ(fragments[i].total_fragments, fragments.size());
      EXPECT_EQ(fragments[i].filename, filename);
      EXPECT_EQ(fragments[i].hash, fragnet::crypto::Hasher::sha256_hex(fragments[i].data))
        << "Fragment " << i << " hash does not match its data";
    }
  }
};

TEST_F(FragmenterTest, SplitsIntoCeilingCount) {
  const auto data = random_bytes(600 * 1024);
  const auto fragments = Fragmenter::fragment(data, "big.bin", 256 * 1024);

  ASSERT_EQ(fragments.size(), 3u);
  EXPECT_EQ(fragments[0].data.size(), 256u * 1024);
  EXPECT_EQ(fragments[1].data.size(), 256u * 1024);
  EXPECT_EQ(fragments[2].data.size(), 88u * 1024);
  expect_valid_sequence(fragments, "big.bin");

  EXPECT_EQ(Fragmenter::assemble(fragments, 3), data);
}

TEST_F(FragmenterTest, ExactMultipleHasNoShortTail) {
  const auto data = random_bytes(4096);
  const auto fragments = Fragmenter::fragment(data, "exact.bin", 1024);

  ASSERT_EQ(fragments.size(), 4u);
  for (const auto& fragment : fragments) {
    EXPECT_EQ(fragment.data.size(), 1024u);
  }
}

TEST_F(FragmenterTest, SmallInputIsOneFragment) {
  const Bytes data = {'h', 'i'};
  const auto fragments = Fragmenter::fragment(data, "hi.txt");

  ASSERT_EQ(fragments.size(), 1u);
  EXPECT_EQ(fragments[0].data, data);
  expect_valid_sequence(fragments, "hi.txt");
}

TEST_F(FragmenterTest, EmptyInputHasNoFragments) {
  const auto fragments = Fragmenter::fragment(Bytes{}, "empty.txt");
  EXPECT_TRUE(fragments.empty());

  EXPECT_TRUE(Fragmenter::assemble({}, 0).empty());

  const auto info = Fragmenter::describe("empty.txt", fragments);
  EXPECT_EQ(info.total_fragments, 0u);
  EXPECT_EQ(info.file_size, 0u);
}

TEST_F(FragmenterTest, ZeroFragmentSizeIsRejected) {
  EXPECT_THROW(Fragmenter::fragment(random_bytes(10), "x", 0), std::invalid_argument);
}

TEST_F(FragmenterTest, AssembleRestoresOriginalInAnyOrder) {
  const auto data = random_bytes(5100);
  auto fragments = Fragmenter::fragment(data, "test.txt", 1024);
  ASSERT_EQ(fragments.size(), 5u);

  std::mt19937 gen(7);
  std::shuffle(fragments.begin(), fragments.end(), gen);

  EXPECT_EQ(Fragmenter::assemble(fragments, 5), data);
}

TEST_F(FragmenterTest, AssembleDoesNotModifyInput) {
  const auto data = random_bytes(3000);
  auto fragments = Fragmenter::fragment(data, "keep.bin", 1000);
  std::reverse(fragments.begin(), fragments.end());
  const auto before = fragments.front().index;

  Fragmenter::assemble(fragments, 3);
  EXPECT_EQ(fragments.front().index, before);
}

TEST_F(FragmenterTest, MissingFragmentIsIncomplete) {
  auto fragments = Fragmenter::fragment(random_bytes(5100), "test.txt", 1024);
  fragments.erase(fragments.begin() + 2);

  EXPECT_THROW(Fragmenter::assemble(fragments, 5), IncompleteError);
}

TEST_F(FragmenterTest, DuplicateFragmentIsIncomplete) {
  auto fragments = Fragmenter::fragment(random_bytes(5100), "test.txt", 1024);
  fragments[3] = fragments[1];

  EXPECT_THROW(Fragmenter::assemble(fragments, 5), IncompleteError);
}

TEST_F(FragmenterTest, WrongTotalIsIncomplete) {
  auto fragments = Fragmenter::fragment(random_bytes(2048), "two.bin", 1024);
  EXPECT_THROW(Fragmenter::assemble(fragments, 3), IncompleteError);
}

TEST_F(FragmenterTest, TamperedDataFailsIntegrity) {
  auto fragments = Fragmenter::fragment(random_bytes(5100), "test.txt", 1024);
  fragments[2].data[0] ^= 0xFF;

  EXPECT_THROW(Fragmenter::assemble(fragments, 5), IntegrityError);
}

TEST_F(FragmenterTest, DescribeListsHashesInOrder) {
  const auto data = random_bytes(5100);
  const auto fragments = Fragmenter::fragment(data, "test.txt", 1024);
  const auto info = Fragmenter::describe("test.txt", fragments);

  EXPECT_EQ(info.filename, "test.txt");
  EXPECT_EQ(info.total_fragments, 5u);
  EXPECT_EQ(info.file_size, 5100u);
  ASSERT_EQ(info.fragment_hashes.size(), 5u);
  for (std::size_t i = 0; i < fragments.size(); ++i) {
    EXPECT_EQ(info.fragment_hashes[i], fragments[i].hash);
  }
}

TEST_F(FragmenterTest, FragmentFileUsesFinalPathComponent) {
  TempDir dir("fragmenter_test");
  const auto data = random_bytes(2500);
  const auto path = dir.write_file("report.pdf", data);

  const auto fragments = Fragmenter::fragment_file(path, 1000);
  ASSERT_EQ(fragments.size(), 3u);
  expect_valid_sequence(fragments, "report.pdf");
  EXPECT_EQ(Fragmenter::assemble(fragments, 3), data);
}

TEST_F(FragmenterTest, FragmentFileMissingPathIsReadError) {
  TempDir dir("fragmenter_test");
  EXPECT_THROW(Fragmenter::fragment_file(dir.path() / "absent.bin"), ReadError);
  EXPECT_THROW(Fragmenter::fragment_file(dir.path()), ReadError);
}

TEST_F(FragmenterTest, WriteFileCreatesParentDirectories) {
  TempDir dir("fragmenter_test");
  const auto data = random_bytes(100);
  const auto target = dir.path() / "nested" / "deeper" / "out.bin";

  Fragmenter::write_file(target, data);
  EXPECT_EQ(Fragmenter::read_file(target), data);
}

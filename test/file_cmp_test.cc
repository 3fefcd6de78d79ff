#include "dupstat/file_cmp.hh"

#include <gtest/gtest.h>

#include <string>

#include "tmp_tree.hh"

namespace dupstat {
namespace {

namespace fs = std::filesystem;

class FileCmpTest : public test::tmp_tree_t {};

TEST_F(FileCmpTest, EqualAcrossChunkBoundaries) {
  const std::string content(1031, 'z');
  auto a = write_file("a", content);
  auto b = write_file("b", content);
  std::error_code ec;
  for (const uint64_t chunk_sz : {1UL, 16UL, 1024UL, 4096UL}) {
    EXPECT_TRUE(files_equal(a, b, chunk_sz, ec)) << "chunk " << chunk_sz;
    EXPECT_FALSE(ec);
  }
}

TEST_F(FileCmpTest, DifferenceInLastByte) {
  auto a = write_file("a", std::string(100, 'm') + 'x');
  auto b = write_file("b", std::string(100, 'm') + 'y');
  std::error_code ec;
  EXPECT_FALSE(files_equal(a, b, 16, ec));
  EXPECT_FALSE(ec);
}

TEST_F(FileCmpTest, DifferentLength) {
  auto a = write_file("a", "abc");
  auto b = write_file("b", "abcd");
  std::error_code ec;
  EXPECT_FALSE(files_equal(a, b, 2, ec));
  EXPECT_FALSE(ec);
}

TEST_F(FileCmpTest, MissingFileSetsError) {
  auto a = write_file("a", "abc");
  std::error_code ec;
  EXPECT_FALSE(files_equal(a, _root / "missing", 2, ec));
  EXPECT_TRUE(ec);
}

TEST_F(FileCmpTest, SplitIdenticalSeparatesCollisions) {
  auto a1 = write_file("a1", "1111");
  auto b1 = write_file("b1", "2222");
  auto a2 = write_file("a2", "1111");
  auto c1 = write_file("c1", "3333");
  auto b2 = write_file("b2", "2222");

  skip_list_t failed;
  auto classes = split_identical({a1, b1, a2, c1, b2}, 3, failed);

  ASSERT_EQ(classes.size(), 2U);
  EXPECT_EQ(classes[0], (std::vector<fs::path>{a1, a2}));
  EXPECT_EQ(classes[1], (std::vector<fs::path>{b1, b2}));
  EXPECT_TRUE(failed.empty());
}

TEST_F(FileCmpTest, SplitIdenticalRecordsUnreadable) {
  auto a1 = write_file("a1", "same");
  auto a2 = write_file("a2", "same");
  const auto gone = _root / "gone";

  skip_list_t failed;
  auto classes = split_identical({gone, a1, a2}, 4, failed);

  ASSERT_EQ(classes.size(), 1U);
  EXPECT_EQ(classes[0], (std::vector<fs::path>{a1, a2}));
  ASSERT_EQ(failed.size(), 1U);
  EXPECT_EQ(failed.front().path, gone);
}

}  // namespace
}  // namespace dupstat

#include "dupstat/content_hash.hh"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "tmp_tree.hh"

namespace dupstat {
namespace {

class ContentHashTest : public test::tmp_tree_t {};

TEST_F(ContentHashTest, KnownDigestOfEmptyFile) {
  auto path = write_file("empty", "");
  std::error_code ec;
  EXPECT_EQ(content_hasher_t().hash(path, ec), "ef46db3751d8e999");
  EXPECT_FALSE(ec);
}

TEST_F(ContentHashTest, DigestIsSixteenLowercaseHexDigits) {
  auto path = write_file("data", "some content");
  std::error_code ec;
  auto digest = content_hasher_t().hash(path, ec);
  ASSERT_FALSE(ec);
  ASSERT_EQ(digest.size(), 16U);
  EXPECT_EQ(digest.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST_F(ContentHashTest, IndependentOfChunkSize) {
  std::string content;
  for (int i = 0; i < 5000; ++i) {
    content += (char)('a' + i % 26);
  }
  auto path = write_file("data", content);

  std::error_code ec;
  const auto whole = content_hasher_t().hash(path, ec);
  ASSERT_FALSE(ec);
  for (const uint64_t chunk_sz : {1UL, 7UL, 64UL, 4096UL, 5000UL}) {
    content_hasher_t hasher(chunk_sz);
    EXPECT_EQ(hasher.hash(path, ec), whole) << "chunk " << chunk_sz;
    EXPECT_FALSE(ec);
  }
}

TEST_F(ContentHashTest, SameContentSameDigest) {
  auto a = write_file("a", std::string(1000, 'q'));
  auto b = write_file("dir/b", std::string(1000, 'q'));
  auto c = write_file("c", std::string(999, 'q') + 'r');

  content_hasher_t hasher(64);
  std::error_code ec;
  EXPECT_EQ(hasher.hash(a, ec), hasher.hash(b, ec));
  EXPECT_NE(hasher.hash(a, ec), hasher.hash(c, ec));
}

TEST_F(ContentHashTest, MissingFileReportsError) {
  std::error_code ec;
  auto digest = content_hasher_t().hash(_root / "missing", ec);
  EXPECT_TRUE(digest.empty());
  EXPECT_EQ(ec, std::make_error_code(std::errc::no_such_file_or_directory));
}

TEST_F(ContentHashTest, UnreadableFileReportsError) {
  if (is_root_user()) {
    GTEST_SKIP() << "permissions are not enforced for root";
  }
  auto path = write_file("locked", "secret");
  std::filesystem::permissions(path, std::filesystem::perms::none);
  std::error_code ec;
  EXPECT_TRUE(content_hasher_t().hash(path, ec).empty());
  EXPECT_TRUE(ec);
}

TEST(ContentHasherTest, ZeroChunkFallsBackToDefault) {
  EXPECT_EQ(content_hasher_t(0).chunk_sz(), default_chunk_sz);
  EXPECT_EQ(content_hasher_t(42).chunk_sz(), 42U);
}

TEST(ContentHasherTest, OversizedChunkIsClamped) {
  EXPECT_EQ(content_hasher_t(8000000000000000000UL).chunk_sz(), max_chunk_sz);
  EXPECT_EQ(content_hasher_t(max_chunk_sz).chunk_sz(), max_chunk_sz);
}

TEST_F(ContentHashTest, MatchingLengthHashesNormally) {
  auto path = write_file("data", "12345678");
  std::error_code ec;
  const auto plain = content_hasher_t(3).hash(path, ec);
  ASSERT_FALSE(ec);
  EXPECT_EQ(content_hasher_t(3).hash(path, 8, ec), plain);
  EXPECT_FALSE(ec);
}

TEST_F(ContentHashTest, ShrunkFileReportsError) {
  auto path = write_file("data", "12345678");
  const auto listed_sz = std::filesystem::file_size(path);
  write_file("data", "abc");

  std::error_code ec;
  EXPECT_TRUE(content_hasher_t(3).hash(path, listed_sz, ec).empty());
  EXPECT_EQ(ec, std::make_error_code(std::errc::io_error));
}

TEST_F(ContentHashTest, GrownFileReportsError) {
  auto path = write_file("data", "abc");
  std::error_code ec;
  EXPECT_TRUE(content_hasher_t().hash(path, 2, ec).empty());
  EXPECT_EQ(ec, std::make_error_code(std::errc::io_error));
}

}  // namespace
}  // namespace dupstat

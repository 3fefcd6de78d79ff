#include "dupstat/file_cmp.hh"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>

#include "dupstat/config.hh"
#include "dupstat/log.hh"

namespace dupstat {

inline namespace detail_v1 {

namespace fs = std::filesystem;

namespace {

std::error_code last_error() noexcept {
  return std::error_code(errno != 0 ? errno : EIO, std::generic_category());
}

}  // namespace

bool files_equal(const fs::path &lhs, const fs::path &rhs,
                 const uint64_t chunk_sz, std::error_code &ec) {
  ec.clear();
  errno = 0;
  std::ifstream lhs_stream(lhs, std::ios::binary);
  if (!lhs_stream.is_open()) {
    ec = last_error();
    return false;
  }
  errno = 0;
  std::ifstream rhs_stream(rhs, std::ios::binary);
  if (!rhs_stream.is_open()) {
    ec = last_error();
    return false;
  }

  const auto buf_sz = std::clamp<uint64_t>(chunk_sz, 1, max_chunk_sz);
  std::vector<char> lhs_buf(buf_sz);
  std::vector<char> rhs_buf(buf_sz);
  while (lhs_stream && rhs_stream) {
    errno = 0;
    const auto lhs_len =
        lhs_stream.read(lhs_buf.data(), (std::streamsize)buf_sz).gcount();
    const auto rhs_len =
        rhs_stream.read(rhs_buf.data(), (std::streamsize)buf_sz).gcount();
    if (lhs_stream.bad() || rhs_stream.bad()) {
      ec = last_error();
      return false;
    }
    if (lhs_len != rhs_len ||
        std::memcmp(lhs_buf.data(), rhs_buf.data(), (std::size_t)lhs_len) !=
            0) {
      return false;
    }
  }
  // both must end together
  return lhs_stream.eof() && rhs_stream.eof();
}

std::vector<std::vector<fs::path>> split_identical(
    const std::vector<fs::path> &paths, const uint64_t chunk_sz,
    skip_list_t &failed) {
  std::vector<std::vector<fs::path>> classes;
  for (const auto &path : paths) {
    bool placed = false;
    std::error_code ec;
    for (auto &cls : classes) {
      if (files_equal(cls.front(), path, chunk_sz, ec)) {
        cls.push_back(path);
        placed = true;
        break;
      }
      if (ec) {
        break;
      }
    }
    if (!ec && !placed) {
      // new class, its first member must be readable
      errno = 0;
      std::ifstream first(path, std::ios::binary);
      if (first.is_open()) {
        classes.push_back({path});
        continue;
      }
      ec = last_error();
    }
    if (ec) {
      log_t(lvl_t::warn) << "skip unverifiable file: " << path << " - "
                         << ec.message() << '\n';
      failed.push_back({path, ec});
    }
  }
  std::erase_if(classes, [](const auto &cls) { return cls.size() < 2; });
  return classes;
}

}  // namespace detail_v1

}  // namespace dupstat

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace dupstat {

inline namespace detail_v1 {

class file_record_t {
  std::filesystem::path _path;
  uint64_t _size = 0;
  std::filesystem::file_time_type _mtime;

 public:
  template <typename Tp>
  inline file_record_t(Tp &&path, const uint64_t size,
                       const std::filesystem::file_time_type mtime = {})
      : _path(std::forward<Tp>(path)), _size(size), _mtime(mtime) {}

  inline file_record_t(const file_record_t &rhs) = default;
  inline file_record_t(file_record_t &&rhs) = default;
  inline file_record_t &operator=(const file_record_t &rhs) = default;
  inline file_record_t &operator=(file_record_t &&rhs) = default;

  inline const std::filesystem::path &path() const noexcept { return _path; }
  inline uint64_t size() const noexcept { return _size; }
  inline std::filesystem::file_time_type mtime() const noexcept {
    return _mtime;
  }
};

// file record with its content hash, hash is empty on read failure
struct hashed_file_t {
  std::filesystem::path path;
  uint64_t size = 0;
  std::optional<std::string> hash;
  // failure reason when hash is empty
  std::error_code ec;
};

// entry dropped by the pipeline and the reason
struct skip_t {
  std::filesystem::path path;
  std::error_code ec;
};

using file_list_t = std::vector<file_record_t>;
using skip_list_t = std::vector<skip_t>;

}  // namespace detail_v1

}  // namespace dupstat

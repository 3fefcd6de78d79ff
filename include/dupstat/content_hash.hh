#pragma once

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>

#include "dupstat/config.hh"

namespace dupstat {

inline namespace detail_v1 {

/**
 * @brief streaming XXH64 of whole file content, thread-safe.
 */
class DUPSTAT_EXPORT content_hasher_t {
  uint64_t _chunk_sz;

  std::string hash_impl(const std::filesystem::path &path,
                        const uint64_t *expected_sz,
                        std::error_code &ec) const;

 public:
  /**
   * @param chunk_sz bytes read per hash update, 0 falls back to default,
   * larger than max_chunk_sz is clamped
   */
  explicit content_hasher_t(const uint64_t chunk_sz = default_chunk_sz)
      : _chunk_sz(chunk_sz == 0 ? default_chunk_sz
                                : std::min<uint64_t>(chunk_sz, max_chunk_sz)) {}

  /**
   * @brief hash file content
   *
   * @param path file to hash
   * @param[out] ec set on open or read failure
   * @return 16 lowercase hex digits, empty string on failure
   */
  std::string hash(const std::filesystem::path &path,
                   std::error_code &ec) const;

  /**
   * @brief hash file content, a file whose length no longer matches
   * expected_sz is a failure (io_error)
   */
  std::string hash(const std::filesystem::path &path,
                   const uint64_t expected_sz, std::error_code &ec) const;

  inline uint64_t chunk_sz() const noexcept { return _chunk_sz; }
};

}  // namespace detail_v1

}  // namespace dupstat

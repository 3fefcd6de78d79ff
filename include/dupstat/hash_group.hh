#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "dupstat/config.hh"
#include "dupstat/content_hash.hh"
#include "dupstat/file_record.hh"

namespace dupstat {

inline namespace detail_v1 {

struct hash_group_t {
  // hash -> member paths, only hashes shared by 2+ files
  std::unordered_map<std::string, std::vector<std::filesystem::path>> buckets;
  // hash -> common file size
  std::unordered_map<std::string, uint64_t> sizes;
  // files that couldn't be hashed
  skip_list_t failed;
};

/**
 * @brief hashes size groups on a worker pool owned for its whole lifetime,
 * one group at a time.
 */
class DUPSTAT_EXPORT hash_grouper_t {
  // wraps the asio thread pool
  struct pool_t;

  content_hasher_t _hasher;
  std::unique_ptr<pool_t> _pool;

 public:
  hash_grouper_t(const uint32_t max_worker, const content_hasher_t hasher);
  ~hash_grouper_t();

  hash_grouper_t(const hash_grouper_t &) = delete;
  hash_grouper_t(hash_grouper_t &&) = delete;
  hash_grouper_t &operator=(const hash_grouper_t &) = delete;
  hash_grouper_t &operator=(hash_grouper_t &&) = delete;

  /**
   * @brief hash every file concurrently and wait for all of them,
   * then partition by hash dropping singletons.
   *
   * @param file_list files of the same size
   */
  hash_group_t group(const file_list_t &file_list);

  /**
   * @brief hash every file concurrently, result order follows file_list.
   * a file whose size changed since it was listed gets no hash.
   */
  std::vector<hashed_file_t> hash_all(const file_list_t &file_list);
};

/**
 * @brief partition hashed files by hash, files without hash are moved to
 * failed, hashes with a single file are dropped.
 */
DUPSTAT_EXPORT hash_group_t
group_by_hash(std::vector<hashed_file_t> hashed_list);

}  // namespace detail_v1

}  // namespace dupstat

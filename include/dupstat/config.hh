#pragma once

#include <cstdint>
#include <regex>
#include <thread>
#include <vector>

#define DUPSTAT_EXPORT __attribute__((visibility("default")))

namespace dupstat {

inline namespace detail_v1 {

// 16MiB
constexpr auto default_chunk_sz = 16UL * 1024UL * 1024UL;
// 1GiB, per worker buffer
constexpr auto max_chunk_sz = 1024UL * 1024UL * 1024UL;

constexpr auto hash_seed = 0UL;

constexpr auto max_thread = 256U;

inline uint32_t default_thread_cnt() noexcept {
  auto cnt = std::thread::hardware_concurrency();
  return cnt == 0U ? 1U : cnt;
}

struct config_t {
  // scan coordinator workers
  uint32_t walk_threads = default_thread_cnt();
  // content hasher workers
  uint32_t hash_threads = default_thread_cnt();
  // read size per hash update
  uint64_t chunk_sz = default_chunk_sz;
  // byte compare every hash bucket before reporting it
  bool verify = false;
  // drop zero byte files while walking
  bool skip_empty = false;
  std::vector<std::regex> exclude_regex;
};

}  // namespace detail_v1

}  // namespace dupstat

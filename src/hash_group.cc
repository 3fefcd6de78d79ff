#include "dupstat/hash_group.hh"

#include <algorithm>
#include <exception>
#include <latch>
#include <utility>

#include "dupstat/log.hh"

#ifndef BOOST_ASIO_HAS_STD_INVOKE_RESULT
#define BOOST_ASIO_HAS_STD_INVOKE_RESULT
#endif

#include <boost/asio.hpp>
#include <boost/asio/thread_pool.hpp>

namespace dupstat {

inline namespace detail_v1 {

struct hash_grouper_t::pool_t {
  boost::asio::thread_pool pool;

  explicit pool_t(const std::size_t thread_cnt) : pool(thread_cnt) {}
};

hash_grouper_t::hash_grouper_t(const uint32_t max_worker,
                               const content_hasher_t hasher)
    : _hasher(hasher),
      _pool(std::make_unique<pool_t>(std::max(max_worker, 1U))) {}

hash_grouper_t::~hash_grouper_t() { _pool->pool.join(); }

std::vector<hashed_file_t> hash_grouper_t::hash_all(
    const file_list_t &file_list) {
  // one slot per file, each written by exactly one worker
  std::vector<hashed_file_t> hashed_list(file_list.size());
  if (file_list.empty()) {
    return hashed_list;
  }

  std::latch done((std::ptrdiff_t)file_list.size());
  for (std::size_t i = 0; i < file_list.size(); ++i) {
    boost::asio::post(_pool->pool, [this, &file = file_list[i],
                                    &slot = hashed_list[i], &done] {
      try {
        slot.path = file.path();
        slot.size = file.size();
        auto digest = _hasher.hash(slot.path, slot.size, slot.ec);
        if (!slot.ec) {
          slot.hash = std::move(digest);
        }
      } catch (const std::exception &e) {
        log_t(lvl_t::err) << "hash error: " << file.path() << " - "
                          << e.what() << '\n';
        slot.ec = std::make_error_code(std::errc::io_error);
      }
      // always reached, the batch waits on it
      done.count_down();
    });
  }
  done.wait();
  return hashed_list;
}

hash_group_t hash_grouper_t::group(const file_list_t &file_list) {
  return group_by_hash(hash_all(file_list));
}

hash_group_t group_by_hash(std::vector<hashed_file_t> hashed_list) {
  hash_group_t result;
  for (auto &file : hashed_list) {
    if (!file.hash) {
      // hash failed, exclude
      log_t(lvl_t::warn) << "skip unreadable file: " << file.path << " - "
                         << file.ec.message() << '\n';
      result.failed.push_back({std::move(file.path), file.ec});
      continue;
    }
    result.sizes.emplace(*file.hash, file.size);
    result.buckets[*file.hash].push_back(std::move(file.path));
  }
  std::erase_if(result.buckets,
                [](const auto &entry) { return entry.second.size() < 2; });
  std::erase_if(result.sizes, [&result](const auto &entry) {
    return !result.buckets.contains(entry.first);
  });
  return result;
}

}  // namespace detail_v1

}  // namespace dupstat

#include "dupstat/scan.hh"

#include <algorithm>
#include <functional>
#include <iterator>
#include <span>
#include <system_error>
#include <utility>

#include "dupstat/log.hh"

#ifndef BOOST_ASIO_HAS_STD_INVOKE_RESULT
#define BOOST_ASIO_HAS_STD_INVOKE_RESULT
#endif

#include <boost/asio.hpp>
#include <boost/asio/thread_pool.hpp>

namespace dupstat {

inline namespace detail_v1 {

namespace {

// walk a chunk of roots sequentially into this worker's own slot
void walk_chunk(std::span<const std::filesystem::path> roots,
                walk_result_t &slot,
                const std::vector<std::regex> &exclude_regex,
                const bool skip_empty) {
  for (const auto &root : roots) {
    auto result = walk_tree(root, exclude_regex, skip_empty);
    log_t(lvl_t::dbg) << "walked: " << root << " - " << result.files.size()
                      << " files\n";
    if (slot.files.empty() && slot.skipped.empty()) {
      slot = std::move(result);
      continue;
    }
    slot.files.insert(slot.files.end(),
                      std::make_move_iterator(result.files.begin()),
                      std::make_move_iterator(result.files.end()));
    slot.skipped.insert(slot.skipped.end(),
                        std::make_move_iterator(result.skipped.begin()),
                        std::make_move_iterator(result.skipped.end()));
  }
}

}  // namespace

std::vector<std::pair<std::size_t, std::size_t>> partition_roots(
    const std::size_t root_cnt, const uint32_t max_worker) {
  std::vector<std::pair<std::size_t, std::size_t>> ranges;
  if (root_cnt == 0) {
    return ranges;
  }
  const std::size_t worker_cnt =
      std::min<std::size_t>(root_cnt, std::max(max_worker, 1U));
  const auto base = root_cnt / worker_cnt;
  const auto extra = root_cnt % worker_cnt;
  ranges.reserve(worker_cnt);
  std::size_t begin = 0;
  for (std::size_t i = 0; i < worker_cnt; ++i) {
    const auto len = base + (i < extra ? 1 : 0);
    ranges.emplace_back(begin, begin + len);
    begin += len;
  }
  return ranges;
}

walk_result_t scan_roots(const std::vector<std::filesystem::path> &search_dir,
                         const std::vector<std::regex> &exclude_regex,
                         const uint32_t max_worker, const bool skip_empty) {
  const auto ranges = partition_roots(search_dir.size(), max_worker);
  if (ranges.empty()) {
    return {};
  }

  // same spelling for the same directory, so overlapping roots list
  // identical paths
  std::vector<std::filesystem::path> roots_norm;
  roots_norm.reserve(search_dir.size());
  for (const auto &root : search_dir) {
    std::error_code ec;
    auto abs_root = std::filesystem::absolute(root, ec);
    auto norm = ec ? root.lexically_normal() : abs_root.lexically_normal();
    // "a/b/.." normalizes to "a/", drop the trailing separator
    if (!norm.has_filename() && norm.has_relative_path()) {
      norm = norm.parent_path();
    }
    roots_norm.push_back(std::move(norm));
  }

  // one slot per worker, no slot is shared
  std::vector<walk_result_t> slots(ranges.size());
  {
    boost::asio::thread_pool pool(ranges.size());
    for (std::size_t i = 0; i < ranges.size(); ++i) {
      std::span<const std::filesystem::path> roots(
          roots_norm.data() + ranges[i].first,
          ranges[i].second - ranges[i].first);
      boost::asio::post(pool,
                        std::bind(walk_chunk, roots, std::ref(slots[i]),
                                  std::cref(exclude_regex), skip_empty));
    }
    pool.join();
  }

  // merge
  walk_result_t result = std::move(slots.front());
  for (auto itr = std::next(slots.begin()); itr != slots.end(); ++itr) {
    result.files.insert(result.files.end(),
                        std::make_move_iterator(itr->files.begin()),
                        std::make_move_iterator(itr->files.end()));
    result.skipped.insert(result.skipped.end(),
                          std::make_move_iterator(itr->skipped.begin()),
                          std::make_move_iterator(itr->skipped.end()));
  }

  // a file reached from two roots is listed once
  auto &files = result.files;
  std::sort(files.begin(), files.end(), [](const auto &lhs, const auto &rhs) {
    return lhs.path() < rhs.path();
  });
  const auto last = std::unique(
      files.begin(), files.end(),
      [](const auto &lhs, const auto &rhs) { return lhs.path() == rhs.path(); });
  if (last != files.end()) {
    log_t(lvl_t::log) << "drop repeated paths: "
                      << std::distance(last, files.end()) << '\n';
    files.erase(last, files.end());
  }
  return result;
}

}  // namespace detail_v1

}  // namespace dupstat

#include "dupstat/dupstat.hh"

#include <chrono>
#include <iterator>
#include <utility>

#include "dupstat/content_hash.hh"
#include "dupstat/file_cmp.hh"
#include "dupstat/hash_group.hh"
#include "dupstat/log.hh"
#include "dupstat/scan.hh"
#include "dupstat/size_group.hh"

namespace dupstat {

inline namespace detail_v1 {

namespace {

class timer_t {
  std::chrono::steady_clock::time_point _prev_time;

 public:
  timer_t() noexcept : _prev_time(std::chrono::steady_clock::now()) {}
  std::chrono::milliseconds time() noexcept {
    auto cur_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        cur_time - _prev_time);
    _prev_time = cur_time;
    return duration;
  }
};

void append(skip_list_t &dst, skip_list_t &&src) {
  dst.insert(dst.end(), std::make_move_iterator(src.begin()),
             std::make_move_iterator(src.end()));
}

}  // namespace

detect_result_t detect_files(file_list_t files, const config_t &config) {
  detect_result_t result;
  timer_t timer;
  result.file_cnt = files.size();

  // group files by size
  log_t(lvl_t::log) << "group files by size...\n";
  auto size_group = group_by_size(std::move(files));
  result.size_group_cnt = size_group.size();
  log_t(lvl_t::log) << "elapsed: " << timer.time().count() << "ms\n";
  log_t(lvl_t::log) << "size group count: " << result.size_group_cnt << '\n';

  // detect duplicates, one size group at a time
  log_t(lvl_t::log) << "detect duplicates...\n";
  std::vector<duplicate_group_t> dupe_list;
  if (!size_group.empty()) {
    content_hasher_t hasher(config.chunk_sz);
    hash_grouper_t grouper(config.hash_threads, hasher);
    for (const auto &entry : size_group) {
      auto hash_group = grouper.group(entry.second);
      append(result.skipped, std::move(hash_group.failed));
      for (auto &[hash, paths] : hash_group.buckets) {
        const auto file_sz = hash_group.sizes.at(hash);
        if (!config.verify) {
          dupe_list.emplace_back(std::move(paths), file_sz);
          continue;
        }
        auto classes = split_identical(paths, hasher.chunk_sz(),
                                       result.skipped);
        if (classes.size() > 1) {
          log_t(lvl_t::warn) << "hash collision: " << hash << " - "
                             << paths.size() << " files, " << classes.size()
                             << " identical groups\n";
        }
        for (auto &cls : classes) {
          dupe_list.emplace_back(std::move(cls), file_sz);
        }
      }
    }
  }
  log_t(lvl_t::log) << "elapsed: " << timer.time().count() << "ms\n";
  log_t(lvl_t::log) << "duplicate group count: " << dupe_list.size() << '\n';

  // rank by wasted space
  log_t(lvl_t::log) << "sort duplicates by wasted space...\n";
  result.summary = aggregate(std::move(dupe_list));
  log_t(lvl_t::log) << "elapsed: " << timer.time().count() << "ms\n";
  return result;
}

detect_result_t detect(const std::vector<std::filesystem::path> &search_dir,
                       const config_t &config) {
  timer_t timer;

  // generate file list
  log_t(lvl_t::log) << "list files...\n";
  auto walk = scan_roots(search_dir, config.exclude_regex,
                         config.walk_threads, config.skip_empty);
  log_t(lvl_t::log) << "elapsed: " << timer.time().count() << "ms\n";
  log_t(lvl_t::log) << "file count: " << walk.files.size() << '\n';

  auto result = detect_files(std::move(walk.files), config);
  // walk errors first, then hash and verify errors
  append(walk.skipped, std::move(result.skipped));
  result.skipped = std::move(walk.skipped);
  if (!result.skipped.empty()) {
    log_t(lvl_t::log) << "skipped entries: " << result.skipped.size() << '\n';
  }
  return result;
}

}  // namespace detail_v1

}  // namespace dupstat

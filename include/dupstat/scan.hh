#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <regex>
#include <utility>
#include <vector>

#include "dupstat/config.hh"
#include "dupstat/tree_walk.hh"

namespace dupstat {

inline namespace detail_v1 {

/**
 * @brief split root_cnt roots into contiguous [begin, end) ranges, one per
 * worker. one root per range when root_cnt <= max_worker, otherwise exactly
 * max_worker ranges whose sizes differ by at most one.
 */
DUPSTAT_EXPORT std::vector<std::pair<std::size_t, std::size_t>>
partition_roots(const std::size_t root_cnt, const uint32_t max_worker);

/**
 * @brief walk all roots concurrently and merge the results. roots are made
 * absolute and normalized, a file reached through overlapping roots is
 * listed once.
 *
 * @param search_dir directories to search
 * @param exclude_regex regular expression to exclude files or directories
 * @param max_worker maximum number of threads to use
 * @param skip_empty drop zero byte files
 */
DUPSTAT_EXPORT walk_result_t
scan_roots(const std::vector<std::filesystem::path> &search_dir,
           const std::vector<std::regex> &exclude_regex,
           const uint32_t max_worker, const bool skip_empty = false);

}  // namespace detail_v1

}  // namespace dupstat

#pragma once

#include <cstddef>
#include <filesystem>
#include <vector>

#include "dupstat/aggregate.hh"
#include "dupstat/config.hh"
#include "dupstat/file_record.hh"

namespace dupstat {

inline namespace detail_v1 {

struct detect_result_t {
  summary_t summary;
  // regular files listed under all roots
  std::size_t file_cnt = 0;
  // sizes shared by 2+ files
  std::size_t size_group_cnt = 0;
  // entries dropped on error, while walking or hashing
  skip_list_t skipped;
};

/**
 * @brief detects duplicate files using file size and hash, collisions are
 * possible unless config.verify is set, hard links count as duplicates.
 * per file and per root errors are recorded in the result, never thrown.
 *
 * @param search_dir directories to search
 * @param config worker counts, chunk size and filters
 */
DUPSTAT_EXPORT detect_result_t detect(
    const std::vector<std::filesystem::path> &search_dir,
    const config_t &config = {});

/**
 * @brief detect duplicates among an already listed set of files, the size
 * and hash stages of detect. files that vanished or changed size since they
 * were listed end up in skipped.
 */
DUPSTAT_EXPORT detect_result_t detect_files(file_list_t files,
                                            const config_t &config = {});

}  // namespace detail_v1

}  // namespace dupstat

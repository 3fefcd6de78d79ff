#pragma once

#include <filesystem>
#include <regex>
#include <vector>

#include "dupstat/config.hh"
#include "dupstat/file_record.hh"

namespace dupstat {

inline namespace detail_v1 {

inline bool is_excluded(const std::filesystem::path &path,
                        const std::vector<std::regex> &exclude_regex) {
  for (const auto &regex : exclude_regex) {
    if (std::regex_match(path.native(), regex)) {
      return true;
    }
  }
  return false;
}

struct walk_result_t {
  file_list_t files;
  skip_list_t skipped;
};

/**
 * @brief list regular files under root recursively, symlinks and other
 * file types are skipped, unreadable entries are recorded in skipped.
 * a root that can't be opened yields no files and one skip record.
 *
 * @param root directory path
 * @param exclude_regex regular expression to exclude files or directories
 * @param skip_empty drop zero byte files
 */
DUPSTAT_EXPORT walk_result_t
walk_tree(const std::filesystem::path &root,
          const std::vector<std::regex> &exclude_regex = {},
          const bool skip_empty = false);

}  // namespace detail_v1

}  // namespace dupstat

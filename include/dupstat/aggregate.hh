#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

#include "dupstat/config.hh"

namespace dupstat {

inline namespace detail_v1 {

class DUPSTAT_EXPORT duplicate_group_t {
  std::vector<std::filesystem::path> _paths;
  uint64_t _size = 0;

 public:
  /**
   * @param paths 2+ files of identical content, stored sorted
   * @param size size of each file
   * @throws std::invalid_argument with less than two paths
   */
  duplicate_group_t(std::vector<std::filesystem::path> paths,
                    const uint64_t size);

  inline const std::vector<std::filesystem::path> &paths() const noexcept {
    return _paths;
  }
  inline uint64_t size() const noexcept { return _size; }
  inline std::size_t count() const noexcept { return _paths.size(); }
  // every copy but one is waste
  inline uint64_t wasted_size() const noexcept {
    return (count() - 1) * _size;
  }
};

struct summary_t {
  // sorted by wasted size descending
  std::vector<duplicate_group_t> groups;
  uint64_t total_wasted_size = 0;
  // index into groups
  std::optional<std::size_t> most_duplicated;
  // index into groups
  std::optional<std::size_t> largest_waste;

  inline const duplicate_group_t *most_duplicated_group() const noexcept {
    return most_duplicated ? &groups[*most_duplicated] : nullptr;
  }
  inline const duplicate_group_t *largest_waste_group() const noexcept {
    return largest_waste ? &groups[*largest_waste] : nullptr;
  }
};

/**
 * @brief rank duplicate groups.
 *
 * ties are broken by larger file size first, then by smallest first path,
 * so the result doesn't depend on the order groups were found in.
 * largest_waste is always the first group.
 */
DUPSTAT_EXPORT summary_t aggregate(std::vector<duplicate_group_t> groups);

}  // namespace detail_v1

}  // namespace dupstat

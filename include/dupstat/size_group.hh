#pragma once

#include <cstdint>
#include <map>

#include "dupstat/config.hh"
#include "dupstat/file_record.hh"

namespace dupstat {

inline namespace detail_v1 {

using size_group_t = std::map<uint64_t, file_list_t>;

/**
 * @brief partition files by exact size, groups with a single member are
 * dropped since a file of unique size can't have a duplicate.
 * input order is kept inside each group.
 */
DUPSTAT_EXPORT size_group_t group_by_size(file_list_t file_list);

}  // namespace detail_v1

}  // namespace dupstat

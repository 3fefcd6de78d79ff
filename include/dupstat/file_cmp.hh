#pragma once

#include <cstdint>
#include <filesystem>
#include <system_error>
#include <vector>

#include "dupstat/config.hh"
#include "dupstat/file_record.hh"

namespace dupstat {

inline namespace detail_v1 {

/**
 * @brief compare two files byte by byte
 *
 * @param lhs,rhs files to compare
 * @param chunk_sz bytes read per step from each file
 * @param[out] ec set when either file can't be read
 * @return true when content is identical, false on mismatch or error
 */
DUPSTAT_EXPORT bool files_equal(const std::filesystem::path &lhs,
                                const std::filesystem::path &rhs,
                                const uint64_t chunk_sz, std::error_code &ec);

/**
 * @brief split files sharing a hash into classes of byte-identical files,
 * classes with a single member are dropped. class order follows the first
 * member's position in paths.
 *
 * @param paths candidate duplicates
 * @param chunk_sz bytes read per step
 * @param[out] failed files that couldn't be read
 */
DUPSTAT_EXPORT std::vector<std::vector<std::filesystem::path>>
split_identical(const std::vector<std::filesystem::path> &paths,
                const uint64_t chunk_sz, skip_list_t &failed);

}  // namespace detail_v1

}  // namespace dupstat

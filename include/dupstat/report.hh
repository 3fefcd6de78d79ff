#pragma once

#include <ostream>

#include "dupstat/aggregate.hh"
#include "dupstat/config.hh"

namespace dupstat {

inline namespace detail_v1 {

/**
 * @brief write the report file body: totals, most duplicated group,
 * largest waste group, then every group by descending wasted size.
 */
DUPSTAT_EXPORT void write_report(std::ostream &os, const summary_t &summary);

/**
 * @brief write the console summary: totals and the two highlighted groups.
 */
DUPSTAT_EXPORT void print_summary(std::ostream &os, const summary_t &summary);

}  // namespace detail_v1

}  // namespace dupstat

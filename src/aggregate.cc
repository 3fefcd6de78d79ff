#include "dupstat/aggregate.hh"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace dupstat {

inline namespace detail_v1 {

duplicate_group_t::duplicate_group_t(
    std::vector<std::filesystem::path> paths, const uint64_t size)
    : _paths(std::move(paths)), _size(size) {
  if (_paths.size() < 2) {
    throw std::invalid_argument("duplicate group needs at least two files");
  }
  std::sort(_paths.begin(), _paths.end());
}

namespace {

// order for groups sharing the primary key
bool tie_less(const duplicate_group_t &lhs, const duplicate_group_t &rhs) {
  if (lhs.size() != rhs.size()) {
    return lhs.size() > rhs.size();
  }
  return lhs.paths().front() < rhs.paths().front();
}

}  // namespace

summary_t aggregate(std::vector<duplicate_group_t> groups) {
  summary_t summary;
  summary.groups = std::move(groups);
  auto &sorted = summary.groups;
  if (sorted.empty()) {
    return summary;
  }

  std::sort(sorted.begin(), sorted.end(),
            [](const auto &lhs, const auto &rhs) {
              if (lhs.wasted_size() != rhs.wasted_size()) {
                return lhs.wasted_size() > rhs.wasted_size();
              }
              return tie_less(lhs, rhs);
            });

  std::size_t most_idx = 0;
  for (std::size_t i = 0; i < sorted.size(); ++i) {
    summary.total_wasted_size += sorted[i].wasted_size();
    // sorted order already resolves ties
    if (sorted[i].count() > sorted[most_idx].count()) {
      most_idx = i;
    }
  }
  summary.most_duplicated = most_idx;
  summary.largest_waste = 0;
  return summary;
}

}  // namespace detail_v1

}  // namespace dupstat

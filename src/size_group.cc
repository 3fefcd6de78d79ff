#include "dupstat/size_group.hh"

#include <utility>

namespace dupstat {

inline namespace detail_v1 {

size_group_t group_by_size(file_list_t file_list) {
  size_group_t size_group;
  for (auto &file : file_list) {
    const auto size = file.size();
    size_group[size].push_back(std::move(file));
  }
  std::erase_if(size_group,
                [](const auto &entry) { return entry.second.size() < 2; });
  return size_group;
}

}  // namespace detail_v1

}  // namespace dupstat

#include "dupstat/report.hh"

#include <string>

#include "dupstat/size_str.hh"

namespace dupstat {

inline namespace detail_v1 {

using utils::format_size;

namespace {

// "<bytes> bytes (<human>)"
std::string bytes_str(const uint64_t bytes) {
  return std::to_string(bytes) + " bytes (" + format_size(bytes) + ")";
}

void write_highlight(std::ostream &os, const char *title,
                     const duplicate_group_t &group) {
  os << title << ":\n"
     << "  copies: " << group.count() << '\n'
     << "  size per file: " << bytes_str(group.size()) << '\n'
     << "  wasted space: " << bytes_str(group.wasted_size()) << '\n'
     << "  example: " << group.paths().front().native() << "\n\n";
}

}  // namespace

void write_report(std::ostream &os, const summary_t &summary) {
  os << "duplicate groups: " << summary.groups.size() << '\n'
     << "total wasted space: " << bytes_str(summary.total_wasted_size)
     << "\n\n";

  if (const auto *group = summary.most_duplicated_group()) {
    write_highlight(os, "most duplicated file (by count)", *group);
  }
  if (const auto *group = summary.largest_waste_group()) {
    write_highlight(os, "largest waste of space", *group);
  }

  os << "all duplicate groups ordered by wasted space:\n"
     << "=========================================\n\n";
  for (const auto &group : summary.groups) {
    os << "group: " << group.count() << " files, " << group.size()
       << " bytes each\n"
       << "wasted space: " << bytes_str(group.wasted_size()) << '\n'
       << "files:\n";
    for (const auto &path : group.paths()) {
      os << "  " << path.native() << '\n';
    }
    os << '\n';
  }
}

void print_summary(std::ostream &os, const summary_t &summary) {
  os << "found " << summary.groups.size() << " duplicate groups\n"
     << "total wasted space: " << bytes_str(summary.total_wasted_size)
     << '\n';

  if (const auto *group = summary.most_duplicated_group()) {
    os << "\nmost duplicated file: " << group->count() << " copies\n"
       << "  example: " << group->paths().front().native() << '\n'
       << "  size per file: " << format_size(group->size()) << '\n'
       << "  total wasted space: " << format_size(group->wasted_size())
       << '\n';
  }
  if (const auto *group = summary.largest_waste_group()) {
    os << "\nlargest waste of space: " << format_size(group->wasted_size())
       << '\n'
       << "  from " << group->count() << " copies of file size "
       << format_size(group->size()) << '\n'
       << "  example: " << group->paths().front().native() << '\n';
  }
  os.flush();
}

}  // namespace detail_v1

}  // namespace dupstat

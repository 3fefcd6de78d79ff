#include "dupstat/tree_walk.hh"

#include <system_error>
#include <utility>

#include "dupstat/log.hh"

namespace dupstat {

inline namespace detail_v1 {

namespace fs = std::filesystem;

namespace {

// list one directory, subdirectories are appended to pending
void ls_dir(const fs::path &dir, std::vector<fs::path> &pending,
            walk_result_t &result,
            const std::vector<std::regex> &exclude_regex,
            const bool skip_empty) {
  std::error_code ec;
  fs::directory_iterator itr(dir, ec);
  if (ec) {
    // error open directory, skip
    log_t(lvl_t::warn) << "skip directory: " << dir << " - " << ec.message()
                       << '\n';
    result.skipped.push_back({dir, ec});
    return;
  }
  try {
    for (const auto &dir_entry : itr) {
      const auto &path = dir_entry.path();
      if (is_excluded(path, exclude_regex)) {
        // exclude, skip
        log_t(lvl_t::dbg) << "exclude: " << path << '\n';

      } else if (dir_entry.is_symlink(ec) || ec) {
        // symlink, skip
        if (ec) {
          log_t(lvl_t::warn) << "skip entry: " << path << " - "
                             << ec.message() << '\n';
          result.skipped.push_back({path, ec});
        } else {
          log_t(lvl_t::warn) << "skip symlink: " << path << '\n';
        }

      } else if (dir_entry.is_directory(ec)) {
        // directory, walk later
        pending.push_back(path);

      } else if (!ec && dir_entry.is_regular_file(ec)) {
        // regular file, add to list
        auto file_size = dir_entry.file_size(ec);
        fs::file_time_type mtime;
        if (!ec) {
          mtime = dir_entry.last_write_time(ec);
        }
        if (ec) {
          // error stat file, skip
          log_t(lvl_t::warn) << "skip file: " << path << " - " << ec.message()
                             << '\n';
          result.skipped.push_back({path, ec});
        } else if (file_size > 0 || !skip_empty) {
          result.files.emplace_back(path, file_size, mtime);
        }

      } else if (ec) {
        log_t(lvl_t::warn) << "skip entry: " << path << " - " << ec.message()
                           << '\n';
        result.skipped.push_back({path, ec});

      } else {
        // other file type, skip
        log_t(lvl_t::dbg) << "skip unsupport file: " << path << '\n';
      }
      ec.clear();
    }
  } catch (fs::filesystem_error &e) {
    // error iterate directory, keep what was listed
    log_t(lvl_t::warn) << "skip rest of directory: " << dir << " - "
                       << e.code().message() << '\n';
    result.skipped.push_back({dir, e.code()});
  }
}

}  // namespace

walk_result_t walk_tree(const fs::path &root,
                        const std::vector<std::regex> &exclude_regex,
                        const bool skip_empty) {
  walk_result_t result;

  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    if (!ec) {
      ec = std::make_error_code(std::errc::not_a_directory);
    }
    log_t(lvl_t::err) << "can't scan root: " << root << " - " << ec.message()
                      << '\n';
    result.skipped.push_back({root, ec});
    return result;
  }
  if (is_excluded(root, exclude_regex)) {
    log_t(lvl_t::log) << "exclude: " << root << '\n';
    return result;
  }

  // depth first
  std::vector<fs::path> pending{root};
  while (!pending.empty()) {
    auto dir = std::move(pending.back());
    pending.pop_back();
    ls_dir(dir, pending, result, exclude_regex, skip_empty);
  }
  return result;
}

}  // namespace detail_v1

}  // namespace dupstat

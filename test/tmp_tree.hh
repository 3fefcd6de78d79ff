#pragma once

#include <gtest/gtest.h>
#include <unistd.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace dupstat::test {

// gtest fixture owning a fresh directory under the system temp dir
class tmp_tree_t : public ::testing::Test {
 protected:
  std::filesystem::path _root;

  void SetUp() override {
    static std::atomic<unsigned> seq{0};
    const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
    _root = std::filesystem::temp_directory_path() /
            ("dupstat_" + std::to_string(::getpid()) + "_" +
             std::string(info->test_suite_name()) + "_" + info->name() + "_" +
             std::to_string(seq++));
    std::filesystem::create_directories(_root);
  }

  void TearDown() override {
    std::error_code ec;
    // restore permissions so removal can descend everywhere
    for (auto itr = std::filesystem::recursive_directory_iterator(
             _root, std::filesystem::directory_options::skip_permission_denied,
             ec);
         !ec && itr != std::filesystem::recursive_directory_iterator();
         itr.increment(ec)) {
      std::filesystem::permissions(itr->path(),
                                   std::filesystem::perms::owner_all,
                                   std::filesystem::perm_options::add, ec);
    }
    std::filesystem::remove_all(_root, ec);
  }

  // write content to root/rel, creating parent directories
  std::filesystem::path write_file(const std::filesystem::path &rel,
                                   const std::string &content) {
    auto path = _root / rel;
    std::filesystem::create_directories(path.parent_path());
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs << content;
    return path;
  }

  std::filesystem::path make_dir(const std::filesystem::path &rel) {
    auto path = _root / rel;
    std::filesystem::create_directories(path);
    return path;
  }

  static bool is_root_user() { return ::geteuid() == 0; }
};

}  // namespace dupstat::test

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <regex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "dupstat/config.hh"
#include "dupstat/dupstat.hh"
#include "dupstat/log.hh"
#include "dupstat/report.hh"
#include "dupstat/size_str.hh"

using namespace std::literals;

namespace {

constexpr auto usage =
    "usage: dupstat [-f/--folders dir...] [-o/--output report] "
    "[-e/--exclude regex] [-j/--jobs jobs] [-c/--chunk-size size] "
    "[--verify] [--skip-empty] [-q/--quiet] [--debug] [-h/--help] [dir...]";

bool is_opt(const char* arg) { return arg[0] == '-' && arg[1] != '\0'; }

}  // namespace

int main(int argc, char* argv[]) {
  std::vector<std::filesystem::path> search_dir;
  std::filesystem::path report_path = "duplicates.txt";
  dupstat::config_t config;

  for (int i = 1; i < argc; ++i) {
    if (argv[i] == "-f"sv || argv[i] == "--folders"sv) {
      if (i + 1 >= argc || is_opt(argv[i + 1])) {
        std::cerr << "missing search_dir" << std::endl;
        return 1;
      }
      while (i + 1 < argc && !is_opt(argv[i + 1])) {
        search_dir.emplace_back(argv[++i]);
      }
    } else if (argv[i] == "-o"sv || argv[i] == "--output"sv ||
               argv[i] == "-df"sv) {
      ++i;
      if (i >= argc) {
        std::cerr << "missing report path" << std::endl;
        return 1;
      }
      report_path = argv[i];
    } else if (argv[i] == "-e"sv || argv[i] == "--exclude"sv) {
      ++i;
      if (i >= argc) {
        std::cerr << "missing exclude_regex" << std::endl;
        return 1;
      }
      try {
        config.exclude_regex.emplace_back(argv[i]);
      } catch (const std::regex_error& e) {
        std::cerr << "invalid exclude_regex: " << argv[i] << std::endl;
        return 1;
      }
    } else if (argv[i] == "-j"sv || argv[i] == "--jobs"sv) {
      ++i;
      if (i >= argc) {
        std::cerr << "missing jobs" << std::endl;
        return 1;
      }
      unsigned long jobs = 0;
      try {
        jobs = std::stoul(argv[i]);
      } catch (const std::logic_error&) {
        jobs = 0;
      }
      if (jobs == 0 || jobs > dupstat::max_thread) {
        std::cerr << "jobs must be > 0 and <= " << dupstat::max_thread
                  << std::endl;
        return 1;
      }
      config.walk_threads = (uint32_t)jobs;
      config.hash_threads = (uint32_t)jobs;
    } else if (argv[i] == "-c"sv || argv[i] == "--chunk-size"sv) {
      ++i;
      if (i >= argc) {
        std::cerr << "missing chunk size" << std::endl;
        return 1;
      }
      try {
        config.chunk_sz = dupstat::utils::parse_size(argv[i]);
      } catch (const std::logic_error& e) {
        std::cerr << e.what() << std::endl;
        return 1;
      }
      if (config.chunk_sz == 0 || config.chunk_sz > dupstat::max_chunk_sz) {
        std::cerr << "chunk size must be > 0 and <= 1GiB" << std::endl;
        return 1;
      }
    } else if (argv[i] == "--verify"sv) {
      config.verify = true;
    } else if (argv[i] == "--skip-empty"sv) {
      config.skip_empty = true;
    } else if (argv[i] == "-q"sv || argv[i] == "--quiet"sv) {
      dupstat::set_log_level(dupstat::lvl_t::err);
    } else if (argv[i] == "--debug"sv) {
      dupstat::set_log_level(dupstat::lvl_t::dbg);
    } else if (argv[i] == "-h"sv || argv[i] == "--help"sv) {
      std::cerr << usage << std::endl;
      return 0;
    } else if (is_opt(argv[i])) {
      std::cerr << "unknown option: " << argv[i] << std::endl;
      return 1;
    } else {
      search_dir.emplace_back(argv[i]);
    }
  }

  if (search_dir.empty()) {
    std::cerr << "no folders specified" << std::endl;
    std::cerr << usage << std::endl;
    return 1;
  }

  // open report before scanning, an unwritable path is a usage error
  std::ofstream report(report_path, std::ios::out | std::ios::trunc);
  if (!report.is_open()) {
    std::cerr << "error opening report file: " << report_path << std::endl;
    return 1;
  }

  const auto st_time = std::chrono::steady_clock::now();
  const auto result = dupstat::detect(search_dir, config);

  dupstat::print_summary(std::cout, result.summary);
  dupstat::write_report(report, result.summary);
  report.close();
  if (report.fail()) {
    dupstat::log_t(dupstat::lvl_t::err)
        << "error writing report file: " << report_path << '\n';
    return 1;
  }

  const auto ed_time = std::chrono::steady_clock::now();
  dupstat::log_t(dupstat::lvl_t::log)
      << "report written: " << report_path << '\n';
  dupstat::log_t(dupstat::lvl_t::log)
      << "time taken: "
      << std::chrono::duration_cast<std::chrono::milliseconds>(ed_time -
                                                               st_time)
             .count()
      << "ms\n";
}

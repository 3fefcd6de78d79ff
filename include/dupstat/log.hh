#pragma once

#include <atomic>
#include <cstdint>
#include <iostream>
#include <version>

#if __cpp_lib_syncbuf >= 201803L

#include <syncstream>

namespace dupstat {

inline namespace detail_v1 {

// osyncstream is provided
using oss = std::osyncstream;

}  // namespace detail_v1

}  // namespace dupstat

#else

#include <mutex>

namespace dupstat {

inline namespace detail_v1 {

// self-implemented osyncstream, holds the lock for the whole line
class oss {
  inline static std::mutex _mtx;
  std::ostream &_os;

 public:
  oss() = delete;
  inline oss(std::ostream &os) : _os(os) { _mtx.lock(); }
  inline ~oss() { _mtx.unlock(); }

  oss(const oss &) = delete;
  oss(oss &&) = delete;
  oss &operator=(const oss &) = delete;
  oss &operator=(oss &&) = delete;

  template <typename Tp>
  inline oss &operator<<(const Tp &val) {
    _os << val;
    return *this;
  }
};

}  // namespace detail_v1

}  // namespace dupstat

#endif

namespace dupstat {

inline namespace detail_v1 {

enum class lvl_t : uint8_t { dbg, log, warn, err };

inline std::atomic<lvl_t> log_threshold{lvl_t::log};

inline void set_log_level(const lvl_t lvl) noexcept { log_threshold = lvl; }

inline constexpr const char *lvl_tag(const lvl_t lvl) noexcept {
  switch (lvl) {
    case lvl_t::dbg:
      return "[dbg] ";
    case lvl_t::log:
      return "[log] ";
    case lvl_t::warn:
      return "[warn] ";
    case lvl_t::err:
      return "[err] ";
  }
  return "";
}

/**
 * @brief one log line on std::cerr, emitted as a unit on destruction,
 * dropped when below the process threshold.
 *
 * usage: log_t(lvl_t::warn) << "skip file: " << path << '\n';
 */
class log_t {
  bool _on;
  oss _os;

 public:
  explicit log_t(const lvl_t lvl)
      : _on(lvl >= log_threshold.load()), _os(std::cerr) {
    if (_on) {
      _os << lvl_tag(lvl);
    }
  }

  log_t(const log_t &) = delete;
  log_t(log_t &&) = delete;
  log_t &operator=(const log_t &) = delete;
  log_t &operator=(log_t &&) = delete;

  template <typename Tp>
  inline log_t &operator<<(const Tp &val) {
    if (_on) {
      _os << val;
    }
    return *this;
  }
};

}  // namespace detail_v1

}  // namespace dupstat

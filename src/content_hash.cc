#include "dupstat/content_hash.hh"

#include <xxhash.h>

#include <cerrno>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace dupstat {

inline namespace detail_v1 {

namespace {

// RAII wrapper for xxhash library.
class hasher_t {
  XXH64_state_t *_state;

 public:
  hasher_t() {
    _state = XXH64_createState();
    if (_state == nullptr) {
      throw std::runtime_error("XXH64_createState failed");
    }
    if (XXH64_reset(_state, hash_seed) == XXH_ERROR) {
      XXH64_freeState(_state);
      throw std::runtime_error("XXH64_reset failed");
    }
  }
  ~hasher_t() noexcept {
    if (_state != nullptr) {
      XXH64_freeState(_state);
    }
  }

  hasher_t(const hasher_t &rhs) = delete;
  hasher_t(hasher_t &&rhs) = delete;
  hasher_t &operator=(const hasher_t &rhs) = delete;
  hasher_t &operator=(hasher_t &&rhs) = delete;

  void update(const char *data, const uint64_t size) {
    if (XXH64_update(_state, data, size) == XXH_ERROR) {
      throw std::runtime_error("XXH64_update failed");
    }
  }
  XXH64_hash_t digest() noexcept { return XXH64_digest(_state); }
};

std::error_code last_error() noexcept {
  return std::error_code(errno != 0 ? errno : EIO, std::generic_category());
}

std::string to_hex(const XXH64_hash_t hash) {
  std::ostringstream os;
  os << std::hex << std::setfill('0') << std::setw(16) << hash;
  return os.str();
}

}  // namespace

std::string content_hasher_t::hash(const std::filesystem::path &path,
                                   std::error_code &ec) const {
  return hash_impl(path, nullptr, ec);
}

std::string content_hasher_t::hash(const std::filesystem::path &path,
                                   const uint64_t expected_sz,
                                   std::error_code &ec) const {
  return hash_impl(path, &expected_sz, ec);
}

std::string content_hasher_t::hash_impl(const std::filesystem::path &path,
                                        const uint64_t *expected_sz,
                                        std::error_code &ec) const {
  ec.clear();
  // read buffer reused by every file this thread hashes
  thread_local std::vector<char> buf;
  if (buf.size() < _chunk_sz) {
    buf.resize(_chunk_sz);
  }

  errno = 0;
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs.is_open()) {
    ec = last_error();
    return {};
  }

  hasher_t hasher;
  uint64_t total = 0;
  while (ifs) {
    errno = 0;
    ifs.read(buf.data(), (std::streamsize)_chunk_sz);
    const auto read_len = ifs.gcount();
    if (ifs.bad()) {
      ec = last_error();
      return {};
    }
    if (read_len > 0) {
      hasher.update(buf.data(), (uint64_t)read_len);
      total += (uint64_t)read_len;
    }
  }
  if (expected_sz != nullptr && total != *expected_sz) {
    // changed since it was listed
    ec = std::make_error_code(std::errc::io_error);
    return {};
  }
  return to_hex(hasher.digest());
}

}  // namespace detail_v1

}  // namespace dupstat

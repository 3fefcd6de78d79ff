#include "dupstat/size_str.hh"

#include <array>
#include <cstdio>
#include <limits>
#include <stdexcept>

namespace dupstat::utils {

namespace {

constexpr std::array<char, 6> unit_dict{'K', 'M', 'G', 'T', 'P', 'E'};

constexpr std::array<const char *, 6> unit_name{"kB", "MB", "GB",
                                                "TB", "PB", "EB"};

bool is_num(char c) { return c >= '0' && c <= '9'; }

// multiply with overflow check
uint64_t mul_checked(const uint64_t lhs, const uint64_t rhs,
                     const std::string &size_str) {
  if (rhs != 0 && lhs > std::numeric_limits<uint64_t>::max() / rhs) {
    throw std::out_of_range("size out of range: " + size_str);
  }
  return lhs * rhs;
}

}  // namespace

uint64_t parse_size(const std::string &size_str) {
  const auto size_len = size_str.size();
  std::size_t i = 0;
  uint64_t size_num = 0;
  for (; i < size_len && is_num(size_str[i]); i++) {
    size_num = mul_checked(size_num, 10, size_str);
    size_num += (uint64_t)(size_str[i] - '0');
    if (size_num < (uint64_t)(size_str[i] - '0')) {
      throw std::out_of_range("size out of range: " + size_str);
    }
  }
  if (i == 0) {
    throw std::invalid_argument("invalid size string: " + size_str);
  }

  std::size_t scale = 0;
  bool as_bibyte = false;
  bool as_bit = false;
  if (i < size_len) {
    for (std::size_t j = 0; j < unit_dict.size(); j++) {
      if (size_str[i] == unit_dict[j] || size_str[i] == unit_dict[j] + 32) {
        scale = j + 1;
        i++;
        break;
      }
    }
  }
  if (scale != 0 && i < size_len && size_str[i] == 'i') {
    as_bibyte = true;
    i++;
  }
  if (i < size_len) {
    if (size_str[i] == 'b') {
      as_bit = true;
    } else if (size_str[i] != 'B') {
      throw std::invalid_argument("invalid size string: " + size_str);
    }
    i++;
  }
  if (i != size_len) {
    throw std::invalid_argument("invalid size string: " + size_str);
  }

  const uint64_t base = as_bibyte ? 1024 : 1000;
  for (std::size_t j = 0; j < scale; j++) {
    size_num = mul_checked(size_num, base, size_str);
  }
  return as_bit ? size_num / 8 : size_num;
}

std::string format_size(const uint64_t bytes) {
  if (bytes == 1) {
    return "1 Byte";
  }
  if (bytes < 1000) {
    return std::to_string(bytes) + " Bytes";
  }
  auto value = (double)bytes / 1000.0;
  std::size_t unit = 0;
  while (value >= 1000.0 && unit + 1 < unit_name.size()) {
    value /= 1000.0;
    unit++;
  }
  std::array<char, 32> buf{};
  std::snprintf(buf.data(), buf.size(), "%.1f %s", value, unit_name[unit]);
  return buf.data();
}

}  // namespace dupstat::utils

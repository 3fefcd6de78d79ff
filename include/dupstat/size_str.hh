#pragma once

#include <cstdint>
#include <string>

#include "dupstat/config.hh"

namespace dupstat::utils {

/**
 * @brief Parse a size string such as "512", "4KB", "16MiB" or "8Kb"
 * into bytes. K/M/G/T/P/E scale by 1000, with an 'i' suffix by 1024,
 * a trailing 'b' counts bits.
 * @throws std::invalid_argument if not a valid size string.
 * @throws std::out_of_range if the value doesn't fit 64 bits.
 */
DUPSTAT_EXPORT uint64_t parse_size(const std::string &size_str);

/**
 * @brief Render bytes in decimal units with one fractional digit,
 * "1 Byte", "100 Bytes", "1.0 kB", "1.5 GB".
 */
DUPSTAT_EXPORT std::string format_size(const uint64_t bytes);

}  // namespace dupstat::utils

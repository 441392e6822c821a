#include "util/duration.hpp"
#include "errors.hpp"

#include <cctype>

namespace octo {

/**
 * Parse a human-readable duration string (e.g., "500ms", "2h").
 *
 * @param str Duration string comprised of number/unit pairs.
 * @return Parsed duration in milliseconds.
 * @throws ConfigError When the format or unit is invalid.
 */
std::chrono::milliseconds parse_duration(const std::string &str) {
  if (str.empty()) {
    return std::chrono::milliseconds{0};
  }

  long long total = 0;
  std::size_t i = 0;
  bool has_unit = false;

  while (i < str.size()) {
    if (!std::isdigit(static_cast<unsigned char>(str[i]))) {
      throw ConfigError("Invalid duration string '" + str + "'");
    }

    long long value = 0;
    while (i < str.size() && std::isdigit(static_cast<unsigned char>(str[i]))) {
      value = value * 10 + (str[i] - '0');
      ++i;
    }

    if (i == str.size()) {
      if (has_unit) {
        throw ConfigError("Missing unit in duration '" + str + "'");
      }
      total += value; // plain milliseconds
      break;
    }

    std::string unit;
    while (i < str.size() && std::isalpha(static_cast<unsigned char>(str[i]))) {
      unit += static_cast<char>(std::tolower(static_cast<unsigned char>(str[i])));
      ++i;
    }
    if (unit == "ms") {
      total += value;
    } else if (unit == "s") {
      total += value * 1000;
    } else if (unit == "m") {
      total += value * 60 * 1000;
    } else if (unit == "h") {
      total += value * 3600 * 1000;
    } else if (unit == "d") {
      total += value * 86400 * 1000;
    } else {
      throw ConfigError("Invalid duration suffix in '" + str + "'");
    }
    has_unit = true;
  }

  return std::chrono::milliseconds{total};
}

} // namespace octo

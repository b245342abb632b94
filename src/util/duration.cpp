#include "util/duration.hpp"

#include <cctype>
#include <limits>
#include <stdexcept>

namespace umon {

namespace {

long unit_seconds(char unit) {
  switch (std::tolower(static_cast<unsigned char>(unit))) {
  case 's':
    return 1;
  case 'm':
    return 60;
  case 'h':
    return 3600;
  case 'd':
    return 86400;
  case 'w':
    return 604800;
  default:
    throw std::runtime_error(std::string("Invalid duration suffix '") + unit +
                             "'");
  }
}

} // namespace

/**
 * Parse a human-readable duration string (e.g., "5m", "2h").
 *
 * @param str Duration string comprised of number/unit pairs.
 * @return Parsed duration in seconds.
 * @throws std::runtime_error When the format or unit is invalid.
 */
std::chrono::seconds parse_duration(const std::string &str) {
  long total = 0;
  std::size_t i = 0;
  bool has_unit = false;
  while (i < str.size()) {
    if (!std::isdigit(static_cast<unsigned char>(str[i]))) {
      throw std::runtime_error("Invalid duration string: " + str);
    }
    long value = 0;
    while (i < str.size() && std::isdigit(static_cast<unsigned char>(str[i]))) {
      value = value * 10 + (str[i] - '0');
      ++i;
    }
    if (i == str.size()) {
      // bare trailing number is only valid on its own
      if (has_unit) {
        throw std::runtime_error("Missing unit in duration: " + str);
      }
      total += value;
      break;
    }
    total += value * unit_seconds(str[i]);
    ++i;
    has_unit = true;
  }
  return std::chrono::seconds{total};
}

int ceil_minutes(std::chrono::seconds duration) {
  auto secs = duration.count();
  if (secs <= 0) {
    return 0;
  }
  auto minutes = (secs + 59) / 60;
  if (minutes > std::numeric_limits<int>::max()) {
    return std::numeric_limits<int>::max();
  }
  return static_cast<int>(minutes);
}

std::string format_minutes(long minutes) {
  if (minutes < 0) {
    minutes = 0;
  }
  long hours = minutes / 60;
  long mins = minutes % 60;
  if (hours > 0 && mins > 0) {
    return std::to_string(hours) + "h " + std::to_string(mins) + "m";
  }
  if (hours > 0) {
    return std::to_string(hours) + "h";
  }
  return std::to_string(mins) + "m";
}

} // namespace umon

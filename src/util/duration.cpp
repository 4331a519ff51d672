#include "util/duration.hpp"

#include <cctype>
#include <sstream>
#include <stdexcept>

namespace prdeck {

/**
 * Parse a human-readable duration string (e.g., "15s", "2h").
 *
 * @param str Duration string comprised of number/unit pairs.
 * @return Parsed duration in seconds.
 * @throws std::runtime_error When the format or unit is invalid.
 */
std::chrono::seconds parse_duration(const std::string &str) {
  if (str.empty()) {
    return std::chrono::seconds{0};
  }

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
      if (has_unit) {
        throw std::runtime_error("Missing unit in duration: " + str);
      }
      total += value;
      break;
    }

    char unit = static_cast<char>(std::tolower(static_cast<unsigned char>(str[i])));
    ++i;
    switch (unit) {
    case 's':
      total += value;
      break;
    case 'm':
      total += value * 60;
      break;
    case 'h':
      total += value * 3600;
      break;
    case 'd':
      total += value * 86400;
      break;
    default:
      throw std::runtime_error("Invalid duration suffix in: " + str);
    }
    has_unit = true;
  }

  return std::chrono::seconds{total};
}

std::string format_minutes_seconds(std::chrono::seconds duration) {
  long secs = static_cast<long>(duration.count());
  if (secs < 0)
    secs = 0;
  std::ostringstream oss;
  if (secs >= 60) {
    oss << secs / 60 << "m " << secs % 60 << 's';
  } else {
    oss << secs << 's';
  }
  return oss.str();
}

std::string format_duration_brief(std::chrono::seconds duration) {
  long total = static_cast<long>(duration.count());
  if (total <= 0) {
    return "0s";
  }
  long hours = total / 3600;
  long minutes = (total % 3600) / 60;
  long secs = total % 60;
  std::ostringstream oss;
  if (hours > 0) {
    oss << hours << "h ";
  }
  if (minutes > 0 || hours > 0) {
    oss << minutes << "m ";
  }
  oss << secs << 's';
  return oss.str();
}

} // namespace prdeck

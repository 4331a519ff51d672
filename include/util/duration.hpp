/**
 * @file duration.hpp
 * @brief Duration parsing and formatting helpers.
 *
 * Parses configuration duration strings (e.g. "15s", "2m", "1h30m") and
 * formats elapsed times for display rows.
 */
#ifndef PRDECK_UTIL_DURATION_HPP
#define PRDECK_UTIL_DURATION_HPP

#include <chrono>
#include <string>

namespace prdeck {

/**
 * Parse a human-readable duration string (e.g. "10s", "5m", "2h", "3d",
 * "1h30m") into a std::chrono::seconds value. Multiple units can be
 * combined and a pure number is interpreted as seconds.
 *
 * @param str Duration string; empty string returns zero seconds.
 * @return Parsed duration in seconds.
 * @throws std::runtime_error if an invalid format or suffix is provided.
 */
std::chrono::seconds parse_duration(const std::string &str);

/**
 * Format a duration as minutes and seconds ("1m 5s") or seconds only
 * ("45s") when shorter than a minute.
 */
std::string format_minutes_seconds(std::chrono::seconds duration);

/// Compact "1h 2m 3s" rendering used for countdowns; negative values print 0s.
std::string format_duration_brief(std::chrono::seconds duration);

} // namespace prdeck

#endif // PRDECK_UTIL_DURATION_HPP

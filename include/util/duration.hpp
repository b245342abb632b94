/**
 * @file duration.hpp
 * @brief Human-readable duration parsing and formatting.
 *
 * Converts duration strings such as "90s", "5m" or "1h30m" into
 * std::chrono values and renders minute counts for notification text.
 */
#ifndef USAGEMONITOR_UTIL_DURATION_HPP
#define USAGEMONITOR_UTIL_DURATION_HPP

#include <chrono>
#include <string>

namespace umon {

/**
 * Parse a human-readable duration string (e.g. "10s", "5m", "2h", "3d",
 * "1w", "1h30m") into a std::chrono::seconds value. Multiple units can be
 * combined and a pure number is interpreted as seconds.
 *
 * @param str Duration string; empty string returns zero seconds.
 * @return Parsed duration in seconds.
 * @throws std::runtime_error if an invalid format or suffix is provided.
 */
std::chrono::seconds parse_duration(const std::string &str);

/**
 * Round a duration up to whole minutes.
 *
 * @param duration Non-negative duration.
 * @return Number of minutes, at least one for any positive duration and
 *         saturating at the largest `int`.
 */
int ceil_minutes(std::chrono::seconds duration);

/**
 * Format a minute count compactly: `45m`, `1h` or `1h 30m`.
 *
 * @param minutes Number of minutes; negative values render as `0m`.
 */
std::string format_minutes(long minutes);

} // namespace umon

#endif // USAGEMONITOR_UTIL_DURATION_HPP

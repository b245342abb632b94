/**
 * @file time.hpp
 * @brief RFC 3339 timestamp helpers.
 */
#ifndef USAGEMONITOR_UTIL_TIME_HPP
#define USAGEMONITOR_UTIL_TIME_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace umon {

/**
 * Parse an RFC 3339 timestamp such as `2025-01-02T03:04:05.123456+00:00`.
 *
 * Fractional seconds are kept to microsecond precision and numeric offsets
 * are normalised to UTC.
 *
 * @param text Timestamp text.
 * @return Parsed time point, or `std::nullopt` when @p text is malformed.
 */
std::optional<std::chrono::system_clock::time_point>
parse_rfc3339(const std::string &text);

/**
 * Format a time point as UTC RFC 3339 with millisecond precision,
 * e.g. `2025-01-02T03:04:05.123Z`. The output sorts lexically.
 */
std::string format_rfc3339(std::chrono::system_clock::time_point tp);

/// Milliseconds since the Unix epoch.
std::int64_t to_unix_millis(std::chrono::system_clock::time_point tp);

} // namespace umon

#endif // USAGEMONITOR_UTIL_TIME_HPP

#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <ctime>
#include <optional>
#include <string>

/**
 * @brief Get the current local time formatted as YYYY-MM-DD HH:MM:SS.
 */
std::string timestamp();

/**
 * @brief Parse an RFC 3339 timestamp such as `2024-01-05T10:00:00Z`.
 *
 * Fractional seconds are ignored and numeric offsets are applied.
 *
 * @return Seconds since the epoch or `std::nullopt` when malformed.
 */
std::optional<std::time_t> parse_rfc3339(const std::string& s);

/**
 * @brief Long relative form: "just now", "5 mins ago", "1 day ago", ...
 *
 * @param t   Point in time to describe.
 * @param now Reference time, the current time when zero.
 */
std::string format_relative(std::time_t t, std::time_t now = 0);

/**
 * @brief Compact relative form: "now", "3h ago", "2w ago", or "Jan 05" once
 *        the date is 30 days or more in the past.
 */
std::string format_relative_short(std::time_t t, std::time_t now = 0);

#endif // TIME_UTILS_HPP

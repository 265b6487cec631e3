#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <string>
#include <chrono>
#include <optional>

/**
 * @brief Get the current local time formatted as YYYY-MM-DD HH:MM:SS.
 */
std::string timestamp();

/**
 * @brief Current wall clock time.
 *
 * When `FLEETFIX_NOW` holds an RFC3339 timestamp that value is returned
 * instead, which keeps staleness and lock-age checks reproducible in tests.
 */
std::chrono::system_clock::time_point current_time();

/**
 * @brief Format a time point as an RFC3339 UTC string (2026-01-02T03:04:05Z).
 */
std::string format_rfc3339(std::chrono::system_clock::time_point tp);

/**
 * @brief Parse an RFC3339 timestamp.
 *
 * Accepts a trailing `Z` or a numeric `+hh:mm`/`-hh:mm` offset. Fractional
 * seconds are ignored.
 *
 * @return Parsed time point or `std::nullopt` for malformed input.
 */
std::optional<std::chrono::system_clock::time_point> parse_rfc3339(const std::string& text);

#endif // TIME_UTILS_HPP

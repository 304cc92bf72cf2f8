#pragma once

/**
 * @file time_format.hpp
 * @brief Calendar types of the row model and their textual representation.
 *
 * Date and datetime values are naive local times: they carry no timezone and are stored as
 * `std::chrono::sys_days`/`sys_seconds` purely as a calendar representation. Format strings support
 * the strftime subset `%Y %m %d %H %M %S %%`; any other character must match literally.
 */

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace fmsave_core {

using date_t = std::chrono::sys_days;
using datetime_t = std::chrono::sys_seconds;
using timedelta_t = std::chrono::minutes;

inline constexpr std::string_view default_date_format = "%Y-%m-%d";
inline constexpr std::string_view default_datetime_format = "%Y-%m-%d %H:%M:%S";

std::optional<date_t> parse_date(std::string_view text, std::string_view format);

std::optional<datetime_t> parse_datetime(std::string_view text, std::string_view format);

std::string format_date(date_t value, std::string_view format);

std::string format_datetime(datetime_t value, std::string_view format);

/**
 * @brief Parses a signed `H:MM` or `H:MM:SS` duration. Seconds must be zero and minutes 0..59.
 */
std::optional<timedelta_t> parse_timedelta(std::string_view text);

/// Canonical `H:MM` text of a duration, prefixed with `-` when negative.
std::string timedelta_to_str(timedelta_t value);

/**
 * @brief Formats a duration with `%H` (total hours, two digits) and `%M` (minutes, two digits).
 */
std::string format_timedelta(timedelta_t value, std::string_view format);

/// Calendar day part of a naive datetime.
inline date_t date_part(datetime_t value)
{
    return std::chrono::floor<std::chrono::days>(value);
}

} // namespace fmsave_core

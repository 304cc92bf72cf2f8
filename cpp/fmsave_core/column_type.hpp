#pragma once

/**
 * @file column_type.hpp
 * @brief Definition of the `column_type` and `side` enums and related utilities.
 */

#include <cstdint>
#include <optional>
#include <string_view>

namespace fmsave_core {

enum class column_type : uint8_t
{
    string,
    date,
    datetime,
    timedelta,
    integer,
    floating,
    boolean
};

std::string_view column_type_to_str(column_type t);

/**
 * @brief Parses a type tag. Accepts the canonical names plus the short aliases used by the data
 * dictionaries (`str`, `dt`, `td`, `int`, `float`, `bool`).
 * @return nullopt for an unknown tag.
 */
std::optional<column_type> column_type_from_str(std::string_view s);

inline bool is_numeric(column_type t)
{
    return t == column_type::integer || t == column_type::floating;
}

inline bool is_temporal(column_type t)
{
    return t == column_type::date || t == column_type::datetime;
}

/// Which airport of a flight a column describes.
enum class side : uint8_t
{
    none,
    departure,
    arrival
};

std::string_view side_to_str(side s);

std::optional<side> side_from_str(std::string_view s);

inline side opposite(side s)
{
    switch (s) {
    case side::departure:
        return side::arrival;
    case side::arrival:
        return side::departure;
    default:
        return side::none;
    }
}

/// Conventional column name suffix of a side, e.g. `_dep`.
std::string_view side_suffix(side s);

} // namespace fmsave_core

#pragma once

/**
 * @file side_columns.hpp
 * @brief Positions of the canonical columns describing one airport of a flight.
 */

#include <fmsave_core/schema.hpp>

#include <optional>
#include <string_view>

namespace fmsave {

/// Provenance fields of the canonical airport columns.
namespace provenance_field {
inline constexpr std::string_view lat = "lat";
inline constexpr std::string_view lon = "lon";
inline constexpr std::string_view time = "time";
inline constexpr std::string_view tzid = "tzid";
inline constexpr std::string_view gmtoffset = "gmtoffset";
inline constexpr std::string_view distance = "distance";
inline constexpr std::string_view duration = "duration";
} // namespace provenance_field

/**
 * @brief Columns of one side located through their provenance, e.g. `lat_dep` has side departure and
 * provenance `lat`. The lookup date is the date column of the side tagged for timezone lookup.
 */
struct side_columns
{
    fmsave_core::side side = fmsave_core::side::none;
    std::optional<size_t> lat;
    std::optional<size_t> lon;
    std::optional<size_t> lookup_date;
    std::optional<size_t> time;
    std::optional<size_t> tzid;
    std::optional<size_t> gmtoffset;

    static side_columns of(const fmsave_core::schema& schema, fmsave_core::side s);

    /// The schema has every column the timezone resolver reads and writes for this side.
    [[nodiscard]] bool resolvable() const
    {
        return lat && lon && tzid && gmtoffset && (lookup_date || time);
    }
};

} // namespace fmsave

#pragma once

/**
 * @file geo.hpp
 * @brief Great-circle distance and unit conversions.
 */

namespace fmsave {

/// Mean Earth radius (IUGG) in kilometres.
inline constexpr double earth_radius_km = 6371.0088;

inline constexpr double miles_per_km = 0.621371;

/**
 * @brief Haversine distance in kilometres between two points given in decimal degrees.
 */
double great_circle_km(double lat1, double lon1, double lat2, double lon2);

inline double km_to_miles(double km)
{
    return km * miles_per_km;
}

inline double miles_to_km(double miles)
{
    return miles / miles_per_km;
}

} // namespace fmsave

#include "geo.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace fmsave {

namespace {

constexpr double to_radians(double degrees)
{
    return degrees * std::numbers::pi / 180.0;
}

} // namespace

double great_circle_km(double lat1, double lon1, double lat2, double lon2)
{
    const double phi1 = to_radians(lat1);
    const double phi2 = to_radians(lat2);
    const double dphi = to_radians(lat2 - lat1);
    const double dlambda = to_radians(lon2 - lon1);

    const double a = std::pow(std::sin(dphi / 2), 2) + std::cos(phi1) * std::cos(phi2) * std::pow(std::sin(dlambda / 2), 2);
    return 2.0 * earth_radius_km * std::asin(std::min(1.0, std::sqrt(a)));
}

} // namespace fmsave

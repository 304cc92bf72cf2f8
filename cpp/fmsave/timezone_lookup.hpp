#pragma once

/**
 * @file timezone_lookup.hpp
 * @brief Interface of the external timezone lookup service.
 */

#include <fmsave_core/time_format.hpp>

#include <string>

namespace fmsave {

struct timezone_info
{
    std::string tzid;
    /// Offset from GMT in hours at the queried date.
    double gmt_offset = 0.0;

    bool operator==(const timezone_info& other) const = default;
};

/**
 * @brief Resolves coordinates at a date to a timezone.
 *
 * Implementations report failures with the `fmsave::lookup_error` family:
 * `quota_exceeded`, `lookup_not_found`, `transient_lookup_error` and `lookup_authorization_error`.
 */
class timezone_lookup
{
public:
    virtual ~timezone_lookup() = default;

    virtual timezone_info lookup(double lat, double lon, fmsave_core::date_t date) = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace fmsave

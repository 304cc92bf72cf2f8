#pragma once

/**
 * @file timezone_client.hpp
 * @brief GeoNames `timezoneJSON` web service client.
 */

#include "http_client.hpp"

#include <fmsave/timezone_lookup.hpp>

#include <chrono>
#include <functional>
#include <string>
#include <string_view>

namespace geonames {

inline constexpr std::string_view timezone_url = "https://secure.geonames.org/timezoneJSON";

/// GeoNames web service exception codes.
namespace status_code {
inline constexpr int authorization = 10;
inline constexpr int invalid_parameter = 14;
inline constexpr int no_result = 15;
inline constexpr int daily_limit = 18;
inline constexpr int hourly_limit = 19;
inline constexpr int weekly_limit = 20;
} // namespace status_code

struct client_options
{
    std::string username;
    std::chrono::seconds timeout{3};
    std::string url = std::string(timezone_url);
};

/**
 * @brief Interprets a `timezoneJSON` response.
 *
 * The offset is the `offsetToGmt` of the `dates` entry of the queried date, when the response has one,
 * otherwise `gmtOffset`.
 *
 * @throws fmsave::lookup_authorization_error, fmsave::quota_exceeded, fmsave::lookup_not_found,
 * fmsave::transient_lookup_error, fmsave::lookup_error
 */
fmsave::timezone_info parse_timezone_response(const http_response& response,
                                              double lat,
                                              double lon,
                                              fmsave_core::date_t date);

class timezone_client : public fmsave::timezone_lookup
{
public:
    using transport_t = std::function<http_response(const std::string& url, std::chrono::seconds timeout)>;

public:
    explicit timezone_client(client_options options, transport_t transport = http_get);

    fmsave::timezone_info lookup(double lat, double lon, fmsave_core::date_t date) override;

    [[nodiscard]] std::string name() const override
    {
        return "geonames";
    }

private:
    client_options options_;
    transport_t transport_;
};

} // namespace geonames

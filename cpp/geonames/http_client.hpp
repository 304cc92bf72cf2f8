#pragma once

/**
 * @file http_client.hpp
 * @brief Blocking HTTP GET on top of libcurl.
 */

#include <chrono>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace geonames {

struct http_response
{
    long status = 0;
    std::string body;
};

using query_params = std::vector<std::pair<std::string, std::string>>;

/// `url?key=value&...` with the values percent-encoded.
std::string build_url(std::string_view base_url, const query_params& params);

/**
 * @brief Performs a GET request and returns the response whatever its status.
 * @throws fmsave::transient_lookup_error when no response was received (connection failure, timeout).
 */
http_response http_get(const std::string& url, std::chrono::seconds timeout);

} // namespace geonames

#include "timezone_client.hpp"

#include <base/base.hpp>
#include <fmsave/exceptions.hpp>

#include <nlohmann/json.hpp>

#include <optional>

namespace geonames {

namespace {

bool is_transient_status(long status)
{
    return status == 429 || status >= 500;
}

void raise_for_status(const nlohmann::json& body, double lat, double lon)
{
    auto it = body.find("status");
    if (it == body.end() || !it->is_object()) {
        return;
    }
    const auto code = it->value("value", 0);
    const auto message = it->value("message", std::string());
    base::log_error(base::log_channel::geonames, "GeoNames error {}: {}", code, message);
    if (message.starts_with("user account not enabled to use") || code == status_code::authorization) {
        throw fmsave::lookup_authorization_error(message);
    }
    switch (code) {
    case status_code::daily_limit:
    case status_code::hourly_limit:
    case status_code::weekly_limit:
        throw fmsave::quota_exceeded(message);
    case status_code::no_result:
        throw fmsave::lookup_not_found(lat, lon, message);
    case status_code::invalid_parameter:
        throw fmsave::lookup_error(fmt::format("Invalid GeoNames parameter: {}", message),
                                   {{"code", std::to_string(code)}, {"message", message}});
    default:
        throw fmsave::lookup_error(fmt::format("GeoNames error {}: {}", code, message),
                                   {{"code", std::to_string(code)}, {"message", message}});
    }
}

std::optional<double> offset_at(const nlohmann::json& body, const std::string& date)
{
    auto dates = body.find("dates");
    if (dates == body.end() || !dates->is_array()) {
        return std::nullopt;
    }
    std::optional<double> any;
    for (const auto& entry : *dates) {
        auto offset = entry.find("offsetToGmt");
        if (offset == entry.end() || !offset->is_number()) {
            continue;
        }
        if (entry.value("date", std::string()) == date) {
            return offset->get<double>();
        }
        any = offset->get<double>();
    }
    return any;
}

} // namespace

fmsave::timezone_info parse_timezone_response(const http_response& response,
                                              double lat,
                                              double lon,
                                              fmsave_core::date_t date)
{
    if (is_transient_status(response.status)) {
        throw fmsave::transient_lookup_error(fmt::format("HTTP status {}", response.status));
    }
    auto body = nlohmann::json::parse(response.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        throw fmsave::lookup_error(fmt::format("GeoNames HTTP status {} with unreadable body", response.status),
                                   {{"status", std::to_string(response.status)}, {"body", response.body}});
    }
    raise_for_status(body, lat, lon);

    auto tzid = body.find("timezoneId");
    if (tzid == body.end() || !tzid->is_string() || tzid->get<std::string>().empty()) {
        throw fmsave::lookup_not_found(lat, lon, "response has no timezoneId");
    }
    auto offset = offset_at(body, fmsave_core::format_date(date, fmsave_core::default_date_format));
    if (!offset) {
        auto gmt = body.find("gmtOffset");
        if (gmt == body.end() || !gmt->is_number()) {
            throw fmsave::lookup_not_found(lat, lon, "response has no GMT offset");
        }
        offset = gmt->get<double>();
    }
    return {tzid->get<std::string>(), *offset};
}

timezone_client::timezone_client(client_options options, transport_t transport)
    : options_(std::move(options))
    , transport_(std::move(transport))
{
    if (options_.username.empty()) {
        throw fmsave::lookup_authorization_error("no GeoNames username configured");
    }
}

fmsave::timezone_info timezone_client::lookup(double lat, double lon, fmsave_core::date_t date)
{
    const auto url = build_url(options_.url, {{"lat", fmt::format("{}", lat)},
                                              {"lng", fmt::format("{}", lon)},
                                              {"date", fmsave_core::format_date(date, fmsave_core::default_date_format)},
                                              {"username", options_.username}});
    auto info = parse_timezone_response(transport_(url, options_.timeout), lat, lon, date);
    base::log_debug(base::log_channel::geonames, "({}, {}) -> {} {}", lat, lon, info.tzid, info.gmt_offset);
    return info;
}

} // namespace geonames

#pragma once

/**
 * @file timezone_cache.hpp
 * @brief Process local cache of timezone lookups.
 */

#include "timezone_lookup.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <tuple>

namespace fmsave {

/// Cache key: coordinates rounded to 4 decimal places and the query date.
struct timezone_query
{
    int64_t lat_e4;
    int64_t lon_e4;
    fmsave_core::date_t date;

    static timezone_query make(double lat, double lon, fmsave_core::date_t date);

    [[nodiscard]] double lat() const
    {
        return static_cast<double>(lat_e4) / 1e4;
    }

    [[nodiscard]] double lon() const
    {
        return static_cast<double>(lon_e4) / 1e4;
    }

    [[nodiscard]] std::string to_string() const;

    bool operator<(const timezone_query& other) const
    {
        return std::tie(lat_e4, lon_e4, date) < std::tie(other.lat_e4, other.lon_e4, other.date);
    }

    bool operator==(const timezone_query& other) const = default;
};

/**
 * @brief Lazily populated, never evicted. Not synchronized.
 */
class timezone_cache
{
public:
    static timezone_cache& instance()
    {
        static timezone_cache instance_;
        return instance_;
    }

    [[nodiscard]] std::optional<timezone_info> get(const timezone_query& query) const;

    void put(const timezone_query& query, timezone_info info)
    {
        entries_.insert_or_assign(query, std::move(info));
    }

    [[nodiscard]] size_t size() const noexcept
    {
        return entries_.size();
    }

    void clear()
    {
        entries_.clear();
    }

private:
    std::map<timezone_query, timezone_info> entries_;
};

} // namespace fmsave

#include "timezone_cache.hpp"

#include <base/format.hpp>

#include <cmath>

namespace fmsave {

timezone_query timezone_query::make(double lat, double lon, fmsave_core::date_t date)
{
    return {static_cast<int64_t>(std::llround(lat * 1e4)), static_cast<int64_t>(std::llround(lon * 1e4)), date};
}

std::string timezone_query::to_string() const
{
    return fmt::format("({:.4f}, {:.4f}) on {}", lat(), lon(),
                       fmsave_core::format_date(date, fmsave_core::default_date_format));
}

std::optional<timezone_info> timezone_cache::get(const timezone_query& query) const
{
    auto it = entries_.find(query);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace fmsave

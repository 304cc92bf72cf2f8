#include "timezone_resolver.hpp"
#include "side_columns.hpp"

#include <base/base.hpp>

#include <array>
#include <map>

namespace fmsave {

namespace {

struct pending_side
{
    size_t row;
    const side_columns* columns;
};

struct row_state
{
    bool needed = false;
    bool lacks_inputs = false;
    bool failed = false;
};

bool needs_timezone(const fmsave_core::row& r, const side_columns& columns)
{
    return r[*columns.tzid].is_absent() || r[*columns.gmtoffset].is_absent();
}

/// Date to query for a side. Falls back to the date part of the local time, writing it back to the lookup date.
std::optional<fmsave_core::date_t> query_date(fmsave_core::row& r, const side_columns& columns)
{
    if (columns.lookup_date) {
        const auto& v = r[*columns.lookup_date];
        if (const auto* d = v.get_if<fmsave_core::date_t>()) {
            return *d;
        }
        if (const auto* dt = v.get_if<fmsave_core::datetime_t>()) {
            return fmsave_core::date_part(*dt);
        }
    }
    if (!columns.time) {
        return std::nullopt;
    }
    const auto* time = r[*columns.time].get_if<fmsave_core::datetime_t>();
    if (time == nullptr) {
        return std::nullopt;
    }
    const auto date = fmsave_core::date_part(*time);
    if (columns.lookup_date) {
        if (r.get_schema().column(*columns.lookup_date).type() == fmsave_core::column_type::date) {
            r.set(*columns.lookup_date, fmsave_core::value(date));
        } else {
            r.set(*columns.lookup_date, fmsave_core::value(fmsave_core::datetime_t(date)));
        }
    }
    return date;
}

void apply(fmsave_core::row& r, const side_columns& columns, const timezone_info& info)
{
    r.set(*columns.tzid, fmsave_core::value(info.tzid));
    r.set(*columns.gmtoffset, fmsave_core::value(info.gmt_offset));
}

} // namespace

std::string resolution_result::summary() const
{
    auto text = fmt::format("{} rows resolved, {} rows unresolved, {} rows without coordinates or date", resolved,
                            unresolved, skipped);
    if (quota_exhausted) {
        text += " (lookup quota exceeded, rerun later)";
    } else if (authorization_failed) {
        text += " (lookup not authorized, check the username)";
    } else if (lookup_limit_reached) {
        text += " (lookup limit reached, rerun later)";
    }
    return text;
}

timezone_info timezone_resolver::lookup_with_retries(const timezone_query& query)
{
    for (unsigned attempt = 0;; ++attempt) {
        try {
            return lookup_.lookup(query.lat(), query.lon(), query.date);
        } catch (const transient_lookup_error& e) {
            if (attempt >= options_.max_retries) {
                throw;
            }
            base::log_warning(base::log_channel::timezone, "Retrying {} after attempt {}: {}", query.to_string(),
                              attempt + 1, e.message());
        }
    }
}

resolution_result timezone_resolver::resolve(const dataset& data)
{
    auto span = base::log_span(base::log_channel::timezone, fmt::format("resolve timezones with {}", lookup_.name()));
    const auto& schema = data.get_schema();
    const std::array<side_columns, 2> sides = {side_columns::of(schema, fmsave_core::side::departure),
                                               side_columns::of(schema, fmsave_core::side::arrival)};

    std::vector<fmsave_core::row> rows = data.rows();
    std::vector<row_state> states(rows.size());
    std::map<timezone_query, std::vector<pending_side>> pending;
    std::vector<timezone_query> order;

    for (size_t i = 0; i < rows.size(); ++i) {
        for (const auto& columns : sides) {
            if (!columns.resolvable() || !needs_timezone(rows[i], columns)) {
                continue;
            }
            auto date = query_date(rows[i], columns);
            const auto* lat = rows[i][*columns.lat].get_if<double>();
            const auto* lon = rows[i][*columns.lon].get_if<double>();
            if (lat == nullptr || lon == nullptr || !date) {
                states[i].lacks_inputs = true;
                continue;
            }
            states[i].needed = true;
            auto query = timezone_query::make(*lat, *lon, *date);
            auto [it, inserted] = pending.try_emplace(query);
            if (inserted) {
                order.push_back(query);
            }
            it->second.push_back({i, &columns});
        }
    }

    size_t lookups = 0;
    size_t cache_hits = 0;
    bool quota_exhausted = false;
    bool authorization_failed = false;
    bool limit_reached = false;
    std::vector<resolution_error> errors;

    for (const auto& query : order) {
        auto& targets = pending[query];
        std::optional<timezone_info> info = cache_.get(query);
        if (!info && !limit_reached && options_.max_lookups && lookups >= *options_.max_lookups) {
            limit_reached = true;
            base::log_warning(base::log_channel::timezone, "Lookup limit of {} reached", *options_.max_lookups);
        }
        // Once calls are stopped only cached answers are applied.
        const bool stopped = quota_exhausted || authorization_failed || limit_reached;
        if (info) {
            ++cache_hits;
        } else if (!stopped) {
            ++lookups;
            try {
                info = lookup_with_retries(query);
                cache_.put(query, *info);
                base::log_debug(base::log_channel::timezone, "{} -> {} ({:+})", query.to_string(), info->tzid,
                                info->gmt_offset);
            } catch (const quota_exceeded& e) {
                quota_exhausted = true;
                base::log_warning(base::log_channel::timezone, "{}; no further lookups this run", e.message());
            } catch (const lookup_authorization_error& e) {
                authorization_failed = true;
                errors.emplace_back(query.to_string(), e.message());
                base::log_error(base::log_channel::timezone, "{}; no further lookups this run", e.message());
            } catch (const lookup_error& e) {
                errors.emplace_back(query.to_string(), e.message());
                base::log_warning(base::log_channel::timezone, "{}", errors.back().message());
            }
        }

        for (const auto& target : targets) {
            if (info) {
                apply(rows[target.row], *target.columns, *info);
            } else {
                states[target.row].failed = true;
            }
        }
    }

    resolution_result result{dataset(data.shared_schema(), std::move(rows))};
    for (const auto& state : states) {
        if (state.failed) {
            ++result.unresolved;
        } else if (state.lacks_inputs) {
            ++result.skipped;
        } else if (state.needed) {
            ++result.resolved;
        }
    }
    result.lookups = lookups;
    result.cache_hits = cache_hits;
    result.quota_exhausted = quota_exhausted;
    result.authorization_failed = authorization_failed;
    result.lookup_limit_reached = limit_reached;
    result.errors = std::move(errors);

    base::log_info(base::log_channel::timezone, "{} ({} lookups, {} cached)", result.summary(), lookups, cache_hits);
    return result;
}

} // namespace fmsave

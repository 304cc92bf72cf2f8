#pragma once

/**
 * @file timezone_resolver.hpp
 * @brief Fills missing timezone columns of a dataset through a `timezone_lookup`.
 */

#include "dataset.hpp"
#include "exceptions.hpp"
#include "timezone_cache.hpp"
#include "timezone_lookup.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace fmsave {

struct resolver_options
{
    /// Additional attempts after a transient failure.
    unsigned max_retries = 3;
    /// Upper bound of external queries per run.
    std::optional<size_t> max_lookups;
};

struct resolution_result
{
    dataset data;
    /// Rows whose every missing timezone was filled.
    size_t resolved = 0;
    /// Rows with a failed or stopped query.
    size_t unresolved = 0;
    /// Rows with no failed query where a side missing its timezone lacks coordinates or a date.
    /// The other side of such a row is still filled.
    size_t skipped = 0;
    size_t lookups = 0;
    size_t cache_hits = 0;
    bool quota_exhausted = false;
    bool authorization_failed = false;
    bool lookup_limit_reached = false;
    std::vector<resolution_error> errors;

    /// One line summary, e.g. "12 rows resolved, 3 rows unresolved (quota exceeded, rerun later)".
    [[nodiscard]] std::string summary() const;
};

/**
 * @brief Resolves (lat, lon, date) of every departure and arrival missing its tzid or gmt offset.
 *
 * Distinct queries are issued once and the cache is consulted first. Quota exhaustion and
 * authorization failures stop further calls and leave the remaining rows unresolved. Any other
 * failure of one query is recorded and the run continues. Transient failures are retried.
 */
class timezone_resolver
{
public:
    explicit timezone_resolver(timezone_lookup& lookup,
                               resolver_options options = {},
                               timezone_cache& cache = timezone_cache::instance())
        : lookup_(lookup)
        , options_(options)
        , cache_(cache)
    {
    }

    /// Returns a new dataset; `data` is not modified.
    resolution_result resolve(const dataset& data);

private:
    timezone_info lookup_with_retries(const timezone_query& query);

private:
    timezone_lookup& lookup_;
    resolver_options options_;
    timezone_cache& cache_;
};

} // namespace fmsave

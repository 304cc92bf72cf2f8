#pragma once

/**
 * @file exceptions.hpp
 * @brief Definitions of the exceptions for `fmsave` module.
 */

#include <base/exception.hpp>
#include <base/format.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace fmsave {

class exception : public base::exception
{
public:
    explicit exception(std::string&& what)
        : base::exception(std::move(what))
    {
    }

    exception(std::string&& what, params_t&& params)
        : base::exception(std::move(what), std::move(params))
    {
    }
};

/// The merge could not be performed. The existing dataset is left unmodified.
class merge_error : public exception
{
public:
    explicit merge_error(std::string&& what)
        : exception(std::move(what))
    {
    }

    merge_error(std::string&& what, params_t&& params)
        : exception(std::move(what), std::move(params))
    {
    }
};

class invalid_merge_window : public merge_error
{
public:
    invalid_merge_window(std::string_view after, std::string_view before)
        : merge_error(fmt::format("Merge window start {} is after its end {}.", after, before),
                      {{"after", std::string(after)}, {"before", std::string(before)}})
    {
    }
};

class duplicate_merge_key : public merge_error
{
public:
    duplicate_merge_key(std::string_view key, size_t first, size_t second)
        : merge_error(fmt::format("Rows {} and {} share the merge key {}.", first, second, key),
                      {{"key", std::string(key)}, {"first", std::to_string(first)}, {"second", std::to_string(second)}})
        , first_(first)
        , second_(second)
    {
    }

    [[nodiscard]] size_t first() const noexcept
    {
        return first_;
    }

    [[nodiscard]] size_t second() const noexcept
    {
        return second_;
    }

private:
    size_t first_;
    size_t second_;
};

class schema_mismatch : public merge_error
{
public:
    schema_mismatch(std::string_view expected, std::string_view actual)
        : merge_error(fmt::format("Cannot merge rows of schema '{}' into a dataset of schema '{}'.", actual, expected),
                      {{"expected", std::string(expected)}, {"actual", std::string(actual)}})
    {
    }
};

/// Base of the failures a timezone lookup reports.
class lookup_error : public exception
{
public:
    explicit lookup_error(std::string&& what)
        : exception(std::move(what))
    {
    }

    lookup_error(std::string&& what, params_t&& params)
        : exception(std::move(what), std::move(params))
    {
    }
};

/// The lookup service refuses further calls until its credit is renewed.
class quota_exceeded : public lookup_error
{
public:
    explicit quota_exceeded(std::string_view message)
        : lookup_error(fmt::format("Timezone lookup quota exceeded: {}", message), {{"message", std::string(message)}})
    {
    }
};

class lookup_not_found : public lookup_error
{
public:
    lookup_not_found(double lat, double lon, std::string_view message)
        : lookup_error(fmt::format("No timezone found for ({}, {}): {}", lat, lon, message),
                       {{"lat", fmt::format("{}", lat)}, {"lon", fmt::format("{}", lon)}})
    {
    }
};

/// A failure which may succeed when retried (network error, rate limiting, server error).
class transient_lookup_error : public lookup_error
{
public:
    explicit transient_lookup_error(std::string_view message)
        : lookup_error(fmt::format("Temporary timezone lookup failure: {}", message),
                       {{"message", std::string(message)}})
    {
    }
};

class lookup_authorization_error : public lookup_error
{
public:
    explicit lookup_authorization_error(std::string_view message)
        : lookup_error(fmt::format("Timezone lookup not authorized: {}", message), {{"message", std::string(message)}})
    {
    }
};

/// Failure of a single resolver query. Collected in the resolution result, never thrown out of the resolver.
class resolution_error : public exception
{
public:
    resolution_error(std::string_view query, std::string_view reason)
        : exception(fmt::format("Cannot resolve timezone for {}: {}", query, reason),
                    {{"query", std::string(query)}, {"reason", std::string(reason)}})
    {
    }
};

/// A row that cannot be exported. Collected in the export result; the row is excluded.
class export_error : public exception
{
public:
    export_error(size_t row, std::string_view column, std::string_view reason)
        : exception(fmt::format("Row {} cannot be exported, column '{}': {}", row, column, reason),
                    {{"row", std::to_string(row)}, {"column", std::string(column)}, {"reason", std::string(reason)}})
        , row_(row)
        , column_(column)
    {
    }

    [[nodiscard]] size_t row() const noexcept
    {
        return row_;
    }

    [[nodiscard]] const std::string& column() const noexcept
    {
        return column_;
    }

private:
    size_t row_;
    std::string column_;
};

class unknown_reference_table : public exception
{
public:
    explicit unknown_reference_table(std::string_view table)
        : exception(fmt::format("Reference table '{}' is not loaded.", table), {{"table", std::string(table)}})
    {
    }
};

class config_error : public exception
{
public:
    config_error(std::string_view path, std::string_view reason)
        : exception(fmt::format("Invalid configuration '{}': {}", path, reason),
                    {{"path", std::string(path)}, {"reason", std::string(reason)}})
    {
    }
};

} // namespace fmsave

#pragma once

/**
 * @file exceptions.hpp
 * @brief Definitions of the exceptions for `fmsave_core` module.
 */

#include <base/exception.hpp>
#include <base/format.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace fmsave_core {

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

/// Malformed schema document. Raised before any dataset I/O happens.
class schema_error : public exception
{
public:
    explicit schema_error(std::string&& what)
        : exception(std::move(what))
    {
    }

    schema_error(std::string&& what, params_t&& params)
        : exception(std::move(what), std::move(params))
    {
    }
};

class unknown_column_type : public schema_error
{
public:
    unknown_column_type(std::string_view column, std::string_view type)
        : schema_error(fmt::format("Column '{}' declares unknown type '{}'.", column, type),
                       {{"column", std::string(column)}, {"type", std::string(type)}})
    {
    }
};

class duplicate_column : public schema_error
{
public:
    explicit duplicate_column(std::string_view column)
        : schema_error(fmt::format("Column '{}' is declared more than once.", column),
                       {{"column", std::string(column)}})
    {
    }
};

class unpaired_side_column : public schema_error
{
public:
    unpaired_side_column(std::string_view column, std::string_view side, std::string_view missing_side)
        : schema_error(fmt::format("Column '{}' is tagged '{}' but no paired '{}' column exists.", column, side,
                                   missing_side),
                       {{"column", std::string(column)}, {"side", std::string(side)}})
    {
    }
};

class unknown_column : public schema_error
{
public:
    unknown_column(std::string_view schema, std::string_view column)
        : schema_error(fmt::format("Schema '{}' has no column '{}'.", schema, column),
                       {{"schema", std::string(schema)}, {"column", std::string(column)}})
    {
    }
};

class invalid_schema_document : public schema_error
{
public:
    invalid_schema_document(std::string_view schema, std::string_view reason)
        : schema_error(fmt::format("Invalid schema document '{}': {}", schema, reason),
                       {{"schema", std::string(schema)}, {"reason", std::string(reason)}})
    {
    }
};

class unknown_dialect : public schema_error
{
public:
    unknown_dialect(std::string_view dialect, std::string_view path)
        : schema_error(fmt::format("No schema found for dialect '{}' at '{}'.", dialect, path),
                       {{"dialect", std::string(dialect)}, {"path", std::string(path)}})
    {
    }
};

/// A textual field that cannot be converted to its column's type.
class decode_error : public exception
{
public:
    decode_error(std::string_view column, std::string_view raw, std::string_view reason)
        : exception(fmt::format("Cannot decode column '{}' from '{}': {}", column, raw, reason),
                    {{"column", std::string(column)}, {"raw", std::string(raw)}, {"reason", std::string(reason)}})
        , column_(column)
        , raw_(raw)
    {
    }

    decode_error(const decode_error& error, size_t row)
        : exception(fmt::format("Row {}: {}", row, error.message()), params_with_row(error, row))
        , column_(error.column_)
        , raw_(error.raw_)
        , row_(row)
    {
    }

    [[nodiscard]] const std::string& column() const noexcept
    {
        return column_;
    }

    [[nodiscard]] const std::string& raw() const noexcept
    {
        return raw_;
    }

    [[nodiscard]] std::optional<size_t> row() const noexcept
    {
        return row_;
    }

protected:
    decode_error(std::string&& what, params_t&& params)
        : exception(std::move(what), std::move(params))
    {
    }

private:
    static params_t params_with_row(const decode_error& error, size_t row)
    {
        auto params = error.params();
        params["row"] = std::to_string(row);
        return params;
    }

    std::string column_;
    std::string raw_;
    std::optional<size_t> row_;
};

class field_count_mismatch : public decode_error
{
public:
    field_count_mismatch(std::string_view schema, size_t expected, size_t actual)
        : decode_error(fmt::format("Schema '{}' has {} columns but the record has {} fields.", schema, expected, actual),
                       {{"schema", std::string(schema)},
                        {"expected", std::to_string(expected)},
                        {"actual", std::to_string(actual)}})
    {
    }
};

class encode_error : public exception
{
public:
    encode_error(std::string_view column, std::string_view reason)
        : exception(fmt::format("Cannot encode column '{}': {}", column, reason),
                    {{"column", std::string(column)}, {"reason", std::string(reason)}})
        , column_(column)
    {
    }

    [[nodiscard]] const std::string& column() const noexcept
    {
        return column_;
    }

private:
    std::string column_;
};

class csv_error : public exception
{
public:
    csv_error(size_t line, std::string_view reason)
        : exception(fmt::format("Malformed CSV at line {}: {}", line, reason),
                    {{"line", std::to_string(line)}, {"reason", std::string(reason)}})
    {
    }
};

} // namespace fmsave_core

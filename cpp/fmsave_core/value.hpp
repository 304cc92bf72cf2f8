#pragma once

/**
 * @file value.hpp
 * @brief Definition of the `value` class, a single typed cell of a row.
 */

#include "column_type.hpp"
#include "time_format.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace fmsave_core {

/**
 * @brief Strictly typed cell value or the explicit absent marker.
 *
 * Absent is distinct from an empty string, zero or false. A default constructed value is absent.
 */
class value
{
public:
    using variant_t = std::variant<std::monostate, std::string, date_t, datetime_t, timedelta_t, int64_t, double, bool>;

public:
    value() = default;

    explicit value(std::string v)
        : data_(std::move(v))
    {
    }

    explicit value(const char* v)
        : data_(std::string(v))
    {
    }

    explicit value(date_t v)
        : data_(v)
    {
    }

    explicit value(datetime_t v)
        : data_(v)
    {
    }

    explicit value(timedelta_t v)
        : data_(v)
    {
    }

    template <typename T>
    requires(std::is_integral_v<T> && !std::is_same_v<T, bool>)
    explicit value(T v)
        : data_(static_cast<int64_t>(v))
    {
    }

    explicit value(double v)
        : data_(v)
    {
    }

    explicit value(bool v)
        : data_(v)
    {
    }

    static value absent()
    {
        return value();
    }

    [[nodiscard]] bool is_absent() const noexcept
    {
        return std::holds_alternative<std::monostate>(data_);
    }

    [[nodiscard]] bool is_present() const noexcept
    {
        return !is_absent();
    }

    template <typename T>
    [[nodiscard]] bool holds() const noexcept
    {
        return std::holds_alternative<T>(data_);
    }

    /// @throws std::bad_variant_access if the value does not hold a `T`.
    template <typename T>
    [[nodiscard]] const T& get() const
    {
        return std::get<T>(data_);
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const noexcept
    {
        return std::get_if<T>(&data_);
    }

    /// Numeric content as double, for integer and float values.
    [[nodiscard]] std::optional<double> as_double() const noexcept;

    /// Whether the held alternative is the one a column of type `t` stores. Absent matches every type.
    [[nodiscard]] bool matches(column_type t) const noexcept;

    [[nodiscard]] const variant_t& data() const noexcept
    {
        return data_;
    }

    /// Human readable representation used in log messages and findings.
    [[nodiscard]] std::string to_string() const;

    bool operator==(const value& other) const = default;

    bool operator<(const value& other) const
    {
        return data_ < other.data_;
    }

private:
    variant_t data_;
};

/// Values of the merge-key columns of a row, in declared column order.
using key_tuple = std::vector<value>;

std::string key_to_string(const key_tuple& key);

} // namespace fmsave_core

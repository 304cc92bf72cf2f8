#pragma once

/**
 * @file row.hpp
 * @brief Definition of the `row` class.
 */

#include "schema.hpp"
#include "value.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fmsave_core {

/**
 * @brief Typed row of a schema: one value (possibly absent) per schema column.
 *
 * For columns tagged for timezone lookup the row also keeps the naive text the value was decoded from,
 * so that text which failed to parse survives a decode/encode cycle.
 */
class row
{
public:
    /// Row with every column absent.
    explicit row(schema_ptr schema);

    /// @throws fmsave_core::encode_error if a value does not match its column type or the count is wrong.
    row(schema_ptr schema, std::vector<value> values);

    [[nodiscard]] const fmsave_core::schema& get_schema() const
    {
        return *schema_;
    }

    [[nodiscard]] const schema_ptr& shared_schema() const
    {
        return schema_;
    }

    [[nodiscard]] size_t size() const
    {
        return values_.size();
    }

    [[nodiscard]] const value& operator[](size_t index) const
    {
        return values_[index];
    }

    [[nodiscard]] const std::vector<value>& values() const
    {
        return values_;
    }

    /// @throws fmsave_core::unknown_column
    [[nodiscard]] const value& get(std::string_view column) const;

    /**
     * @brief Replaces the value at `index`, dropping any raw text kept for that column.
     * @throws fmsave_core::encode_error if the value does not match the column type.
     */
    void set(size_t index, value v);

    /// @throws fmsave_core::unknown_column, fmsave_core::encode_error
    void set(std::string_view column, value v)
    {
        set(schema_->index_of(column), std::move(v));
    }

    [[nodiscard]] std::optional<std::string> raw_text(size_t index) const;

    void set_raw_text(size_t index, std::string text)
    {
        raw_text_[index] = std::move(text);
    }

    [[nodiscard]] key_tuple merge_key() const;

    /**
     * @brief Rows are equal when they share a schema and hold equal values. Raw text is compared
     * only for columns whose value is absent.
     */
    bool operator==(const row& other) const;

private:
    schema_ptr schema_;
    std::vector<value> values_;
    std::map<size_t, std::string> raw_text_;
};

} // namespace fmsave_core

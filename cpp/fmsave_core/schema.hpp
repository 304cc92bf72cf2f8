#pragma once

/**
 * @file schema.hpp
 * @brief Definition of the `schema` class.
 */

#include "column_definition.hpp"
#include "time_format.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fmsave_core {

/// Dialect level metadata of a schema document.
struct document_info
{
    std::string version = "1";
    std::string data_source;
    std::string url;
    std::string encoding = "utf-8";
    char separator = ',';
    std::string newline = "\r\n";
    bool header_row = true;
    std::string notes;
    std::string date_format = std::string(default_date_format);
    std::string datetime_format = std::string(default_datetime_format);
};

/// Columns driving the merge engine.
struct merge_spec
{
    std::optional<std::string> window_column;
    std::vector<std::string> order_columns;
    std::optional<std::string> index_column;
};

/**
 * @brief Ordered, immutable set of column definitions of a dataset dialect.
 *
 * A schema is validated when constructed and never changes afterwards; it is shared between
 * rows and datasets through `std::shared_ptr<const schema>`.
 */
class schema
{
public:
    /**
     * @throws fmsave_core::schema_error if the definitions are contradictory.
     */
    schema(std::string name, document_info document, merge_spec merge, std::vector<column_definition> columns);

    /**
     * @brief Builds a schema from its JSON document.
     * @throws fmsave_core::schema_error on malformed document, unknown type or contradictory columns.
     */
    static std::shared_ptr<const schema> from_json(std::string name, const nlohmann::json& document);

    /// Same as `from_json`, from JSON text.
    static std::shared_ptr<const schema> parse(std::string name, std::string_view text);

    [[nodiscard]] const std::string& name() const
    {
        return name_;
    }

    [[nodiscard]] const document_info& document() const
    {
        return document_;
    }

    [[nodiscard]] const merge_spec& merge() const
    {
        return merge_;
    }

    [[nodiscard]] const std::vector<column_definition>& columns() const
    {
        return columns_;
    }

    [[nodiscard]] size_t size() const
    {
        return columns_.size();
    }

    [[nodiscard]] const column_definition& column(size_t index) const
    {
        return columns_[index];
    }

    /// @throws fmsave_core::unknown_column
    [[nodiscard]] const column_definition& column(std::string_view name) const
    {
        return columns_[index_of(name)];
    }

    [[nodiscard]] std::optional<size_t> find(std::string_view name) const;

    /// @throws fmsave_core::unknown_column
    [[nodiscard]] size_t index_of(std::string_view name) const;

    [[nodiscard]] bool contains(std::string_view name) const
    {
        return find(name).has_value();
    }

    /// Positions of the merge-key columns in declared order.
    [[nodiscard]] const std::vector<size_t>& merge_key_indices() const
    {
        return merge_key_indices_;
    }

    /**
     * @brief Finds the column of the given side whose provenance field is `field`, e.g. (departure, "lat").
     */
    [[nodiscard]] std::optional<size_t> find_by_provenance(side s, std::string_view field) const;

    /// Date or datetime column of the given side tagged for timezone lookup.
    [[nodiscard]] std::optional<size_t> timezone_lookup_date(side s) const;

    /// Text format of a date or datetime column: its own `format` or the dialect default.
    [[nodiscard]] std::string text_format(const column_definition& column) const;

    [[nodiscard]] std::string to_string() const;

private:
    void validate() const;

private:
    std::string name_;
    document_info document_;
    merge_spec merge_;
    std::vector<column_definition> columns_;
    std::map<std::string, size_t, std::less<>> index_;
    std::vector<size_t> merge_key_indices_;
};

using schema_ptr = std::shared_ptr<const schema>;

} // namespace fmsave_core

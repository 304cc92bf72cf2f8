#pragma once

/**
 * @file column_definition.hpp
 * @brief Definition of the `column_definition` class and column provenance.
 */

#include "column_type.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace fmsave_core {

/// Value copied from a single named source column.
struct field_provenance
{
    std::string column;
};

/// Source column and output format selected by the value of a discriminator column.
struct switch_provenance
{
    struct selection
    {
        std::string column;
        std::optional<std::string> format;
    };

    std::string discriminator;
    std::map<std::string, selection, std::less<>> cases;
};

/**
 * @brief Value of `field` in a row of the reference table `table`.
 *
 * The attempts are tried in order. An attempt finds the row whose table columns equal all of its source
 * columns; an attempt with an absent or empty source value is skipped.
 */
struct lookup_provenance
{
    struct key_match
    {
        std::string key_column;
        std::string match;
    };

    using attempt = std::vector<key_match>;

    std::string table;
    std::vector<attempt> attempts;
    std::string field;
};

using provenance = std::variant<field_provenance, switch_provenance, lookup_provenance>;

/// Names of the source columns a provenance reads.
std::vector<std::string> provenance_columns(const provenance& p);

enum class text_transform : uint8_t
{
    lower,
    upper
};

enum class distance_unit : uint8_t
{
    km,
    miles
};

/// Optional attributes of a column. Everything except name and type.
struct column_options
{
    bool merge_key = false;
    fmsave_core::side side = fmsave_core::side::none;
    std::optional<fmsave_core::provenance> provenance;
    bool use_for_timezone_lookup = false;
    bool required = false;
    std::optional<std::string> format;
    std::optional<distance_unit> unit;
    std::map<std::string, std::string, std::less<>> value_map;
    std::optional<text_transform> transform;
    std::optional<std::string> default_value;
    std::string notes;
};

class column_definition
{
public:
    column_definition(std::string name, column_type type, column_options options = {})
        : name_(std::move(name))
        , type_(type)
        , options_(std::move(options))
    {
    }

    [[nodiscard]] const std::string& name() const
    {
        return name_;
    }

    [[nodiscard]] column_type type() const
    {
        return type_;
    }

    [[nodiscard]] bool is_merge_key() const
    {
        return options_.merge_key;
    }

    [[nodiscard]] fmsave_core::side column_side() const
    {
        return options_.side;
    }

    [[nodiscard]] const std::optional<fmsave_core::provenance>& column_provenance() const
    {
        return options_.provenance;
    }

    /// Name of the single source field, when the provenance is a plain field.
    [[nodiscard]] std::optional<std::string> source_field() const;

    [[nodiscard]] bool use_for_timezone_lookup() const
    {
        return options_.use_for_timezone_lookup;
    }

    [[nodiscard]] bool required() const
    {
        return options_.required;
    }

    [[nodiscard]] const std::optional<std::string>& format() const
    {
        return options_.format;
    }

    [[nodiscard]] const std::optional<distance_unit>& unit() const
    {
        return options_.unit;
    }

    [[nodiscard]] const auto& value_map() const
    {
        return options_.value_map;
    }

    [[nodiscard]] const std::optional<text_transform>& transform() const
    {
        return options_.transform;
    }

    [[nodiscard]] const std::optional<std::string>& default_value() const
    {
        return options_.default_value;
    }

    [[nodiscard]] const std::string& notes() const
    {
        return options_.notes;
    }

    /**
     * @brief Key used to pair a departure column with its arrival counterpart.
     *
     * The provenance field when the column has one, otherwise the name without its side suffix.
     */
    [[nodiscard]] std::string pairing_key() const;

    [[nodiscard]] std::string to_string() const;

private:
    std::string name_;
    column_type type_;
    column_options options_;
};

} // namespace fmsave_core

#pragma once

/**
 * @file reference_table.hpp
 * @brief Read-only lookup tables (airports, airlines) used by the exporter.
 */

#include <fmsave_core/row.hpp>
#include <fmsave_core/schema.hpp>
#include <storage/storage.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fmsave {

/**
 * @brief Rows of a reference dialect searchable by the encoded text of any column.
 *
 * Indexes are built on first use of a set of key columns. When several rows share a key the first one wins.
 */
class reference_table
{
public:
    reference_table(fmsave_core::schema_ptr schema, std::vector<fmsave_core::row> rows);

    /**
     * @brief Loads the table stored at `path`.
     * @throws storage::storage_key_not_found, fmsave_core::decode_error
     */
    static reference_table load(const storage::storage& storage,
                                const std::string& path,
                                const fmsave_core::schema_ptr& schema);

    [[nodiscard]] const std::string& name() const
    {
        return schema_->name();
    }

    [[nodiscard]] size_t size() const
    {
        return rows_.size();
    }

    /// Table column and the encoded text it must equal.
    using key_value = std::pair<std::string, std::string>;

    /**
     * @brief Value of `field` in the first row whose `key_column` encodes to `key`.
     * @throws fmsave_core::unknown_column if either column is not in the table schema.
     */
    [[nodiscard]] std::optional<fmsave_core::value>
    lookup(std::string_view key_column, std::string_view key, std::string_view field) const;

    /// Value of `field` in the first row matching every key. Same failures as the single key lookup.
    [[nodiscard]] std::optional<fmsave_core::value> lookup(const std::vector<key_value>& keys,
                                                           std::string_view field) const;

    [[nodiscard]] const fmsave_core::schema& get_schema() const
    {
        return *schema_;
    }

private:
    using index_t = std::map<std::vector<std::string>, size_t>;

    const index_t& index_for(const std::vector<size_t>& columns) const;

private:
    fmsave_core::schema_ptr schema_;
    std::vector<fmsave_core::row> rows_;
    mutable std::map<std::vector<size_t>, index_t> indexes_;
};

/// Reference tables by name.
class reference_tables
{
public:
    void add(reference_table table);

    /// @throws fmsave::unknown_reference_table
    [[nodiscard]] const reference_table& get(std::string_view name) const;

    [[nodiscard]] bool contains(std::string_view name) const
    {
        return tables_.find(name) != tables_.end();
    }

    [[nodiscard]] bool empty() const
    {
        return tables_.empty();
    }

private:
    std::map<std::string, reference_table, std::less<>> tables_;
};

} // namespace fmsave

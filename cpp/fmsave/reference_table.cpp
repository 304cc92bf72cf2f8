#include "reference_table.hpp"
#include "dataset_io.hpp"
#include "exceptions.hpp"

#include <base/base.hpp>
#include <fmsave_core/row_codec.hpp>

namespace fmsave {

reference_table::reference_table(fmsave_core::schema_ptr schema, std::vector<fmsave_core::row> rows)
    : schema_(std::move(schema))
    , rows_(std::move(rows))
{
}

reference_table reference_table::load(const storage::storage& storage,
                                      const std::string& path,
                                      const fmsave_core::schema_ptr& schema)
{
    auto span = base::log_span(base::log_channel::export_, fmt::format("load reference table {}", path));
    auto rows = decode_rows(storage.get_text(path), schema);
    base::log_info(base::log_channel::export_, "Loaded {} rows of reference table '{}'", rows.size(), schema->name());
    return reference_table(schema, std::move(rows));
}

std::optional<fmsave_core::value>
reference_table::lookup(std::string_view key_column, std::string_view key, std::string_view field) const
{
    return lookup({{std::string(key_column), std::string(key)}}, field);
}

std::optional<fmsave_core::value> reference_table::lookup(const std::vector<key_value>& keys,
                                                          std::string_view field) const
{
    std::vector<size_t> columns;
    std::vector<std::string> key;
    columns.reserve(keys.size());
    key.reserve(keys.size());
    for (const auto& [column, text] : keys) {
        columns.push_back(schema_->index_of(column));
        key.push_back(text);
    }
    const auto field_index = schema_->index_of(field);
    const auto& index = index_for(columns);
    auto it = index.find(key);
    if (it == index.end()) {
        return std::nullopt;
    }
    return rows_[it->second][field_index];
}

const reference_table::index_t& reference_table::index_for(const std::vector<size_t>& columns) const
{
    auto it = indexes_.find(columns);
    if (it != indexes_.end()) {
        return it->second;
    }
    index_t index;
    for (size_t i = 0; i < rows_.size(); ++i) {
        std::vector<std::string> key;
        key.reserve(columns.size());
        for (auto column : columns) {
            const auto& v = rows_[i][column];
            if (v.is_absent()) {
                break;
            }
            key.push_back(fmsave_core::encode_value(v, schema_->column(column), *schema_));
        }
        if (key.size() == columns.size()) {
            index.emplace(std::move(key), i);
        }
    }
    std::vector<std::string> names;
    for (auto column : columns) {
        names.push_back(schema_->column(column).name());
    }
    base::log_debug(base::log_channel::export_, "Indexed reference table '{}' by {}: {} keys", schema_->name(),
                    names, index.size());
    return indexes_.emplace(columns, std::move(index)).first->second;
}

void reference_tables::add(reference_table table)
{
    auto name = table.name();
    tables_.insert_or_assign(std::move(name), std::move(table));
}

const reference_table& reference_tables::get(std::string_view name) const
{
    auto it = tables_.find(name);
    if (it == tables_.end()) {
        throw unknown_reference_table(name);
    }
    return it->second;
}

} // namespace fmsave

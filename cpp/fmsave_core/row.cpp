#include "row.hpp"
#include "exceptions.hpp"

namespace fmsave_core {

row::row(schema_ptr schema)
    : schema_(std::move(schema))
    , values_(schema_->size())
{
}

row::row(schema_ptr schema, std::vector<value> values)
    : schema_(std::move(schema))
    , values_(std::move(values))
{
    if (values_.size() != schema_->size()) {
        throw encode_error(schema_->name(),
                           fmt::format("row has {} values, schema has {} columns", values_.size(), schema_->size()));
    }
    for (size_t i = 0; i < values_.size(); ++i) {
        const auto& column = schema_->column(i);
        if (!values_[i].matches(column.type())) {
            throw encode_error(column.name(), fmt::format("value '{}' is not of type {}", values_[i].to_string(),
                                                          column_type_to_str(column.type())));
        }
    }
}

const value& row::get(std::string_view column) const
{
    return values_[schema_->index_of(column)];
}

void row::set(size_t index, value v)
{
    const auto& column = schema_->column(index);
    if (!v.matches(column.type())) {
        throw encode_error(column.name(),
                           fmt::format("value '{}' is not of type {}", v.to_string(), column_type_to_str(column.type())));
    }
    values_[index] = std::move(v);
    raw_text_.erase(index);
}

std::optional<std::string> row::raw_text(size_t index) const
{
    auto it = raw_text_.find(index);
    if (it == raw_text_.end()) {
        return std::nullopt;
    }
    return it->second;
}

key_tuple row::merge_key() const
{
    key_tuple key;
    key.reserve(schema_->merge_key_indices().size());
    for (auto index : schema_->merge_key_indices()) {
        key.push_back(values_[index]);
    }
    return key;
}

bool row::operator==(const row& other) const
{
    if (schema_ != other.schema_ && schema_->name() != other.schema_->name()) {
        return false;
    }
    if (values_ != other.values_) {
        return false;
    }
    for (size_t i = 0; i < values_.size(); ++i) {
        if (values_[i].is_absent() && raw_text(i) != other.raw_text(i)) {
            return false;
        }
    }
    return true;
}

} // namespace fmsave_core

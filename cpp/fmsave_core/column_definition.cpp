#include "column_definition.hpp"

#include <base/format.hpp>

namespace fmsave_core {

std::vector<std::string> provenance_columns(const provenance& p)
{
    std::vector<std::string> result;
    if (const auto* f = std::get_if<field_provenance>(&p)) {
        result.push_back(f->column);
    } else if (const auto* s = std::get_if<switch_provenance>(&p)) {
        result.push_back(s->discriminator);
        for (const auto& [_, selection] : s->cases) {
            result.push_back(selection.column);
        }
    } else if (const auto* l = std::get_if<lookup_provenance>(&p)) {
        for (const auto& attempt : l->attempts) {
            for (const auto& key : attempt) {
                result.push_back(key.key_column);
            }
        }
    }
    return result;
}

std::optional<std::string> column_definition::source_field() const
{
    if (options_.provenance) {
        if (const auto* f = std::get_if<field_provenance>(&*options_.provenance)) {
            return f->column;
        }
    }
    return std::nullopt;
}

std::string column_definition::pairing_key() const
{
    if (auto field = source_field()) {
        return *field;
    }
    const auto suffix = side_suffix(options_.side);
    if (!suffix.empty() && name_.size() > suffix.size() && name_.ends_with(suffix)) {
        return name_.substr(0, name_.size() - suffix.size());
    }
    return name_;
}

std::string column_definition::to_string() const
{
    auto result = fmt::format("{}: {}", name_, column_type_to_str(type_));
    if (options_.merge_key) {
        result += " [merge key]";
    }
    if (options_.side != side::none) {
        result += fmt::format(" [{}]", side_to_str(options_.side));
    }
    if (auto field = source_field()) {
        result += fmt::format(" <- {}", *field);
    }
    return result;
}

} // namespace fmsave_core

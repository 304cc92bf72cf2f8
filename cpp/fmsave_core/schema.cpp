#include "schema.hpp"
#include "exceptions.hpp"

#include <base/base.hpp>

#include <set>
#include <sstream>

namespace fmsave_core {

namespace {

template <typename T>
T value_or(const nlohmann::json& object, const char* key, T default_value)
{
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return default_value;
    }
    return it->get<T>();
}

std::optional<std::string> optional_string(const nlohmann::json& object, const char* key)
{
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

document_info parse_document(const std::string& schema_name, const nlohmann::json& json)
{
    document_info doc;
    if (json.is_null()) {
        return doc;
    }
    doc.version = json.contains("version") && json["version"].is_number() ? std::to_string(json["version"].get<int>())
                                                                          : value_or<std::string>(json, "version", doc.version);
    doc.data_source = value_or<std::string>(json, "data_source", doc.data_source);
    doc.url = value_or<std::string>(json, "url", doc.url);
    doc.encoding = value_or<std::string>(json, "encoding", doc.encoding);
    const auto separator = value_or<std::string>(json, "separator", std::string(1, doc.separator));
    if (separator.size() != 1) {
        throw invalid_schema_document(schema_name, fmt::format("separator '{}' must be a single character", separator));
    }
    doc.separator = separator[0];
    doc.newline = value_or<std::string>(json, "newline", doc.newline);
    if (doc.newline != "\n" && doc.newline != "\r\n") {
        throw invalid_schema_document(schema_name, "newline must be LF or CRLF");
    }
    doc.header_row = value_or<bool>(json, "header_row", doc.header_row);
    doc.notes = value_or<std::string>(json, "notes", doc.notes);
    doc.date_format = value_or<std::string>(json, "date_format", doc.date_format);
    doc.datetime_format = value_or<std::string>(json, "datetime_format", doc.datetime_format);
    return doc;
}

merge_spec parse_merge(const nlohmann::json& json)
{
    merge_spec spec;
    if (json.is_null()) {
        return spec;
    }
    spec.window_column = optional_string(json, "window_column");
    spec.order_columns = value_or<std::vector<std::string>>(json, "order_columns", {});
    spec.index_column = optional_string(json, "index_column");
    return spec;
}

provenance parse_provenance(const std::string& schema_name, const std::string& column, const nlohmann::json& json)
{
    if (json.is_string()) {
        return field_provenance{json.get<std::string>()};
    }
    if (json.is_object() && json.contains("switch")) {
        switch_provenance result;
        result.discriminator = json.at("switch").get<std::string>();
        for (const auto& [key, selection] : json.at("cases").items()) {
            result.cases.emplace(key, switch_provenance::selection{selection.at("column").get<std::string>(),
                                                                   optional_string(selection, "format")});
        }
        return result;
    }
    if (json.is_object() && json.contains("lookup")) {
        lookup_provenance result;
        result.table = json.at("lookup").get<std::string>();
        result.field = json.at("field").get<std::string>();
        if (json.contains("keys")) {
            // [{"source column": "table column", ...}, ...]
            for (const auto& keys : json.at("keys")) {
                lookup_provenance::attempt attempt;
                for (const auto& [key, match] : keys.items()) {
                    attempt.push_back({key, match.get<std::string>()});
                }
                if (attempt.empty()) {
                    throw invalid_schema_document(schema_name,
                                                  fmt::format("column '{}' has an empty lookup key set", column));
                }
                result.attempts.push_back(std::move(attempt));
            }
        } else {
            result.attempts.push_back({{json.at("key").get<std::string>(), json.at("match").get<std::string>()}});
        }
        if (result.attempts.empty()) {
            throw invalid_schema_document(schema_name, fmt::format("column '{}' has no lookup keys", column));
        }
        return result;
    }
    throw invalid_schema_document(schema_name, fmt::format("column '{}' has an unrecognised provenance", column));
}

column_definition parse_column(const std::string& schema_name, const nlohmann::json& json)
{
    const auto name = json.at("name").get<std::string>();
    const auto type_name = json.at("type").get<std::string>();
    const auto type = column_type_from_str(type_name);
    if (!type) {
        throw unknown_column_type(name, type_name);
    }

    column_options options;
    options.merge_key = value_or<bool>(json, "merge_key", false);
    if (auto s = optional_string(json, "side")) {
        auto parsed = side_from_str(*s);
        if (!parsed) {
            throw invalid_schema_document(schema_name, fmt::format("column '{}' has unknown side '{}'", name, *s));
        }
        options.side = *parsed;
    }
    if (auto it = json.find("provenance"); it != json.end() && !it->is_null()) {
        options.provenance = parse_provenance(schema_name, name, *it);
    }
    options.use_for_timezone_lookup = value_or<bool>(json, "use_for_timezone_lookup", false);
    options.required = value_or<bool>(json, "required", false);
    options.format = optional_string(json, "format");
    if (auto unit = optional_string(json, "unit")) {
        if (*unit == "km") {
            options.unit = distance_unit::km;
        } else if (*unit == "miles") {
            options.unit = distance_unit::miles;
        } else {
            throw invalid_schema_document(schema_name, fmt::format("column '{}' has unknown unit '{}'", name, *unit));
        }
    }
    if (auto it = json.find("value_map"); it != json.end() && !it->is_null()) {
        for (const auto& [from, to] : it->items()) {
            options.value_map.emplace(from, to.get<std::string>());
        }
    }
    if (auto transform = optional_string(json, "transform")) {
        if (*transform == "lower") {
            options.transform = text_transform::lower;
        } else if (*transform == "upper") {
            options.transform = text_transform::upper;
        } else {
            throw invalid_schema_document(schema_name,
                                          fmt::format("column '{}' has unknown transform '{}'", name, *transform));
        }
    }
    options.default_value = optional_string(json, "default");
    options.notes = value_or<std::string>(json, "notes", "");
    return column_definition(name, *type, std::move(options));
}

} // namespace

schema::schema(std::string name, document_info document, merge_spec merge, std::vector<column_definition> columns)
    : name_(std::move(name))
    , document_(std::move(document))
    , merge_(std::move(merge))
    , columns_(std::move(columns))
{
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (!index_.emplace(columns_[i].name(), i).second) {
            throw duplicate_column(columns_[i].name());
        }
        if (columns_[i].is_merge_key()) {
            merge_key_indices_.push_back(i);
        }
    }
    validate();
}

std::shared_ptr<const schema> schema::from_json(std::string name, const nlohmann::json& document)
{
    try {
        if (!document.is_object()) {
            throw invalid_schema_document(name, "document root must be an object");
        }
        auto doc = parse_document(name, document.contains("document") ? document["document"] : nlohmann::json());
        auto merge = parse_merge(document.contains("merge") ? document["merge"] : nlohmann::json());
        std::vector<column_definition> columns;
        for (const auto& column : document.at("columns")) {
            columns.push_back(parse_column(name, column));
        }
        auto result = std::make_shared<const schema>(name, std::move(doc), std::move(merge), std::move(columns));
        base::log_debug(base::log_channel::schema, "Loaded schema '{}' with {} columns", result->name(),
                        result->size());
        return result;
    } catch (const nlohmann::json::exception& e) {
        throw invalid_schema_document(name, e.what());
    }
}

std::shared_ptr<const schema> schema::parse(std::string name, std::string_view text)
{
    nlohmann::json document;
    try {
        document = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw invalid_schema_document(name, e.what());
    }
    return from_json(std::move(name), document);
}

std::optional<size_t> schema::find(std::string_view name) const
{
    auto it = index_.find(name);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t schema::index_of(std::string_view name) const
{
    auto index = find(name);
    if (!index) {
        throw unknown_column(name_, name);
    }
    return *index;
}

std::optional<size_t> schema::find_by_provenance(side s, std::string_view field) const
{
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i].column_side() == s && columns_[i].source_field() == field) {
            return i;
        }
    }
    return std::nullopt;
}

std::optional<size_t> schema::timezone_lookup_date(side s) const
{
    for (size_t i = 0; i < columns_.size(); ++i) {
        const auto& c = columns_[i];
        if (c.column_side() == s && c.use_for_timezone_lookup() && is_temporal(c.type())) {
            return i;
        }
    }
    return std::nullopt;
}

std::string schema::text_format(const column_definition& column) const
{
    if (column.format()) {
        return *column.format();
    }
    return column.type() == column_type::datetime ? document_.datetime_format : document_.date_format;
}

std::string schema::to_string() const
{
    if (columns_.empty()) {
        return fmt::format("Schema '{}': empty", name_);
    }
    std::ostringstream result;
    result << "Schema '" << name_ << "':" << std::endl;
    for (const auto& column : columns_) {
        result << "  " << column.to_string() << std::endl;
    }
    return std::move(result).str();
}

void schema::validate() const
{
    std::map<std::string, const column_definition*> departures;
    std::map<std::string, const column_definition*> arrivals;

    for (const auto& column : columns_) {
        if (column.column_side() == side::departure) {
            departures.emplace(column.pairing_key(), &column);
        } else if (column.column_side() == side::arrival) {
            arrivals.emplace(column.pairing_key(), &column);
        }

        if (column.use_for_timezone_lookup() && !is_temporal(column.type()) &&
            column.type() != column_type::floating) {
            throw invalid_schema_document(
                name_, fmt::format("column '{}' of type {} cannot be used for timezone lookup", column.name(),
                                   column_type_to_str(column.type())));
        }
        if ((!column.value_map().empty() || column.transform()) && column.type() != column_type::string) {
            throw invalid_schema_document(
                name_, fmt::format("column '{}' maps or transforms values but is not a string column", column.name()));
        }
        if (column.unit() && !is_numeric(column.type())) {
            throw invalid_schema_document(name_,
                                          fmt::format("column '{}' declares a unit but is not numeric", column.name()));
        }
    }

    for (const auto& [key, column] : departures) {
        if (!arrivals.contains(key)) {
            throw unpaired_side_column(column->name(), side_to_str(side::departure), side_to_str(side::arrival));
        }
    }
    for (const auto& [key, column] : arrivals) {
        if (!departures.contains(key)) {
            throw unpaired_side_column(column->name(), side_to_str(side::arrival), side_to_str(side::departure));
        }
    }

    if (merge_.window_column) {
        const auto index = find(*merge_.window_column);
        if (!index) {
            throw unknown_column(name_, *merge_.window_column);
        }
        if (columns_[*index].type() != column_type::date) {
            throw invalid_schema_document(name_,
                                          fmt::format("merge window column '{}' must be a date", *merge_.window_column));
        }
    }
    for (const auto& column : merge_.order_columns) {
        if (!contains(column)) {
            throw unknown_column(name_, column);
        }
    }
    if (merge_.index_column) {
        const auto index = find(*merge_.index_column);
        if (!index) {
            throw unknown_column(name_, *merge_.index_column);
        }
        if (columns_[*index].type() != column_type::integer) {
            throw invalid_schema_document(
                name_, fmt::format("index column '{}' must be an integer", *merge_.index_column));
        }
        if (columns_[*index].is_merge_key()) {
            throw invalid_schema_document(
                name_, fmt::format("index column '{}' cannot be a merge key", *merge_.index_column));
        }
    }
}

} // namespace fmsave_core

#include "row_codec.hpp"
#include "exceptions.hpp"

#include <base/base.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>

namespace fmsave_core {

namespace {

std::string_view trim(std::string_view s)
{
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

std::string to_lower(std::string_view s)
{
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return result;
}

std::optional<double> parse_double(std::string_view text)
{
    const std::string buffer(text);
    char* end = nullptr;
    const double result = std::strtod(buffer.c_str(), &end);
    if (end == buffer.c_str() || *end != '\0') {
        return std::nullopt;
    }
    return result;
}

value decode_integer(std::string_view text, const column_definition& column, std::string_view raw)
{
    int64_t result = 0;
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    if (!text.empty() && text.front() == '+') {
        ++first;
    }
    auto [ptr, ec] = std::from_chars(first, last, result);
    if (ec == std::errc() && ptr == last) {
        return value(result);
    }
    // Integer columns written through a float typed frame carry a `.0` suffix.
    auto d = parse_double(text);
    if (d && std::isfinite(*d) && std::trunc(*d) == *d && std::abs(*d) < 9.0e15) {
        return value(static_cast<int64_t>(*d));
    }
    throw decode_error(column.name(), raw, "not an integer");
}

value decode_float(std::string_view text, const column_definition& column, std::string_view raw)
{
    if (to_lower(text) == "nan") {
        return value();
    }
    auto d = parse_double(text);
    if (!d || !std::isfinite(*d)) {
        throw decode_error(column.name(), raw, "not a number");
    }
    return value(*d);
}

value decode_boolean(std::string_view text, const column_definition& column, std::string_view raw)
{
    const auto lower = to_lower(text);
    if (lower == "true" || lower == "yes" || lower == "1") {
        return value(true);
    }
    if (lower == "false" || lower == "no" || lower == "0") {
        return value(false);
    }
    throw decode_error(column.name(), raw, "not a boolean");
}

value decode_temporal(std::string_view raw, const column_definition& column, const schema& schema)
{
    const auto format = schema.text_format(column);
    if (column.type() == column_type::date) {
        if (auto d = parse_date(raw, format)) {
            return value(*d);
        }
    } else if (auto dt = parse_datetime(raw, format)) {
        return value(*dt);
    }
    throw decode_error(column.name(), raw, fmt::format("does not match format '{}'", format));
}

} // namespace

value decode_value(std::string_view raw, const column_definition& column, const schema& schema)
{
    if (column.type() == column_type::string) {
        if (raw.empty() && !column.is_merge_key()) {
            return value();
        }
        return value(std::string(raw));
    }

    const auto text = trim(raw);
    if (text.empty()) {
        return value();
    }

    switch (column.type()) {
    case column_type::date:
    case column_type::datetime:
        return decode_temporal(text, column, schema);
    case column_type::timedelta: {
        auto td = parse_timedelta(text);
        if (!td) {
            throw decode_error(column.name(), raw, "expected H:MM");
        }
        if (td->count() < 0) {
            throw decode_error(column.name(), raw, "negative duration");
        }
        return value(*td);
    }
    case column_type::integer:
        return decode_integer(text, column, raw);
    case column_type::floating:
        return decode_float(text, column, raw);
    case column_type::boolean:
        return decode_boolean(text, column, raw);
    case column_type::string:
        break;
    }
    return value(std::string(raw));
}

std::string encode_value(const value& v, const column_definition& column, const schema& schema)
{
    if (!v.matches(column.type())) {
        throw encode_error(column.name(), fmt::format("value '{}' is not of type {}", v.to_string(),
                                                      column_type_to_str(column.type())));
    }
    if (v.is_absent()) {
        return {};
    }
    switch (column.type()) {
    case column_type::string:
        return v.get<std::string>();
    case column_type::date:
        return format_date(v.get<date_t>(), schema.text_format(column));
    case column_type::datetime:
        return format_datetime(v.get<datetime_t>(), schema.text_format(column));
    case column_type::timedelta:
        return timedelta_to_str(v.get<timedelta_t>());
    case column_type::integer:
        return fmt::format("{}", v.get<int64_t>());
    case column_type::floating:
        return fmt::format("{}", v.get<double>());
    case column_type::boolean:
        return v.get<bool>() ? "True" : "False";
    }
    return {};
}

row decode(const std::vector<std::string>& fields, const schema_ptr& schema)
{
    if (fields.size() != schema->size()) {
        throw field_count_mismatch(schema->name(), schema->size(), fields.size());
    }

    std::vector<value> values;
    values.reserve(fields.size());
    std::vector<std::pair<size_t, std::string>> raw_texts;
    for (size_t i = 0; i < fields.size(); ++i) {
        const auto& column = schema->column(i);
        if (column.use_for_timezone_lookup() && is_temporal(column.type())) {
            if (!fields[i].empty()) {
                raw_texts.emplace_back(i, fields[i]);
            }
            try {
                values.push_back(decode_value(fields[i], column, *schema));
            } catch (const decode_error& e) {
                base::log_debug(base::log_channel::codec, "Keeping raw text of '{}': {}", column.name(), e.message());
                values.emplace_back();
            }
            continue;
        }
        values.push_back(decode_value(fields[i], column, *schema));
    }

    row result(schema, std::move(values));
    for (auto& [index, text] : raw_texts) {
        result.set_raw_text(index, std::move(text));
    }
    return result;
}

std::vector<std::string> encode(const row& r)
{
    const auto& schema = r.get_schema();
    std::vector<std::string> fields;
    fields.reserve(r.size());
    for (size_t i = 0; i < r.size(); ++i) {
        const auto& column = schema.column(i);
        if (r[i].is_absent()) {
            fields.push_back(r.raw_text(i).value_or(std::string()));
            continue;
        }
        fields.push_back(encode_value(r[i], column, schema));
    }
    return fields;
}

} // namespace fmsave_core

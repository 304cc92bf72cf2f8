#include "format_exporter.hpp"
#include "geo.hpp"

#include <base/base.hpp>
#include <base/overloads.hpp>
#include <fmsave_core/row_codec.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>

namespace fmsave {

namespace {

/// Value copied from the source, with the unit and the format it was selected with.
struct source_value
{
    fmsave_core::value value;
    std::optional<fmsave_core::distance_unit> unit;
    std::optional<std::string> format;
};

fmsave_core::distance_unit unit_or_km(const std::optional<fmsave_core::distance_unit>& unit)
{
    return unit.value_or(fmsave_core::distance_unit::km);
}

/// Integer text of `number`.
/// @throws export_error if `number` is not finite or outside the range of `int64_t`.
std::string integer_text(double number, size_t row, const fmsave_core::column_definition& column)
{
    constexpr double limit = 9223372036854775808.0; // 2^63
    if (!(number >= -limit && number < limit)) {
        throw export_error(row, column.name(), fmt::format("{} does not fit an integer column", number));
    }
    return fmt::format("{}", static_cast<int64_t>(number));
}

std::string render_number(double number, size_t row, const fmsave_core::column_definition& column, bool is_integer)
{
    if (column.type() == fmsave_core::column_type::integer) {
        return integer_text(number, row, column);
    }
    if (is_integer && column.type() != fmsave_core::column_type::floating) {
        return integer_text(number, row, column);
    }
    return fmt::format("{}", number);
}

std::string render(const source_value& source,
                   size_t row,
                   const fmsave_core::column_definition& column,
                   const fmsave_core::schema& target)
{
    const auto& format = source.format ? source.format : column.format();
    return std::visit(
        base::overloads{
            [](const std::monostate&) {
                return std::string();
            },
            [](const std::string& v) {
                return v;
            },
            [&](const fmsave_core::date_t& v) {
                return fmsave_core::format_date(v, format.value_or(target.document().date_format));
            },
            [&](const fmsave_core::datetime_t& v) {
                return fmsave_core::format_datetime(v, format.value_or(target.document().datetime_format));
            },
            [&](const fmsave_core::timedelta_t& v) {
                return format ? fmsave_core::format_timedelta(v, *format) : fmsave_core::timedelta_to_str(v);
            },
            [&](const int64_t& v) {
                if (!column.unit() || unit_or_km(column.unit()) == unit_or_km(source.unit)) {
                    return column.type() == fmsave_core::column_type::floating ? fmt::format("{}", static_cast<double>(v))
                                                                               : fmt::format("{}", v);
                }
                const auto converted = unit_or_km(column.unit()) == fmsave_core::distance_unit::miles
                                           ? km_to_miles(static_cast<double>(v))
                                           : miles_to_km(static_cast<double>(v));
                return render_number(converted, row, column, true);
            },
            [&](const double& v) {
                auto converted = v;
                if (column.unit() && unit_or_km(column.unit()) != unit_or_km(source.unit)) {
                    converted = unit_or_km(column.unit()) == fmsave_core::distance_unit::miles ? km_to_miles(v)
                                                                                               : miles_to_km(v);
                }
                return render_number(converted, row, column, false);
            },
            [](const bool& v) {
                return std::string(v ? "True" : "False");
            }},
        source.value.data());
}

/// Encoded source values of `attempt`, or nothing when one of them is absent or empty.
std::optional<std::vector<reference_table::key_value>> lookup_keys(const fmsave_core::row& r,
                                                                   const fmsave_core::lookup_provenance::attempt& attempt)
{
    const auto& source = r.get_schema();
    std::vector<reference_table::key_value> keys;
    keys.reserve(attempt.size());
    for (const auto& key : attempt) {
        const auto& v = r.get(key.key_column);
        if (v.is_absent()) {
            return std::nullopt;
        }
        auto text = fmsave_core::encode_value(v, source.column(key.key_column), source);
        if (text.empty()) {
            return std::nullopt;
        }
        keys.emplace_back(key.match, std::move(text));
    }
    return keys;
}

std::string describe(const std::vector<reference_table::key_value>& keys)
{
    std::string text;
    for (const auto& [column, value] : keys) {
        text += fmt::format("{}{} '{}'", text.empty() ? "" : ", ", column, value);
    }
    return text;
}

std::string apply_text_rules(std::string text, const fmsave_core::column_definition& column)
{
    const auto& map = column.value_map();
    if (auto it = map.find(text); it != map.end()) {
        text = it->second;
    }
    if (column.transform()) {
        const bool lower = *column.transform() == fmsave_core::text_transform::lower;
        std::transform(text.begin(), text.end(), text.begin(), [lower](unsigned char c) {
            return static_cast<char>(lower ? std::tolower(c) : std::toupper(c));
        });
    }
    return text;
}

} // namespace

std::string export_result::to_csv() const
{
    const auto& document = schema->document();
    fmsave_core::csv_writer writer(document.separator, document.newline);
    if (document.header_row) {
        fmsave_core::csv_record header;
        header.reserve(schema->size());
        for (const auto& column : schema->columns()) {
            header.push_back(column.name());
        }
        writer.write(header);
    }
    for (const auto& record : records) {
        writer.write(record);
    }
    return writer.str();
}

export_result format_exporter::export_dataset(const dataset& data) const
{
    auto span = base::log_span(base::log_channel::export_, fmt::format("export to {}", target_->name()));
    check_sources(data.get_schema());

    export_result result{target_, {}, {}};
    result.records.reserve(data.size());
    for (size_t i = 0; i < data.size(); ++i) {
        try {
            result.records.push_back(export_row(data[i], i));
        } catch (const export_error& e) {
            base::log_warning(base::log_channel::export_, "{}", e.what());
            result.errors.push_back(e);
        }
    }
    base::log_info(base::log_channel::export_, "Exported {} of {} rows to '{}', {} excluded", result.records.size(),
                   data.size(), target_->name(), result.errors.size());
    return result;
}

void format_exporter::check_sources(const fmsave_core::schema& source) const
{
    for (const auto& column : target_->columns()) {
        const auto& p = column.column_provenance();
        if (!p) {
            continue;
        }
        for (const auto& name : fmsave_core::provenance_columns(*p)) {
            [[maybe_unused]] auto index = source.index_of(name);
        }
        if (const auto* lookup = std::get_if<fmsave_core::lookup_provenance>(&*p)) {
            if (tables_ == nullptr) {
                throw unknown_reference_table(lookup->table);
            }
            const auto& table = tables_->get(lookup->table);
            for (const auto& attempt : lookup->attempts) {
                for (const auto& key : attempt) {
                    [[maybe_unused]] auto match = table.get_schema().index_of(key.match);
                }
            }
            [[maybe_unused]] auto field = table.get_schema().index_of(lookup->field);
        }
    }
}

fmsave_core::csv_record format_exporter::export_row(const fmsave_core::row& r, size_t index) const
{
    fmsave_core::csv_record record;
    record.reserve(target_->size());
    for (const auto& column : target_->columns()) {
        record.push_back(export_cell(r, index, column));
    }
    return record;
}

std::string format_exporter::export_cell(const fmsave_core::row& r,
                                         size_t index,
                                         const fmsave_core::column_definition& column) const
{
    const auto& source = r.get_schema();
    source_value copied;
    if (const auto& p = column.column_provenance()) {
        copied = std::visit(
            base::overloads{
                [&](const fmsave_core::field_provenance& field) {
                    return source_value{r.get(field.column), source.column(field.column).unit(), std::nullopt};
                },
                [&](const fmsave_core::switch_provenance& selector) {
                    const auto& discriminator = r.get(selector.discriminator);
                    const auto* key = discriminator.get_if<std::string>();
                    auto it = key != nullptr ? selector.cases.find(*key) : selector.cases.end();
                    if (it == selector.cases.end()) {
                        base::log_debug(base::log_channel::export_, "Row {}: no case of '{}' for '{}' value {}",
                                        index, column.name(), selector.discriminator, discriminator.to_string());
                        return source_value{};
                    }
                    const auto& selected = it->second;
                    return source_value{r.get(selected.column), source.column(selected.column).unit(), selected.format};
                },
                [&](const fmsave_core::lookup_provenance& lookup) {
                    const auto& table = tables_->get(lookup.table);
                    for (const auto& attempt : lookup.attempts) {
                        auto keys = lookup_keys(r, attempt);
                        if (!keys) {
                            continue;
                        }
                        if (auto found = table.lookup(*keys, lookup.field)) {
                            return source_value{std::move(*found), table.get_schema().column(lookup.field).unit(),
                                                std::nullopt};
                        }
                        base::log_debug(base::log_channel::export_, "Row {}: '{}' has no entry for {}", index,
                                        lookup.table, describe(*keys));
                    }
                    return source_value{};
                }},
            *p);
    }

    // Empty merge-key text stands for a missing value as well.
    auto text = copied.value.is_absent() ? std::string()
                                         : apply_text_rules(render(copied, index, column, *target_), column);
    if (text.empty()) {
        if (column.default_value()) {
            return *column.default_value();
        }
        if (column.required()) {
            throw export_error(index, column.name(), "required value is absent");
        }
    }
    return text;
}

} // namespace fmsave

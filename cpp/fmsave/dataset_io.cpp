#include "dataset_io.hpp"

#include <base/base.hpp>
#include <fmsave_core/csv.hpp>
#include <fmsave_core/exceptions.hpp>
#include <fmsave_core/row_codec.hpp>

#include <algorithm>
#include <optional>

namespace fmsave {

namespace {

/// For each header position the schema column it fills, or nullopt for unknown columns.
std::vector<std::optional<size_t>> map_header(const fmsave_core::csv_record& header, const fmsave_core::schema& schema)
{
    std::vector<std::optional<size_t>> mapping;
    mapping.reserve(header.size());
    for (const auto& name : header) {
        auto index = schema.find(name);
        if (!index) {
            base::log_warning(base::log_channel::codec, "Ignoring column '{}' unknown to schema '{}'", name,
                              schema.name());
        }
        mapping.push_back(index);
    }
    for (size_t i = 0; i < schema.size(); ++i) {
        if (std::find(mapping.begin(), mapping.end(), std::optional<size_t>(i)) == mapping.end()) {
            base::log_debug(base::log_channel::codec, "Column '{}' is not in the header; decoded from empty text",
                            schema.column(i).name());
        }
    }
    return mapping;
}

} // namespace

std::vector<fmsave_core::row> decode_rows(std::string_view text, const fmsave_core::schema_ptr& schema)
{
    fmsave_core::csv_reader reader(text, schema->document().separator);
    std::vector<fmsave_core::row> rows;

    std::optional<std::vector<std::optional<size_t>>> mapping;
    if (schema->document().header_row) {
        auto header = reader.next();
        if (!header) {
            return rows;
        }
        mapping = map_header(*header, *schema);
    }

    while (auto record = reader.next()) {
        const auto position = rows.size();
        try {
            if (!mapping) {
                rows.push_back(fmsave_core::decode(*record, schema));
                continue;
            }
            if (record->size() != mapping->size()) {
                throw fmsave_core::field_count_mismatch(schema->name(), mapping->size(), record->size());
            }
            // Columns missing from the header decode from empty text.
            std::vector<std::string> fields(schema->size());
            for (size_t i = 0; i < record->size(); ++i) {
                if (auto index = (*mapping)[i]) {
                    fields[*index] = std::move((*record)[i]);
                }
            }
            rows.push_back(fmsave_core::decode(fields, schema));
        } catch (const fmsave_core::decode_error& e) {
            throw fmsave_core::decode_error(e, position);
        }
    }
    base::log_debug(base::log_channel::codec, "Decoded {} rows of schema '{}'", rows.size(), schema->name());
    return rows;
}

std::string encode_rows(const std::vector<fmsave_core::row>& rows, const fmsave_core::schema& schema)
{
    fmsave_core::csv_writer writer(schema.document().separator, schema.document().newline);
    if (schema.document().header_row) {
        fmsave_core::csv_record header;
        header.reserve(schema.size());
        for (const auto& column : schema.columns()) {
            header.push_back(column.name());
        }
        writer.write(header);
    }
    for (const auto& r : rows) {
        writer.write(fmsave_core::encode(r));
    }
    return writer.str();
}

dataset read_dataset(const storage::storage& storage, const std::string& path, const fmsave_core::schema_ptr& schema)
{
    auto span = base::log_span(base::log_channel::codec, fmt::format("read dataset '{}'", path));
    auto rows = decode_rows(storage.get_text(path), schema);
    base::log_info(base::log_channel::codec, "Read {} rows from '{}'", rows.size(), path);
    return dataset(schema, std::move(rows));
}

dataset read_dataset_or_empty(const storage::storage& storage,
                              const std::string& path,
                              const fmsave_core::schema_ptr& schema)
{
    if (!storage.file(path).exists()) {
        base::log_info(base::log_channel::codec, "No dataset at '{}'; starting empty", path);
        return dataset(schema);
    }
    return read_dataset(storage, path, schema);
}

void write_dataset(const storage::storage& storage, const std::string& path, const dataset& data)
{
    auto span = base::log_span(base::log_channel::codec, fmt::format("write dataset '{}'", path));
    storage.set_bytes(path, encode_rows(data.rows(), data.get_schema()));
    base::log_info(base::log_channel::codec, "Wrote {} rows to '{}'", data.size(), path);
}

} // namespace fmsave

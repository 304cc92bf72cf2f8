#pragma once

/**
 * @file format_exporter.hpp
 * @brief Conversion of the canonical dataset into the columns of an export dialect.
 */

#include "dataset.hpp"
#include "exceptions.hpp"
#include "reference_table.hpp"

#include <fmsave_core/csv.hpp>

#include <string>
#include <vector>

namespace fmsave {

struct export_result
{
    fmsave_core::schema_ptr schema;
    /// Exported rows, encoded in the target column order.
    std::vector<fmsave_core::csv_record> records;
    /// Rows excluded from the output.
    std::vector<export_error> errors;

    /// CSV text with the header, separator and newline of the target dialect.
    [[nodiscard]] std::string to_csv() const;
};

/**
 * @brief Maps canonical rows to a target dialect through the provenance declared by each target column.
 *
 * A plain provenance copies the named column, a switch provenance picks the column and format from the
 * value of a discriminator column, a lookup provenance reads a field of a reference table. The copied
 * value is then converted to the target column: date and time formats, km to miles, integer truncation,
 * value map, text transform and default. Columns without provenance are empty unless they have a default.
 */
class format_exporter
{
public:
    explicit format_exporter(fmsave_core::schema_ptr target, const reference_tables* tables = nullptr)
        : target_(std::move(target))
        , tables_(tables)
    {
    }

    /**
     * @brief Exports every row in dataset order. A row whose required column resolves to absent or empty text is
     * excluded and reported in `export_result::errors`.
     *
     * @throws fmsave_core::unknown_column if a provenance names a column missing from the source schema.
     * @throws fmsave::unknown_reference_table if a lookup table is not available.
     */
    [[nodiscard]] export_result export_dataset(const dataset& data) const;

    [[nodiscard]] const fmsave_core::schema& target() const
    {
        return *target_;
    }

private:
    void check_sources(const fmsave_core::schema& source) const;

    [[nodiscard]] fmsave_core::csv_record export_row(const fmsave_core::row& r, size_t index) const;

    [[nodiscard]] std::string export_cell(const fmsave_core::row& r,
                                          size_t index,
                                          const fmsave_core::column_definition& column) const;

private:
    fmsave_core::schema_ptr target_;
    const reference_tables* tables_;
};

} // namespace fmsave

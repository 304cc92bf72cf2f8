#pragma once

/**
 * @file row_codec.hpp
 * @brief Conversion between typed rows and textual CSV fields.
 */

#include "row.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace fmsave_core {

/**
 * @brief Decodes one textual field into a value of the column type.
 *
 * Empty text is absent, except for string merge-key columns which decode to the empty string.
 *
 * @throws fmsave_core::decode_error naming the column and the raw text.
 */
value decode_value(std::string_view raw, const column_definition& column, const schema& schema);

/**
 * @brief Encodes a value as text. Absent values encode as the empty string.
 * @throws fmsave_core::encode_error if the value does not match the column type.
 */
std::string encode_value(const value& v, const column_definition& column, const schema& schema);

/**
 * @brief Decodes a record whose fields are in schema column order.
 *
 * Date and datetime columns tagged for timezone lookup keep their raw text; when it does not parse
 * they decode to absent instead of failing.
 *
 * @throws fmsave_core::field_count_mismatch if the field count differs from the column count.
 * @throws fmsave_core::decode_error for the first field that cannot be decoded.
 */
row decode(const std::vector<std::string>& fields, const schema_ptr& schema);

/// Encodes a row into fields in schema column order.
std::vector<std::string> encode(const row& r);

} // namespace fmsave_core

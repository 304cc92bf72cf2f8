#pragma once

/**
 * @file dataset_io.hpp
 * @brief Reading and writing datasets as CSV through `storage`.
 */

#include "dataset.hpp"

#include <storage/storage.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace fmsave {

/**
 * @brief Decodes CSV text into rows of `schema`, using the dialect separator.
 *
 * When the dialect has a header row, fields are matched to columns by header name: schema columns
 * missing from the header are absent and unknown header columns are ignored. Otherwise fields are
 * positional.
 *
 * @throws fmsave_core::decode_error carrying the row position.
 * @throws fmsave_core::csv_error on malformed CSV.
 */
std::vector<fmsave_core::row> decode_rows(std::string_view text, const fmsave_core::schema_ptr& schema);

/// Encodes rows with the dialect header, separator and newline.
std::string encode_rows(const std::vector<fmsave_core::row>& rows, const fmsave_core::schema& schema);

/**
 * @brief Reads the dataset stored at `path`.
 * @throws storage::storage_key_not_found if the file does not exist.
 */
dataset read_dataset(const storage::storage& storage, const std::string& path, const fmsave_core::schema_ptr& schema);

/// Same as `read_dataset`, but an empty dataset when the file does not exist.
dataset read_dataset_or_empty(const storage::storage& storage,
                              const std::string& path,
                              const fmsave_core::schema_ptr& schema);

/// Persists the dataset. The previous file is replaced only after the new content is completely written.
void write_dataset(const storage::storage& storage, const std::string& path, const dataset& data);

} // namespace fmsave

#pragma once

#include "file_ref.hpp"

#include <cstdint>
#include <string>
#include <vector>

/**
 * @file storage.hpp
 * @brief Storage module interface definitions.
 */

/**
 * @defgroup storage
 * @{
 * @brief storage module.
 *
 * File access abstraction used to read datasets, reference tables and schemas and to persist datasets.
 *
 * @}
 */

namespace storage {

class storage
{
public:
    virtual ~storage() = default;

    /// Reference to the file at `path`, with size -1 if it does not exist.
    [[nodiscard]] virtual file_ref file(const std::string& path) const = 0;

    [[nodiscard]] virtual std::vector<file_ref> list_files(const std::string& base_dir) const = 0;

    /// @throws storage::storage_key_not_found, storage::reader_error
    [[nodiscard]] virtual std::vector<uint8_t> get_bytes(const std::string& path) const = 0;

    /// @throws storage::storage_key_not_found, storage::reader_error
    [[nodiscard]] virtual std::string get_text(const std::string& path) const = 0;

    /**
     * @brief Replaces the content of `path`. The previous content stays intact until the new content
     * is completely written.
     * @throws storage::writer_error
     */
    virtual void set_bytes(const std::string& path, const std::string& data) const = 0;

    virtual void remove(const std::string& path) const = 0;
};

} // namespace storage

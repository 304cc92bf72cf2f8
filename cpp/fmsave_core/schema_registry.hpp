#pragma once

/**
 * @file schema_registry.hpp
 * @brief Definition of the `schema_registry` class.
 */

#include "schema.hpp"

#include <map>
#include <string>
#include <string_view>

namespace fmsave_core {

/**
 * @brief Loads dialect schemas from `<directory>/<dialect>.json` and caches them for the process lifetime.
 */
class schema_registry
{
public:
    explicit schema_registry(std::string directory)
        : directory_(std::move(directory))
    {
    }

    /**
     * @brief Process wide registry. The directory is taken from `FMSAVE_SCHEMA_PATH` when set,
     * otherwise `data/schemas` relative to the working directory.
     */
    static schema_registry& instance();

    [[nodiscard]] const std::string& directory() const
    {
        return directory_;
    }

    /// Changes the lookup directory. Already loaded schemas stay cached.
    void set_directory(std::string directory)
    {
        directory_ = std::move(directory);
    }

    /**
     * @throws fmsave_core::unknown_dialect if no document exists for the dialect.
     * @throws fmsave_core::schema_error if the document is invalid.
     */
    schema_ptr load(std::string_view dialect);

    /// Registers an already built schema under its name, replacing any cached one.
    void add(schema_ptr schema);

    [[nodiscard]] bool is_loaded(std::string_view dialect) const
    {
        return cache_.contains(dialect);
    }

    void clear()
    {
        cache_.clear();
    }

private:
    std::string directory_;
    std::map<std::string, schema_ptr, std::less<>> cache_;
};

} // namespace fmsave_core

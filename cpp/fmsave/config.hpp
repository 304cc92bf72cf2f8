#pragma once

/**
 * @file config.hpp
 * @brief Runtime settings of the fmsave commands.
 */

#include <base/logger.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace fmsave {

/// Name of the configuration file searched in the current directory, then in the home directory.
inline constexpr const char* config_file_name = ".fmsaverc";

struct config
{
    std::string geonames_username;
    std::string default_data_path = "data/fmsave/fmsave.csv";
    std::string schema_path = "data/schemas";
    base::log_level log_level = base::log_level::info;
    /// Daily rotated debug log. Disabled when empty.
    std::string log_file;
    unsigned geonames_timeout_seconds = 3;
    unsigned max_retries = 3;
    std::optional<size_t> max_lookups;
    double distance_tolerance = 0.10;
    unsigned duration_tolerance_minutes = 15;

    /**
     * @brief Overrides the fields present in `json`.
     * @throws fmsave::config_error on a key of the wrong type or an invalid value.
     */
    void apply(const nlohmann::json& json, const std::string& origin);

    /// Overrides the fields set through `FMSAVE_*` environment variables.
    void apply_environment();
};

/// First existing configuration file: `./.fmsaverc`, then `$HOME/.fmsaverc`.
std::optional<std::filesystem::path> find_config_file();

/**
 * @brief Defaults, overridden by the configuration file, overridden by the environment.
 *
 * A configuration file that cannot be read or parsed is reported as a warning and ignored.
 */
config load_config();

/// Same as `load_config` with an explicit file.
config load_config(const std::optional<std::filesystem::path>& file);

} // namespace fmsave

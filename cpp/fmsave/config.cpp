#include "config.hpp"
#include "exceptions.hpp"

#include <base/base.hpp>
#include <base/getenv.hpp>

#include <fstream>
#include <sstream>

namespace fmsave {

namespace {

template <typename T>
void read_key(const nlohmann::json& json, const char* key, T& target, const std::string& origin)
{
    auto it = json.find(key);
    if (it == json.end() || it->is_null()) {
        return;
    }
    try {
        target = it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw config_error(origin, fmt::format("key '{}': {}", key, e.what()));
    }
}

base::log_level parse_level(const std::string& text, const std::string& origin)
{
    try {
        return base::str_to_log_level(text);
    } catch (const base::exception& e) {
        throw config_error(origin, e.what());
    }
}

} // namespace

void config::apply(const nlohmann::json& json, const std::string& origin)
{
    if (!json.is_object()) {
        throw config_error(origin, "expected a JSON object");
    }
    read_key(json, "geonames_username", geonames_username, origin);
    read_key(json, "default_data_path", default_data_path, origin);
    read_key(json, "schema_path", schema_path, origin);
    read_key(json, "log_file", log_file, origin);
    read_key(json, "geonames_timeout_seconds", geonames_timeout_seconds, origin);
    read_key(json, "max_retries", max_retries, origin);
    read_key(json, "distance_tolerance", distance_tolerance, origin);
    read_key(json, "duration_tolerance_minutes", duration_tolerance_minutes, origin);

    std::string level;
    read_key(json, "log_level", level, origin);
    if (!level.empty()) {
        log_level = parse_level(level, origin);
    }
    size_t lookups = 0;
    read_key(json, "max_lookups", lookups, origin);
    if (lookups > 0) {
        max_lookups = lookups;
    }
    if (distance_tolerance < 0.0) {
        throw config_error(origin, "distance_tolerance must not be negative");
    }
}

void config::apply_environment()
{
    geonames_username = base::getenv<std::string>("FMSAVE_GN_USERNAME", geonames_username);
    default_data_path = base::getenv<std::string>("FMSAVE_DATA_PATH", default_data_path);
    schema_path = base::getenv<std::string>("FMSAVE_SCHEMA_PATH", schema_path);
    log_file = base::getenv<std::string>("FMSAVE_LOG_FILE", log_file);
    if (auto level = base::getenv_optional("FMSAVE_LOG_LEVEL")) {
        log_level = parse_level(*level, "FMSAVE_LOG_LEVEL");
    }
}

std::optional<std::filesystem::path> find_config_file()
{
    std::error_code ec;
    std::filesystem::path local = config_file_name;
    if (std::filesystem::is_regular_file(local, ec)) {
        return local;
    }
    if (auto home = base::getenv_optional("HOME")) {
        auto path = std::filesystem::path(*home) / config_file_name;
        if (std::filesystem::is_regular_file(path, ec)) {
            return path;
        }
    }
    return std::nullopt;
}

config load_config()
{
    return load_config(find_config_file());
}

config load_config(const std::optional<std::filesystem::path>& file)
{
    config result;
    if (file) {
        const auto origin = file->string();
        try {
            std::ifstream stream(*file);
            if (!stream) {
                throw config_error(origin, "cannot open the file");
            }
            std::stringstream buffer;
            buffer << stream.rdbuf();
            config parsed = result;
            parsed.apply(nlohmann::json::parse(buffer.str()), origin);
            result = std::move(parsed);
            base::log_debug(base::log_channel::config, "Loaded configuration from {}", origin);
        } catch (const nlohmann::json::parse_error& e) {
            base::log_warning(base::log_channel::config, "Ignoring configuration {}: {}", origin, e.what());
        } catch (const config_error& e) {
            base::log_warning(base::log_channel::config, "Ignoring configuration: {}", e.what());
        }
    }
    try {
        result.apply_environment();
    } catch (const config_error& e) {
        base::log_warning(base::log_channel::config, "Ignoring FMSAVE_LOG_LEVEL: {}", e.what());
    }
    return result;
}

} // namespace fmsave

#include "schema_registry.hpp"
#include "exceptions.hpp"

#include <base/base.hpp>
#include <base/getenv.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fmsave_core {

schema_registry& schema_registry::instance()
{
    static schema_registry registry(base::getenv<std::string>("FMSAVE_SCHEMA_PATH", "data/schemas"));
    return registry;
}

schema_ptr schema_registry::load(std::string_view dialect)
{
    if (auto it = cache_.find(dialect); it != cache_.end()) {
        return it->second;
    }

    const auto path = std::filesystem::path(directory_) / fmt::format("{}.json", dialect);
    std::ifstream file(path);
    if (!file.is_open()) {
        throw unknown_dialect(dialect, path.string());
    }
    std::stringstream content;
    content << file.rdbuf();

    base::log_info(base::log_channel::schema, "Loading schema '{}' from '{}'", dialect, path.string());
    auto result = schema::parse(std::string(dialect), content.str());
    cache_.emplace(std::string(dialect), result);
    return result;
}

void schema_registry::add(schema_ptr schema)
{
    auto name = schema->name();
    cache_.insert_or_assign(std::move(name), std::move(schema));
}

} // namespace fmsave_core

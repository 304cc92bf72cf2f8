#include "commands.hpp"

#include <base/base.hpp>
#include <fmsave/dataset_io.hpp>
#include <fmsave/format_exporter.hpp>
#include <fmsave/merge_engine.hpp>
#include <fmsave/timezone_resolver.hpp>
#include <fmsave/validator.hpp>
#include <fmsave_core/schema_registry.hpp>
#include <geonames/timezone_client.hpp>
#include <storage/local_storage.hpp>

#include <charconv>
#include <iostream>
#include <map>
#include <set>

namespace fmsave_cli {

namespace {

constexpr std::string_view canonical_dialect = "fmsave";

std::string data_path(const command_line& cmd, const fmsave::config& cfg)
{
    return cmd.option("data").value_or(cfg.default_data_path);
}

std::optional<fmsave_core::date_t> window_bound(const command_line& cmd, std::string_view name)
{
    auto text = cmd.option(name);
    if (!text) {
        return std::nullopt;
    }
    auto date = fmsave_core::parse_date(*text, fmsave_core::default_date_format);
    if (!date) {
        throw usage_error(fmt::format("--{} expects a date as YYYY-MM-DD, got '{}'", name, *text));
    }
    return date;
}

std::optional<fmsave::date_window> command_window(const command_line& cmd)
{
    auto after = window_bound(cmd, "after");
    auto before = window_bound(cmd, "before");
    if (!after && !before) {
        return std::nullopt;
    }
    return fmsave::date_window{after, before};
}

void require_arguments(const command_line& cmd, size_t count)
{
    if (cmd.arguments.size() != count) {
        throw usage_error(fmt::format("'{}' expects {} argument(s), got {}", cmd.command, count,
                                      cmd.arguments.size()));
    }
}

void save(const storage::storage& store, const command_line& cmd, const std::string& path, const fmsave::dataset& data)
{
    if (cmd.flag("dry-run")) {
        base::log_info(base::log_channel::cli, "Dry run, {} rows not written to {}", data.size(), path);
        return;
    }
    fmsave::write_dataset(store, path, data);
}

/// Tables named by the lookup provenances of `target`.
std::set<std::string> referenced_tables(const fmsave_core::schema& target)
{
    std::set<std::string> tables;
    for (const auto& column : target.columns()) {
        if (const auto& p = column.column_provenance()) {
            if (const auto* lookup = std::get_if<fmsave_core::lookup_provenance>(&*p)) {
                tables.insert(lookup->table);
            }
        }
    }
    return tables;
}

} // namespace

int run_command(const command_line& cmd, const fmsave::config& cfg)
{
    if (cmd.command == "upcsv") {
        return run_upcsv(cmd, cfg);
    }
    if (cmd.command == "uptz") {
        return run_uptz(cmd, cfg);
    }
    if (cmd.command == "validate") {
        return run_validate(cmd, cfg);
    }
    if (cmd.command == "export") {
        return run_export(cmd, cfg);
    }
    throw usage_error(cmd.command.empty() ? "no command given" : fmt::format("unknown command '{}'", cmd.command));
}

int run_upcsv(const command_line& cmd, const fmsave::config& cfg)
{
    require_arguments(cmd, 1);
    auto window = command_window(cmd);

    auto schema = fmsave_core::schema_registry::instance().load(canonical_dialect);
    storage::local_storage store;
    const auto path = data_path(cmd, cfg);
    auto existing = fmsave::read_dataset_or_empty(store, path, schema);
    auto incoming = fmsave::decode_rows(store.get_text(cmd.arguments[0]), schema);
    auto merged = fmsave::merge(existing, incoming, window);
    save(store, cmd, path, merged);
    base::log_info(base::log_channel::cli, "{} rows merged into {}, dataset has {} rows", incoming.size(), path,
                   merged.size());
    return 0;
}

int run_uptz(const command_line& cmd, const fmsave::config& cfg)
{
    require_arguments(cmd, 0);
    fmsave::resolver_options options;
    options.max_retries = cfg.max_retries;
    options.max_lookups = cfg.max_lookups;
    if (auto limit = cmd.option("max-lookups")) {
        size_t value = 0;
        auto [ptr, ec] = std::from_chars(limit->data(), limit->data() + limit->size(), value);
        if (ec != std::errc() || ptr != limit->data() + limit->size()) {
            throw usage_error(fmt::format("--max-lookups expects a number, got '{}'", *limit));
        }
        options.max_lookups = value;
    }

    auto schema = fmsave_core::schema_registry::instance().load(canonical_dialect);
    storage::local_storage store;
    const auto path = data_path(cmd, cfg);
    auto data = fmsave::read_dataset(store, path, schema);

    geonames::timezone_client client(
        geonames::client_options{cfg.geonames_username, std::chrono::seconds(cfg.geonames_timeout_seconds)});
    fmsave::timezone_resolver resolver(client, options);
    auto result = resolver.resolve(data);
    for (const auto& e : result.errors) {
        base::log_warning(base::log_channel::cli, "{}", e.what());
    }
    save(store, cmd, path, result.data);
    base::log_info(base::log_channel::cli, "{}", result.summary());
    return 0;
}

int run_validate(const command_line& cmd, const fmsave::config& cfg)
{
    require_arguments(cmd, 0);
    auto schema = fmsave_core::schema_registry::instance().load(canonical_dialect);
    storage::local_storage store;
    auto data = fmsave::read_dataset(store, data_path(cmd, cfg), schema);

    fmsave::validator check(
        fmsave::validator_options{cfg.distance_tolerance, std::chrono::minutes(cfg.duration_tolerance_minutes)});
    auto findings = check.validate(data);
    for (const auto& f : findings) {
        std::cout << f.to_string() << '\n';
    }
    auto summary = fmsave::validator::summarize(findings, data.size());
    std::cout << summary.to_string() << std::endl;
    return summary.flagged == 0 ? 0 : 1;
}

int run_export(const command_line& cmd, const fmsave::config& cfg)
{
    require_arguments(cmd, 2);
    auto& registry = fmsave_core::schema_registry::instance();
    auto schema = registry.load(canonical_dialect);
    auto target = registry.load(cmd.arguments[0]);
    storage::local_storage store;
    auto data = fmsave::read_dataset(store, data_path(cmd, cfg), schema);
    if (auto window = command_window(cmd)) {
        data = fmsave::keep_window(data, *window);
    }

    std::map<std::string, std::string, std::less<>> reference_paths;
    for (const auto& entry : cmd.option_values("reference")) {
        auto eq = entry.find('=');
        if (eq == std::string::npos || eq == 0) {
            throw usage_error(fmt::format("--reference expects TABLE=PATH, got '{}'", entry));
        }
        reference_paths[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    fmsave::reference_tables tables;
    for (const auto& name : referenced_tables(*target)) {
        auto it = reference_paths.find(name);
        if (it == reference_paths.end()) {
            throw usage_error(fmt::format("dialect '{}' needs --reference {}=PATH", target->name(), name));
        }
        tables.add(fmsave::reference_table::load(store, it->second, registry.load(name)));
    }

    fmsave::format_exporter exporter(target, &tables);
    auto result = exporter.export_dataset(data);
    const auto& output = cmd.arguments[1];
    if (!cmd.flag("dry-run")) {
        store.set_bytes(output, result.to_csv());
    }
    base::log_info(base::log_channel::cli, "{} rows written to {}, {} rows excluded", result.records.size(), output,
                   result.errors.size());
    return 0;
}

} // namespace fmsave_cli

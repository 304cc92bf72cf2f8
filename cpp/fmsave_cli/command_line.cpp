#include "command_line.hpp"

#include <array>

namespace fmsave_cli {

namespace {

constexpr std::array<std::string_view, 9> value_options = {
    "data", "schema-dir", "log-level", "log-file", "after", "before", "max-lookups", "reference", "config"};

constexpr std::array<std::string_view, 2> flag_options = {"help", "dry-run"};

bool is_one_of(std::string_view name, const auto& names)
{
    for (const auto& n : names) {
        if (n == name) {
            return true;
        }
    }
    return false;
}

} // namespace

std::optional<std::string> command_line::option(std::string_view name) const
{
    auto it = options.find(name);
    if (it == options.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second.back();
}

std::vector<std::string> command_line::option_values(std::string_view name) const
{
    auto it = options.find(name);
    return it == options.end() ? std::vector<std::string>() : it->second;
}

command_line parse_command_line(int argc, const char* const* argv)
{
    command_line result;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "-h") {
            result.flags.emplace("help");
            continue;
        }
        if (!arg.starts_with("--")) {
            if (result.command.empty()) {
                result.command = arg;
            } else {
                result.arguments.emplace_back(arg);
            }
            continue;
        }

        auto name = arg.substr(2);
        std::optional<std::string> inline_value;
        if (auto eq = name.find('='); eq != std::string_view::npos) {
            inline_value = std::string(name.substr(eq + 1));
            name = name.substr(0, eq);
        }
        if (is_one_of(name, flag_options) && !inline_value) {
            result.flags.emplace(name);
            continue;
        }
        if (!is_one_of(name, value_options)) {
            throw usage_error(fmt::format("unknown option '--{}'", name));
        }
        if (!inline_value) {
            if (i + 1 >= argc) {
                throw usage_error(fmt::format("option '--{}' needs a value", name));
            }
            inline_value = argv[++i];
        }
        result.options[std::string(name)].push_back(std::move(*inline_value));
    }
    return result;
}

std::string usage()
{
    return "Usage: fmsave <command> [arguments] [options]\n"
           "\n"
           "Commands:\n"
           "  upcsv <incoming.csv>        merge rows into the dataset\n"
           "  uptz                        fill missing timezones through GeoNames\n"
           "  validate                    check distances and durations\n"
           "  export <dialect> <output>   write the dataset in an export dialect\n"
           "\n"
           "Options:\n"
           "  --data PATH                 dataset file\n"
           "  --schema-dir DIR            directory of the dialect schemas\n"
           "  --config FILE               configuration file instead of .fmsaverc\n"
           "  --log-level LEVEL           debug, info, warning or error\n"
           "  --log-file FILE             daily rotated debug log\n"
           "  --after DATE --before DATE  window replaced by upcsv, kept by export\n"
           "                              (YYYY-MM-DD, inclusive)\n"
           "  --max-lookups N             limit of GeoNames calls of uptz\n"
           "  --reference TABLE=PATH      reference table used by export\n"
           "  --dry-run                   do not write the dataset\n";
}

} // namespace fmsave_cli

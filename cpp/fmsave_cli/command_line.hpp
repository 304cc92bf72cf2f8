#pragma once

/**
 * @file command_line.hpp
 * @brief Parsing of the `fmsave` command line.
 */

#include <base/exception.hpp>

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace fmsave_cli {

class usage_error : public base::exception
{
public:
    explicit usage_error(const std::string& reason)
        : base::exception(fmt::format("Invalid command line: {}", reason), {{"reason", reason}})
    {
    }
};

/**
 * @brief `fmsave <command> [arguments] [--option value] [--flag]`.
 *
 * Options may be repeated. `--option=value` is accepted as well.
 */
struct command_line
{
    std::string command;
    std::vector<std::string> arguments;
    std::map<std::string, std::vector<std::string>, std::less<>> options;
    std::set<std::string, std::less<>> flags;

    /// Last value given for the option.
    [[nodiscard]] std::optional<std::string> option(std::string_view name) const;

    [[nodiscard]] std::vector<std::string> option_values(std::string_view name) const;

    [[nodiscard]] bool flag(std::string_view name) const
    {
        return flags.contains(name);
    }
};

/// @throws fmsave_cli::usage_error on an unknown option or a missing option value.
command_line parse_command_line(int argc, const char* const* argv);

std::string usage();

} // namespace fmsave_cli

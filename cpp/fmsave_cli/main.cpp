#include "command_line.hpp"
#include "commands.hpp"

#include <base/base.hpp>
#include <base/spdlog_adapter.hpp>
#include <fmsave/config.hpp>
#include <fmsave_core/schema_registry.hpp>

#include <iostream>

int main(int argc, char** argv)
{
    fmsave_cli::command_line cmd;
    try {
        cmd = fmsave_cli::parse_command_line(argc, argv);
    } catch (const fmsave_cli::usage_error& e) {
        std::cerr << e.what() << "\n\n" << fmsave_cli::usage();
        return 2;
    }
    if (cmd.flag("help") || cmd.command.empty()) {
        std::cout << fmsave_cli::usage();
        return cmd.flag("help") ? 0 : 2;
    }

    auto cfg = cmd.option("config") ? fmsave::load_config(std::filesystem::path(*cmd.option("config")))
                                    : fmsave::load_config();
    std::optional<std::string> log_file;
    if (auto file = cmd.option("log-file")) {
        log_file = *file;
    } else if (!cfg.log_file.empty()) {
        log_file = cfg.log_file;
    }

    int code = 1;
    try {
        if (auto level = cmd.option("log-level")) {
            cfg.log_level = base::str_to_log_level(*level);
        }
        base::initialize(std::make_shared<base::spdlog_adapter>(cfg.log_level, log_file));
        fmsave_core::schema_registry::instance().set_directory(cmd.option("schema-dir").value_or(cfg.schema_path));
        code = fmsave_cli::run_command(cmd, cfg);
    } catch (const fmsave_cli::usage_error& e) {
        std::cerr << e.what() << "\n\n" << fmsave_cli::usage();
        code = 2;
    } catch (const base::exception& e) {
        if (base::is_initialized()) {
            base::log_error(base::log_channel::cli, "{}", e.what());
        } else {
            std::cerr << e.what() << std::endl;
        }
        code = 1;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        code = 1;
    }
    base::deinitialize();
    return code;
}

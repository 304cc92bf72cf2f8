#pragma once

#include "command_line.hpp"

#include <fmsave/config.hpp>

namespace fmsave_cli {

/**
 * @brief Runs the command named by the command line.
 * @return Process exit code.
 */
int run_command(const command_line& cmd, const fmsave::config& cfg);

int run_upcsv(const command_line& cmd, const fmsave::config& cfg);

int run_uptz(const command_line& cmd, const fmsave::config& cfg);

int run_validate(const command_line& cmd, const fmsave::config& cfg);

int run_export(const command_line& cmd, const fmsave::config& cfg);

} // namespace fmsave_cli

#pragma once

#include "log_channel.hpp"
#include "logger_adapter.hpp"
#include "logging_span_holder.hpp"

/**
 * @file base.hpp
 * @brief Definition of base module level functions.
 */

/**
 * @defgroup base
 * @{
 * @brief Defines lowest level functionality and utilities for fmsave.
 *
 * @}
 */

namespace base {

/**
 * @brief Registers `adapter` with the process logger, replacing an adapter of the same name.
 */
void initialize(std::shared_ptr<logger_adapter> adapter);

/// Removes every logger adapter.
void deinitialize();

bool is_initialized();

logger& get_logger();

/**
* Logs a start/end of a process. Message is initially logged when the method is called.
* A finish version of the message along with the total time is logged when the returned holder is destructed.
*/
std::unique_ptr<logging_span_holder> log_span(const log_channel& channel, const std::string& message);

/**
 * @brief Formats `message` with `args` (fmt syntax) and dispatches it on `channel`.
 *
 * Nothing is formatted when no adapter accepts the level.
 */
template <typename... Args>
inline void log_debug(const log_channel& channel, const std::string& message, Args&&... args)
{
    get_logger().log(log_level::debug, channel.channel(), message, fmt::make_format_args(args...));
}

template <typename... Args>
inline void log_info(const log_channel& channel, const std::string& message, Args&&... args)
{
    get_logger().log(log_level::info, channel.channel(), message, fmt::make_format_args(args...));
}

template <typename... Args>
inline void log_warning(const log_channel& channel, const std::string& message, Args&&... args)
{
    get_logger().log(log_level::warning, channel.channel(), message, fmt::make_format_args(args...));
}

template <typename... Args>
inline void log_error(const log_channel& channel, const std::string& message, Args&&... args)
{
    get_logger().log(log_level::error, channel.channel(), message, fmt::make_format_args(args...));
}
} // namespace base

#pragma once

#include "logger.hpp"

#include <string>

namespace base {

/**
 * @brief Sink for the messages dispatched by `base::logger`.
 *
 * `min_level()` lets the logger skip formatting of messages no adapter would emit.
 */
class logger_adapter
{
public:
    virtual ~logger_adapter() = default;

    [[nodiscard]] virtual const std::string name() const = 0;

    [[nodiscard]] virtual log_level min_level() const
    {
        return log_level::debug;
    }

    virtual void log(log_level level, const std::string& channel, const std::string& message) = 0;
};
} // namespace base

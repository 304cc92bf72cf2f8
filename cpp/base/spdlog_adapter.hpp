#pragma once

/**
 * @file spdlog_adapter.hpp
 * @brief `logger_adapter` that forwards messages to spdlog.
 */

#include "logger_adapter.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <string>

namespace base {

class spdlog_adapter : public logger_adapter
{
public:
    /**
     * @param console_level Messages below this level are not written to the console.
     * @param log_file If set, all messages (debug and above) are also written to a file rotated at midnight.
     */
    explicit spdlog_adapter(log_level console_level = log_level::info,
                            const std::optional<std::string>& log_file = std::nullopt);

    [[nodiscard]] const std::string name() const override
    {
        return "spdlog";
    }

    [[nodiscard]] log_level min_level() const override
    {
        return min_level_;
    }

    void log(log_level level, const std::string& channel, const std::string& message) override;

    [[nodiscard]] std::shared_ptr<spdlog::logger> spdlog_logger() const
    {
        return logger_;
    }

private:
    std::shared_ptr<spdlog::logger> logger_;
    log_level min_level_;
};

spdlog::level::level_enum to_spdlog_level(log_level level);

} // namespace base

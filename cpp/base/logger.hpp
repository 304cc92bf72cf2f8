#pragma once

/**
 * @file logger.hpp
 * @brief Definition and implementation of the `logger` class.
 */

#include "assert.hpp"
#include "format.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace base {
class logger_adapter;

enum class log_level : unsigned char
{
    debug,
    info,
    warning,
    error
};

inline std::string log_level_to_str(const log_level t)
{
    switch (t) {
    case log_level::debug:
        return "debug";
    case log_level::info:
        return "info";
    case log_level::warning:
        return "warning";
    case log_level::error:
        return "error";
    default:
        ASSERT_MESSAGE(false, "Unknown log level");
        return "unknown";
    }
}

/**
 * @brief Parses a log level name, case-insensitive. Accepts `warn` as an alias of `warning`.
 * @throws base::invalid_log_level if the name is not known.
 */
log_level str_to_log_level(std::string_view level);

class logger
{
public:
    logger() = default;

    logger(const logger&) = delete;
    logger& operator=(const logger&) = delete;
    logger& operator=(logger&&) = delete;
    ~logger() = default;

    void log(log_level level, const std::string& channel, const std::string& message) const;

    void log(log_level level, const std::string& channel, const std::string& message,
             const std::map<std::string, std::string, std::less<>>& params) const;

    void log(log_level level, const std::string& channel, const std::string& message, fmt::format_args args) const;

    void add(std::shared_ptr<logger_adapter> adapter)
    {
        adapters_.push_back(std::move(adapter));
    }

    void remove(const std::string& id);

    void clear()
    {
        adapters_.clear();
    }

    [[nodiscard]] size_t size() const noexcept
    {
        return adapters_.size();
    }

private:
    std::vector<std::shared_ptr<logger_adapter>> adapters_;
};

} // namespace base

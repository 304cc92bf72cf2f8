#include "logger.hpp"

#include "exception.hpp"
#include "logger_adapter.hpp"

#include <algorithm>
#include <cctype>

namespace base {

log_level str_to_log_level(std::string_view level)
{
    std::string final_string(level);
    std::ranges::transform(final_string, final_string.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    if (final_string == "DEBUG") {
        return log_level::debug;
    }
    if (final_string == "INFO") {
        return log_level::info;
    }
    if (final_string == "WARN" || final_string == "WARNING") {
        return log_level::warning;
    }
    if (final_string == "ERROR") {
        return log_level::error;
    }

    throw invalid_log_level(std::string(level));
}

void logger::log(log_level level, const std::string& channel, const std::string& message) const
{
    for (const auto& adapter : adapters_) {
        if (level >= adapter->min_level()) {
            adapter->log(level, channel, message);
        }
    }
}

void logger::log(log_level level, const std::string& channel, const std::string& message,
                 const std::map<std::string, std::string, std::less<>>& params) const
{
    if (params.empty()) {
        log(level, channel, message);
        return;
    }
    std::string full_message = message;
    for (const auto& [key, value] : params) {
        full_message += fmt::format(" {}={}", key, value);
    }
    log(level, channel, full_message);
}

void logger::log(log_level level, const std::string& channel, const std::string& message, fmt::format_args args) const
{
    auto wanted = std::ranges::any_of(adapters_, [level](const auto& adapter) {
        return level >= adapter->min_level();
    });
    if (!wanted) {
        return;
    }
    log(level, channel, fmt::vformat(message, args));
}

void logger::remove(const std::string& id)
{
    std::erase_if(adapters_, [&id](const auto& adapter) {
        return adapter->name() == id;
    });
}

} // namespace base

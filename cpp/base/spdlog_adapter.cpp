#include "spdlog_adapter.hpp"

#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace base {

spdlog::level::level_enum to_spdlog_level(log_level level)
{
    switch (level) {
    case log_level::debug:
        return spdlog::level::debug;
    case log_level::info:
        return spdlog::level::info;
    case log_level::warning:
        return spdlog::level::warn;
    case log_level::error:
        return spdlog::level::err;
    }
    return spdlog::level::info;
}

spdlog_adapter::spdlog_adapter(log_level console_level, const std::optional<std::string>& log_file)
    : min_level_(console_level)
{
    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_level(to_spdlog_level(console_level));
    console->set_pattern("[%^%l%$] %v");
    sinks.push_back(console);

    if (log_file.has_value()) {
        auto file = std::make_shared<spdlog::sinks::daily_file_sink_mt>(*log_file, 0, 0, false, 5);
        file->set_level(spdlog::level::debug);
        file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] %l %v");
        sinks.push_back(file);
        min_level_ = log_level::debug;
    }

    logger_ = std::make_shared<spdlog::logger>("fmsave", sinks.begin(), sinks.end());
    logger_->set_level(spdlog::level::debug);
}

void spdlog_adapter::log(log_level level, const std::string& channel, const std::string& message)
{
    logger_->log(to_spdlog_level(level), "[{}] {}", channel, message);
}

} // namespace base

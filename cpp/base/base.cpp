#include "base.hpp"

#include <cstdlib>
#include <iostream>

namespace base {

namespace {

bool initialized_ = false;

} // namespace

void initialize(std::shared_ptr<logger_adapter> adapter)
{
    if (adapter != nullptr) {
        get_logger().remove(adapter->name());
        get_logger().add(std::move(adapter));
    }
    initialized_ = true;
}

void deinitialize()
{
    get_logger().clear();
    initialized_ = false;
}

bool is_initialized()
{
    return initialized_;
}

logger& get_logger()
{
    static logger instance;
    return instance;
}

std::unique_ptr<logging_span_holder> log_span(const log_channel& channel, const std::string& message)
{
    return std::make_unique<logging_span_holder>(channel, message);
}

#ifdef FMSAVE_ASSERTIONS
void abort(const std::string& message)
{
    get_logger().log(log_level::error, log_channel::generic.channel(), message);
    std::cerr << message << std::endl;
    std::abort();
}
#endif

} // namespace base

#include "logging_span_holder.hpp"

#include "base.hpp"

namespace base {

logging_span_holder::logging_span_holder(const log_channel& log_channel, std::string log_message)
    : log_channel_(log_channel)
    , log_message_(std::move(log_message))
    , start_time_(std::chrono::steady_clock::now())
{
    log_debug(log_channel_, "Started: {}", log_message_);
}

std::chrono::milliseconds logging_span_holder::elapsed() const
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_time_);
}

void logging_span_holder::end()
{
    if (ended_) {
        return;
    }
    ended_ = true;
    log_debug(log_channel_, "Finished: {} ({} ms)", log_message_, elapsed().count());
}

} // namespace base

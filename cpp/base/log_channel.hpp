#pragma once

#include <string>

namespace base {

class log_channel
{
public:
    [[nodiscard]] std::string channel() const
    {
        return channel_;
    }

    static const log_channel cli;
    static const log_channel codec;
    static const log_channel config;
    static const log_channel export_;
    static const log_channel generic;
    static const log_channel geonames;
    static const log_channel merge;
    static const log_channel schema;
    static const log_channel storage_local;
    static const log_channel timezone;
    static const log_channel validate;

private:
    explicit log_channel(std::string channel)
        : channel_(std::move(channel))
    {
    }

    std::string channel_;
};
} // namespace base

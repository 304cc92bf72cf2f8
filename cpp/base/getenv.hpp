#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <optional>
#include <string>
#include <type_traits>

namespace base {

/**
 * @brief Returns the value of the environment variable, or nullopt when it is unset or empty.
 */
inline std::optional<std::string> getenv_optional(const std::string& name)
{
    const char* value = std::getenv(name.c_str());
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

template <typename T>
requires std::is_same_v<T, std::string> || std::is_same_v<T, bool> || std::is_arithmetic_v<T>
inline T getenv(const std::string& name, T default_value = T{})
{
    auto value = getenv_optional(name);
    if (!value) {
        return default_value;
    }

    if constexpr (std::is_same_v<T, std::string>) {
        return *value;
    } else if constexpr (std::is_same_v<T, bool>) {
        std::string str = *value;
        std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) {
            return std::tolower(c);
        });
        return str == "1" || str == "true" || str == "yes";
    } else if constexpr (std::is_floating_point_v<T>) {
        char* end = nullptr;
        auto parsed = std::strtod(value->c_str(), &end);
        if (end == value->c_str() || *end != '\0') {
            return default_value;
        }
        return static_cast<T>(parsed);
    } else {
        char* end = nullptr;
        if constexpr (std::is_signed_v<T>) {
            auto parsed = std::strtoll(value->c_str(), &end, 10);
            return (end == value->c_str() || *end != '\0') ? default_value : static_cast<T>(parsed);
        } else {
            auto parsed = std::strtoull(value->c_str(), &end, 10);
            return (end == value->c_str() || *end != '\0') ? default_value : static_cast<T>(parsed);
        }
    }
}

}

#pragma once

#include <sstream>
#include <string>
#include <utility>

namespace base {

/**
 * @brief Streams every argument into one string, separated by `separator`.
 */
template <typename Arg, typename... Args>
inline std::string concat(const std::string& separator, Arg&& arg, Args&&... args)
{
    std::ostringstream ss;
    ss << std::forward<Arg>(arg);
    ((ss << separator << std::forward<Args>(args)), ...);
    return ss.str();
}

} // namespace base

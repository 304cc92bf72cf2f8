#pragma once

/**
 * @file exception.hpp
 * @brief Definition of the `exception` class.
 */

#include "format.hpp"

#include <exception>
#include <functional>
#include <map>
#include <string>
#include <utility>

namespace base {

/**
 * @brief Base class for all fmsave exceptions.
 *
 * Carries a human readable message and a set of string parameters which give the
 * context of the failure (column, row, raw text, ...).
 */
class exception : public std::exception
{
public:
    using params_t = std::map<std::string, std::string, std::less<>>;

public:
    explicit exception(std::string&& what)
        : what_(std::move(what))
    {
    }

    exception(std::string&& what, params_t&& params)
        : what_(std::move(what))
        , params_(std::move(params))
    {
    }

    const char* what() const noexcept override
    {
        return what_.c_str();
    }

    const std::string& message() const noexcept
    {
        return what_;
    }

    const auto& params() const noexcept
    {
        return params_;
    }

    [[nodiscard]] std::string param(std::string_view key) const
    {
        auto it = params_.find(key);
        return it == params_.end() ? std::string() : it->second;
    }

private:
    std::string what_;
    params_t params_;
};

class file_not_found : public exception
{
public:
    explicit file_not_found(const std::string& file)
        : exception(fmt::format("Can't open file '{}'.", file), {{"file", file}})
    {
    }
};

class invalid_log_level : public exception
{
public:
    explicit invalid_log_level(const std::string& level)
        : exception(fmt::format("Unknown log level '{}'.", level), {{"level", level}})
    {
    }
};

} // namespace base

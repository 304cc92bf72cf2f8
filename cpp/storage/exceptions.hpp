#pragma once

/**
 * @file exceptions.hpp
 * @brief Definitions of the exceptions for `storage` module.
 */

#include <base/concat.hpp>
#include <base/exception.hpp>

namespace storage {

template <typename T, typename U>
concept not_self_constructable = !std::is_same_v<std::decay_t<T>, U>;

class exception : public base::exception
{
public:
    exception(std::string&& what, params_t&& params)
        : base::exception(std::move(what), std::move(params))
    {
    }

    explicit exception(std::string&& what)
        : base::exception(std::move(what))
    {
    }
};

class reader_error : public exception
{
public:
    reader_error(std::string resource, int error_code, std::string message)
        : exception(base::concat(" ", "Storage reader error:", "resource:", resource, "message:", message),
                    {{"resource", resource}, {"errorCode", std::to_string(error_code)}, {"message", message}})
    {
    }
};

class writer_error : public exception
{
public:
    writer_error(std::string resource, int error_code, std::string message)
        : exception(
              base::concat(" ", "Storage writer error:", "resource:", resource, "message:", message),
              {{"resource", resource}, {"errorCode", std::to_string(error_code)}, {"message", std::move(message)}})
    {
    }
};

class storage_key_not_found : public exception
{
public:
    template <typename... Args>
    requires(... && not_self_constructable<Args, storage_key_not_found>)
    explicit storage_key_not_found(Args&&... args)
        : exception(base::concat(" ", std::forward<Args>(args)...))
    {
    }
};

} // namespace storage

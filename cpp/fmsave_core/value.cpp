#include "value.hpp"

#include <base/format.hpp>

namespace fmsave_core {

std::optional<double> value::as_double() const noexcept
{
    if (const auto* i = std::get_if<int64_t>(&data_)) {
        return static_cast<double>(*i);
    }
    if (const auto* d = std::get_if<double>(&data_)) {
        return *d;
    }
    return std::nullopt;
}

bool value::matches(column_type t) const noexcept
{
    switch (t) {
    case column_type::string:
        return is_absent() || holds<std::string>();
    case column_type::date:
        return is_absent() || holds<date_t>();
    case column_type::datetime:
        return is_absent() || holds<datetime_t>();
    case column_type::timedelta:
        return is_absent() || holds<timedelta_t>();
    case column_type::integer:
        return is_absent() || holds<int64_t>();
    case column_type::floating:
        return is_absent() || holds<double>();
    case column_type::boolean:
        return is_absent() || holds<bool>();
    }
    return false;
}

std::string value::to_string() const
{
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return "<absent>";
            } else if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else if constexpr (std::is_same_v<T, date_t>) {
                return format_date(v, default_date_format);
            } else if constexpr (std::is_same_v<T, datetime_t>) {
                return format_datetime(v, default_datetime_format);
            } else if constexpr (std::is_same_v<T, timedelta_t>) {
                return timedelta_to_str(v);
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else {
                return fmt::format("{}", v);
            }
        },
        data_);
}

std::string key_to_string(const key_tuple& key)
{
    std::vector<std::string> parts;
    parts.reserve(key.size());
    for (const auto& v : key) {
        parts.push_back(v.to_string());
    }
    return fmt::format("({})", fmt::join(parts, ", "));
}

} // namespace fmsave_core

#include "column_type.hpp"

namespace fmsave_core {

std::string_view column_type_to_str(column_type t)
{
    switch (t) {
    case column_type::string:
        return "string";
    case column_type::date:
        return "date";
    case column_type::datetime:
        return "datetime";
    case column_type::timedelta:
        return "timedelta";
    case column_type::integer:
        return "integer";
    case column_type::floating:
        return "float";
    case column_type::boolean:
        return "boolean";
    }
    return "unknown";
}

std::optional<column_type> column_type_from_str(std::string_view s)
{
    if (s == "string" || s == "str") {
        return column_type::string;
    }
    if (s == "date") {
        return column_type::date;
    }
    if (s == "datetime" || s == "dt") {
        return column_type::datetime;
    }
    if (s == "timedelta" || s == "td") {
        return column_type::timedelta;
    }
    if (s == "integer" || s == "int") {
        return column_type::integer;
    }
    if (s == "float") {
        return column_type::floating;
    }
    if (s == "boolean" || s == "bool") {
        return column_type::boolean;
    }
    return std::nullopt;
}

std::string_view side_to_str(side s)
{
    switch (s) {
    case side::departure:
        return "departure";
    case side::arrival:
        return "arrival";
    default:
        return "none";
    }
}

std::optional<side> side_from_str(std::string_view s)
{
    if (s == "departure" || s == "dep") {
        return side::departure;
    }
    if (s == "arrival" || s == "arr") {
        return side::arrival;
    }
    if (s == "none" || s.empty()) {
        return side::none;
    }
    return std::nullopt;
}

std::string_view side_suffix(side s)
{
    switch (s) {
    case side::departure:
        return "_dep";
    case side::arrival:
        return "_arr";
    default:
        return "";
    }
}

} // namespace fmsave_core

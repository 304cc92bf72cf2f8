#include "time_format.hpp"

#include <base/format.hpp>

#include <cctype>
#include <cstdlib>

namespace fmsave_core {

namespace {

struct calendar_fields
{
    int year = 1970;
    int month = 1;
    int day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;
};

bool read_number(std::string_view text, size_t& pos, size_t max_digits, int& out)
{
    const auto start = pos;
    int v = 0;
    while (pos < text.size() && pos - start < max_digits && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        v = v * 10 + (text[pos] - '0');
        ++pos;
    }
    if (pos == start) {
        return false;
    }
    out = v;
    return true;
}

bool read_bounded(std::string_view text, size_t& pos, size_t max_digits, int lo, int hi, int& out)
{
    return read_number(text, pos, max_digits, out) && out >= lo && out <= hi;
}

std::optional<calendar_fields> parse_fields(std::string_view text, std::string_view format)
{
    calendar_fields result;
    size_t pos = 0;
    for (size_t i = 0; i < format.size(); ++i) {
        const char c = format[i];
        if (c != '%' || i + 1 == format.size()) {
            if (pos >= text.size() || text[pos] != c) {
                return std::nullopt;
            }
            ++pos;
            continue;
        }
        bool ok = false;
        switch (format[++i]) {
        case 'Y':
            ok = read_bounded(text, pos, 4, 1, 9999, result.year);
            break;
        case 'm':
            ok = read_bounded(text, pos, 2, 1, 12, result.month);
            break;
        case 'd':
            ok = read_bounded(text, pos, 2, 1, 31, result.day);
            break;
        case 'H':
            ok = read_bounded(text, pos, 2, 0, 23, result.hour);
            break;
        case 'M':
            ok = read_bounded(text, pos, 2, 0, 59, result.minute);
            break;
        case 'S':
            ok = read_bounded(text, pos, 2, 0, 59, result.second);
            break;
        case '%':
            ok = pos < text.size() && text[pos] == '%';
            pos += ok ? 1 : 0;
            break;
        default:
            ok = false;
        }
        if (!ok) {
            return std::nullopt;
        }
    }
    if (pos != text.size()) {
        return std::nullopt;
    }
    return result;
}

std::optional<date_t> to_date(const calendar_fields& f)
{
    const std::chrono::year_month_day ymd{std::chrono::year{f.year},
                                          std::chrono::month{static_cast<unsigned>(f.month)},
                                          std::chrono::day{static_cast<unsigned>(f.day)}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    return std::chrono::sys_days{ymd};
}

std::string format_fields(const calendar_fields& f, std::string_view format)
{
    std::string out;
    out.reserve(format.size() + 8);
    for (size_t i = 0; i < format.size(); ++i) {
        const char c = format[i];
        if (c != '%' || i + 1 == format.size()) {
            out.push_back(c);
            continue;
        }
        switch (const char spec = format[++i]) {
        case 'Y':
            out += fmt::format("{:04}", f.year);
            break;
        case 'm':
            out += fmt::format("{:02}", f.month);
            break;
        case 'd':
            out += fmt::format("{:02}", f.day);
            break;
        case 'H':
            out += fmt::format("{:02}", f.hour);
            break;
        case 'M':
            out += fmt::format("{:02}", f.minute);
            break;
        case 'S':
            out += fmt::format("{:02}", f.second);
            break;
        case '%':
            out.push_back('%');
            break;
        default:
            out.push_back('%');
            out.push_back(spec);
        }
    }
    return out;
}

calendar_fields from_date(date_t value)
{
    const std::chrono::year_month_day ymd{value};
    calendar_fields f;
    f.year = static_cast<int>(ymd.year());
    f.month = static_cast<int>(static_cast<unsigned>(ymd.month()));
    f.day = static_cast<int>(static_cast<unsigned>(ymd.day()));
    return f;
}

} // namespace

std::optional<date_t> parse_date(std::string_view text, std::string_view format)
{
    auto fields = parse_fields(text, format);
    if (!fields) {
        return std::nullopt;
    }
    return to_date(*fields);
}

std::optional<datetime_t> parse_datetime(std::string_view text, std::string_view format)
{
    auto fields = parse_fields(text, format);
    if (!fields) {
        return std::nullopt;
    }
    auto day = to_date(*fields);
    if (!day) {
        return std::nullopt;
    }
    return datetime_t{*day} + std::chrono::hours{fields->hour} + std::chrono::minutes{fields->minute} +
           std::chrono::seconds{fields->second};
}

std::string format_date(date_t value, std::string_view format)
{
    return format_fields(from_date(value), format);
}

std::string format_datetime(datetime_t value, std::string_view format)
{
    const auto day = date_part(value);
    const std::chrono::hh_mm_ss hms{value - day};
    auto f = from_date(day);
    f.hour = static_cast<int>(hms.hours().count());
    f.minute = static_cast<int>(hms.minutes().count());
    f.second = static_cast<int>(hms.seconds().count());
    return format_fields(f, format);
}

std::optional<timedelta_t> parse_timedelta(std::string_view text)
{
    bool negative = false;
    size_t pos = 0;
    if (!text.empty() && (text[0] == '-' || text[0] == '+')) {
        negative = text[0] == '-';
        ++pos;
    }
    int hours = 0;
    int minutes = 0;
    if (!read_number(text, pos, 6, hours)) {
        return std::nullopt;
    }
    if (pos >= text.size() || text[pos] != ':') {
        return std::nullopt;
    }
    ++pos;
    const auto minute_start = pos;
    if (!read_bounded(text, pos, 2, 0, 59, minutes) || pos - minute_start != 2) {
        return std::nullopt;
    }
    if (pos < text.size()) {
        int seconds = 0;
        if (text[pos] != ':') {
            return std::nullopt;
        }
        ++pos;
        const auto second_start = pos;
        if (!read_number(text, pos, 2, seconds) || pos - second_start != 2 || seconds != 0 || pos != text.size()) {
            return std::nullopt;
        }
    }
    const timedelta_t value{hours * 60 + minutes};
    return negative ? -value : value;
}

std::string timedelta_to_str(timedelta_t value)
{
    const auto total = value.count();
    const auto magnitude = std::abs(total);
    return fmt::format("{}{}:{:02}", total < 0 ? "-" : "", magnitude / 60, magnitude % 60);
}

std::string format_timedelta(timedelta_t value, std::string_view format)
{
    const auto total = value.count();
    const auto magnitude = std::abs(total);
    std::string out = total < 0 ? "-" : "";
    for (size_t i = 0; i < format.size(); ++i) {
        const char c = format[i];
        if (c != '%' || i + 1 == format.size()) {
            out.push_back(c);
            continue;
        }
        switch (const char spec = format[++i]) {
        case 'H':
            out += fmt::format("{:02}", magnitude / 60);
            break;
        case 'M':
            out += fmt::format("{:02}", magnitude % 60);
            break;
        case 'S':
            out += "00";
            break;
        case '%':
            out.push_back('%');
            break;
        default:
            out.push_back('%');
            out.push_back(spec);
        }
    }
    return out;
}

} // namespace fmsave_core

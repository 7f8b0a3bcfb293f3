#include "mdr_base.hpp"

#include <cctype>
#include <ctime>

#include <fmt/chrono.h>

namespace mydiarelay::format_tools
{

std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_us);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp_us - secs).count();
    // normalize to 0..999999 even for negative timestamps
    int fractional_us = static_cast<int>(us % 1000000);
    if (fractional_us < 0)
        fractional_us += 1000000;
    const std::tm tm = fmt::gmtime(std::chrono::system_clock::to_time_t(secs));
    return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:06d}", tm, fractional_us);
}

std::string to_iso8601(std::chrono::system_clock::time_point timestamp)
{
    const auto secs = std::chrono::time_point_cast<std::chrono::seconds>(timestamp);
    const std::tm tm = fmt::gmtime(std::chrono::system_clock::to_time_t(secs));
    return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", tm);
}

namespace
{
// Days from 1970-01-01 to the given civil date (proleptic Gregorian).
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) noexcept
{
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const auto yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

bool parse_digits(std::string_view text, size_t pos, size_t count, int &out) noexcept
{
    int value = 0;
    for (size_t i = pos; i < pos + count; ++i)
    {
        if (std::isdigit(static_cast<unsigned char>(text[i])) == 0)
            return false;
        value = value * 10 + (text[i] - '0');
    }
    out = value;
    return true;
}
} // namespace

std::optional<std::chrono::system_clock::time_point> from_iso8601(std::string_view text)
{
    // YYYY-MM-DDTHH:MM:SSZ
    constexpr size_t kLen = 20;
    if (text.size() != kLen || text[4] != '-' || text[7] != '-' || text[10] != 'T' ||
        text[13] != ':' || text[16] != ':' || text[19] != 'Z')
    {
        return std::nullopt;
    }
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!parse_digits(text, 0, 4, year) || !parse_digits(text, 5, 2, month) ||
        !parse_digits(text, 8, 2, day) || !parse_digits(text, 11, 2, hour) ||
        !parse_digits(text, 14, 2, minute) || !parse_digits(text, 17, 2, second))
    {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60)
    {
        return std::nullopt;
    }
    const int64_t days =
        days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    const int64_t total = days * 86400 + hour * 3600 + minute * 60 + second;
    return std::chrono::system_clock::time_point{std::chrono::seconds{total}};
}

std::string to_upper_ascii(std::string_view text)
{
    std::string out(text);
    for (auto &c : out)
    {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return out;
}

} // namespace mydiarelay::format_tools

// Tools for formatting strings and timestamps
#pragma once

#include "mydiarelay_utils_export.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace mydiarelay::format_tools
{

/**
 * @brief Formats a system_clock time_point into a string with microsecond precision.
 * @return A string in the format "YYYY-MM-DD HH:MM:SS.us" (UTC).
 */
MYDIARELAY_UTILS_EXPORT std::string formatted_time(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Formats a time_point as an ISO-8601 UTC string with second precision,
 *        e.g. "2026-10-19T08:30:00Z". This is the timestamp format used on the wire.
 */
MYDIARELAY_UTILS_EXPORT std::string to_iso8601(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Parses the output of to_iso8601() back into a time_point.
 * @return std::nullopt if @p text is not of the form "YYYY-MM-DDTHH:MM:SSZ".
 */
MYDIARELAY_UTILS_EXPORT std::optional<std::chrono::system_clock::time_point>
from_iso8601(std::string_view text);

/** @brief Seconds since the Unix epoch for @p timestamp. */
inline int64_t to_unix_seconds(std::chrono::system_clock::time_point timestamp) noexcept
{
    return std::chrono::duration_cast<std::chrono::seconds>(timestamp.time_since_epoch()).count();
}

/** @brief ASCII uppercase copy of @p text. */
MYDIARELAY_UTILS_EXPORT std::string to_upper_ascii(std::string_view text);

/**
 * @brief Creates a `fmt::memory_buffer` from a compile-time format string and arguments.
 */
template <typename... Args>
fmt::memory_buffer make_buffer(fmt::format_string<Args...> fmt_str, Args &&...args)
{
    fmt::memory_buffer mb;
    mb.reserve(128); // small reserve to avoid many reallocs
    fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
    return mb;
}

/**
 * @brief Creates a `fmt::memory_buffer` from a runtime format string and arguments.
 */
template <typename... Args>
fmt::memory_buffer make_buffer_rt(fmt::string_view fmt_str, Args &&...args)
{
    fmt::memory_buffer mb;
    mb.reserve(128);
    fmt::format_to(std::back_inserter(mb), fmt::runtime(fmt_str), std::forward<Args>(args)...);
    return mb;
}

/**
 * @brief Extracts the filename from a full path at compile time.
 */
constexpr std::string_view filename_only(std::string_view file_path) noexcept
{
    const auto last_slash = file_path.find_last_of('/');
    const auto last_backslash = file_path.find_last_of('\\');
    const std::string_view::size_type last_separator_pos = [&]()
    {
        if (last_slash == std::string_view::npos)
        {
            return last_backslash;
        }
        if (last_backslash == std::string_view::npos)
        {
            return last_slash;
        }
        return last_slash > last_backslash ? last_slash : last_backslash;
    }();
    if (last_separator_pos == std::string_view::npos)
    {
        return file_path;
    }
    return file_path.substr(last_separator_pos + 1);
}

} // namespace mydiarelay::format_tools

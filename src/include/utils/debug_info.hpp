/**
 * @file debug_info.hpp
 * @brief Debugging utilities: stack trace printing, panic handling for fatal errors,
 *        and debug messaging that does not depend on the Logger.
 *
 * Uses `fmt` for compile-time format string checks and `std::source_location` for
 * automatic source location reporting.
 */
#pragma once

#include "mydiarelay_utils_export.h"
#include "utils/format_tools.hpp"

#include <cstdio>
#include <cstdlib>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace mydiarelay::debug
{

/**
 * @brief Prints the current call stack to `stderr`.
 *
 * POSIX uses `backtrace` and `dladdr` with demangling. Other platforms print a notice.
 * @warning Not async-signal-safe.
 */
MYDIARELAY_UTILS_EXPORT void print_stack_trace() noexcept;

inline std::string srcloc_to_str(std::source_location loc)
{
    return fmt::format("{}:{}:{}", format_tools::filename_only(loc.file_name()), loc.line(),
                       loc.function_name());
}

/**
 * @brief Halts program execution with a fatal error message and a stack trace.
 *
 * For unrecoverable programming errors only (e.g. using the Logger before its
 * lifecycle module started). Never returns.
 */
template <typename... Args>
[[noreturn]] inline void panic(std::source_location loc, fmt::format_string<Args...> fmt_str,
                               Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[PANIC] {} -- {}\n", srcloc_to_str(loc), body);
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[PANIC] {} -- FORMAT ERROR WHEN PANIC fmt_str['{}']: {}\n",
                   srcloc_to_str(loc), fmt::string_view(fmt_str), e.what());
    }
    std::fflush(stderr);
    print_stack_trace();
    std::abort();
}

/**
 * @brief Prints a debug message to `stderr` with compile-time format string checking.
 */
template <typename... Args>
inline void debug_msg(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[DBG]  {}\n", body);
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[DBG]  FORMAT ERROR DURING DEBUG_MSG: fmt_str['{}']: {}\n",
                   fmt::string_view(fmt_str), e.what());
        std::fflush(stderr);
    }
}

} // namespace mydiarelay::debug

#ifndef MDR_LOC_HERE_STR
#define MDR_LOC_HERE_STR (::mydiarelay::debug::srcloc_to_str(std::source_location::current()))
#endif

/**
 * @brief Calls `mydiarelay::debug::panic` with the current source location.
 */
#ifndef MDR_PANIC
#define MDR_PANIC(fmt, ...)                                                                        \
    ::mydiarelay::debug::panic(std::source_location::current(),                                    \
                               FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#endif

/**
 * @brief Debug message to stderr; compiled out unless MYDIARELAY_ENABLE_DEBUG_MESSAGES is set.
 */
#ifndef MDR_DEBUG
#if defined(MYDIARELAY_ENABLE_DEBUG_MESSAGES)
#define MDR_DEBUG(fmt, ...)                                                                        \
    ::mydiarelay::debug::debug_msg(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#else
#define MDR_DEBUG(fmt, ...)                                                                        \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif
#endif

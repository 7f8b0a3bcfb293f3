#pragma once
/**
 * @file mdr_platform.hpp
 * @brief Layer 0: Platform detection and platform utility declarations.
 *
 * Every file that needs platform macros (MYDIARELAY_PLATFORM_LINUX, MYDIARELAY_IS_POSIX, etc.)
 * includes this. It is self-contained and can be included at any point.
 *
 * Prefer build-system macros (PLATFORM_WIN64, etc.); fall back to compiler predefined macros.
 */
#include <cstddef>
#include <cstdint>
#include <string>

#if defined(PLATFORM_WIN64)
#define MYDIARELAY_PLATFORM_WIN64 1
#elif defined(PLATFORM_APPLE)
#define MYDIARELAY_PLATFORM_APPLE 1
#elif defined(PLATFORM_FREEBSD)
#define MYDIARELAY_PLATFORM_FREEBSD 1
#elif defined(PLATFORM_LINUX)
#define MYDIARELAY_PLATFORM_LINUX 1
#elif defined(PLATFORM_UNKNOWN)
#define MYDIARELAY_PLATFORM_UNKNOWN 1
#else
// Fallback detection
#if defined(_WIN64)
#define MYDIARELAY_PLATFORM_WIN64 1
#elif defined(__APPLE__) && defined(__MACH__)
#define MYDIARELAY_PLATFORM_APPLE 1
#elif defined(__FreeBSD__)
#define MYDIARELAY_PLATFORM_FREEBSD 1
#elif defined(__linux__)
#define MYDIARELAY_PLATFORM_LINUX 1
#else
#define MYDIARELAY_PLATFORM_UNKNOWN 1
#endif
#endif

#if defined(MYDIARELAY_PLATFORM_WIN64)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

// Convenience booleans for source code usage:
#if defined(MYDIARELAY_PLATFORM_WIN64)
#define MYDIARELAY_IS_WINDOWS 1
#undef MYDIARELAY_IS_POSIX
#elif defined(MYDIARELAY_PLATFORM_APPLE) || defined(MYDIARELAY_PLATFORM_FREEBSD) ||              \
    defined(MYDIARELAY_PLATFORM_LINUX)
#undef MYDIARELAY_IS_WINDOWS
#define MYDIARELAY_IS_POSIX 1
#else
#undef MYDIARELAY_IS_WINDOWS
#undef MYDIARELAY_IS_POSIX
#endif

// --- Require C++20 or later --------------------------------------------------
// For GCC/Clang use __cplusplus; for MSVC use _MSVC_LANG (MSVC sets __cplusplus only when
// /Zc:__cplusplus is enabled).
#if defined(_MSC_VER)
#if !defined(_MSVC_LANG) || (_MSVC_LANG < 202002L)
#error "This project requires C++20 or later. Please compile with /std:c++20 or newer (MSVC)."
#endif
#else
#if __cplusplus < 202002L
#error "This project requires C++20 or later. Please compile with -std=c++20 or newer."
#endif
#endif

#include "mydiarelay_utils_export.h"

namespace mydiarelay::platform
{

/**
 * @brief Gets the native thread ID for the calling thread.
 * @return A 64-bit unsigned integer representing the thread ID.
 */
MYDIARELAY_UTILS_EXPORT uint64_t get_native_thread_id() noexcept;

/**
 * @brief Gets the process ID (PID) for the current process.
 */
MYDIARELAY_UTILS_EXPORT uint64_t get_pid();

/**
 * @brief Gets the name of the current executable.
 * @param include_path If `true`, returns the full absolute path to the executable.
 *                     If `false` (default), returns only the filename.
 * @return The executable name, or "unknown" on failure.
 */
MYDIARELAY_UTILS_EXPORT std::string get_executable_name(bool include_path = false) noexcept;

/** @brief Full version string (major.minor.patch) from the configure-time version header. */
MYDIARELAY_UTILS_EXPORT const char *get_version_string() noexcept;

/**
 * @brief Gets a monotonic timestamp in nanoseconds.
 * @note The absolute value is meaningless; use for computing time deltas only.
 */
MYDIARELAY_UTILS_EXPORT uint64_t monotonic_time_ns() noexcept;

/**
 * @brief Computes elapsed time in nanoseconds since a start timestamp.
 * @note If start_ns is in the future, returns 0.
 */
MYDIARELAY_UTILS_EXPORT uint64_t elapsed_time_ns(uint64_t start_ns) noexcept;

} // namespace mydiarelay::platform

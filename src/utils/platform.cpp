/**
 * @file platform.cpp
 * @brief Cross-platform implementations for core OS-specific utilities.
 *
 * Process and thread IDs, the current executable's path, version information and
 * monotonic time. Preprocessor directives select the Linux, macOS or generic POSIX path.
 */
#include "mdr_base.hpp"
#include "mydiarelay_version.h"

#include <chrono>
#include <thread>
#include <vector>

#if defined(MYDIARELAY_IS_POSIX)
#include <limits.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>
#endif

#if defined(MYDIARELAY_PLATFORM_APPLE)
#include <libproc.h>     // proc_pidpath
#include <mach-o/dyld.h> // _NSGetExecutablePath
#include <pthread.h>
#endif

#include <fmt/core.h>

namespace mydiarelay::platform
{

uint64_t get_pid()
{
    return static_cast<uint64_t>(getpid());
}

/**
 * @brief Gets a platform-native thread ID.
 * @details Uses the most efficient OS-specific API available (`pthread_threadid_np`,
 *          `syscall(SYS_gettid)`), falling back to a hash of `std::thread::id`.
 */
uint64_t get_native_thread_id() noexcept
{
#if defined(MYDIARELAY_PLATFORM_APPLE)
    uint64_t tid;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(MYDIARELAY_PLATFORM_LINUX)
    return static_cast<uint64_t>(syscall(SYS_gettid));
#else
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

/**
 * @brief Discovers the name and optionally the full path of the current executable.
 * @details Uses `readlink` on `/proc/self/exe` (Linux) and `_NSGetExecutablePath` (macOS).
 *          The test harness relies on the full path to re-spawn itself as a worker.
 */
std::string get_executable_name(bool include_path) noexcept
{
    try
    {
        std::string full_path;
#if defined(MYDIARELAY_PLATFORM_LINUX)
        std::vector<char> buf(PATH_MAX);
        ssize_t count = readlink("/proc/self/exe", buf.data(), buf.size());
        if (count == -1)
        {
            return "unknown_linux";
        }
        if (static_cast<size_t>(count) >= buf.size())
        {
            buf.resize(buf.size() * 2);
            count = readlink("/proc/self/exe", buf.data(), buf.size());
            if (count == -1)
                return "unknown_linux";
        }
        full_path.assign(buf.data(), static_cast<size_t>(count));
#elif defined(MYDIARELAY_PLATFORM_APPLE)
        uint32_t size = 0;
        if (_NSGetExecutablePath(nullptr, &size) == -1 && size > 0)
        {
            std::vector<char> buf(size);
            if (_NSGetExecutablePath(buf.data(), &size) == 0)
            {
                char resolved[PATH_MAX];
                full_path = realpath(buf.data(), resolved) != nullptr ? std::string(resolved)
                                                                      : std::string(buf.data());
            }
        }
        if (full_path.empty())
        {
            char procbuf[PROC_PIDPATHINFO_MAXSIZE];
            if (proc_pidpath(getpid(), procbuf, sizeof(procbuf)) > 0)
                full_path = procbuf;
        }
        if (full_path.empty())
        {
            return "unknown_macos";
        }
#else
        (void)include_path;
        return "unknown";
#endif

        if (include_path)
        {
            return full_path;
        }
        return std::filesystem::path(full_path).filename().string();
    }
    catch (const std::exception &e)
    {
        // std::filesystem operations can throw on invalid paths.
        fmt::print(stderr, "Warning: get_executable_name failed: {}.\n", e.what());
    }
    return "unknown";
}

const char *get_version_string() noexcept
{
    return MYDIARELAY_VERSION_STRING;
}

/**
 * @brief Monotonic timestamp in nanoseconds from steady_clock.
 *        The absolute value is meaningless; use for deltas only.
 */
uint64_t monotonic_time_ns() noexcept
{
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                     std::chrono::steady_clock::now().time_since_epoch())
                                     .count());
}

uint64_t elapsed_time_ns(uint64_t start_ns) noexcept
{
    uint64_t now = monotonic_time_ns();
    if (now < start_ns)
    {
        return 0;
    }
    return now - start_ns;
}

} // namespace mydiarelay::platform

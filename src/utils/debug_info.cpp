/**
 * @file debug_info.cpp
 * @brief Stack trace printing for mydiarelay::debug::print_stack_trace().
 *
 * POSIX uses `backtrace` plus `dladdr` and `__cxa_demangle` for in-process symbolization.
 * Other platforms print a notice only.
 */
#include "mdr_base.hpp"

#if defined(MYDIARELAY_IS_POSIX)
#include <cxxabi.h>   // __cxa_demangle
#include <dlfcn.h>    // dladdr
#include <execinfo.h> // backtrace
#endif

#include <cstdlib>
#include <string>

namespace mydiarelay::debug
{

namespace
{
// Formats into a fixed stack buffer and writes to stderr. Returns false on a format error.
template <typename... Args>
inline bool safe_format_to_stderr(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        constexpr std::size_t STACK_BUF_SZ = 2048;
        char stack_buf[STACK_BUF_SZ];
        auto result =
            fmt::format_to_n(stack_buf, STACK_BUF_SZ, fmt_str, std::forward<Args>(args)...);
        const std::size_t needed = static_cast<std::size_t>(result.size);
        const std::size_t have = needed < STACK_BUF_SZ ? needed : STACK_BUF_SZ;
        if (have > 0)
        {
            std::fwrite(stack_buf, 1, have, stderr);
        }
        return true;
    }
    catch (const fmt::format_error &)
    {
        return false;
    }
}

#if defined(MYDIARELAY_IS_POSIX)
std::string demangle(const char *name)
{
    int status = 0;
    char *dem = abi::__cxa_demangle(name, nullptr, nullptr, &status);
    if (status == 0 && dem != nullptr)
    {
        std::string out(dem);
        std::free(dem);
        return out;
    }
    return name;
}
#endif

} // namespace

void print_stack_trace() noexcept
{
    try
    {
#if defined(MYDIARELAY_IS_POSIX)
        constexpr int kMaxFrames = 128;
        void *callstack[kMaxFrames];
        const int nframes = backtrace(callstack, kMaxFrames);
        if (nframes <= 0)
        {
            safe_format_to_stderr("  [No stack frames available]\n");
            return;
        }

        safe_format_to_stderr("Stack Trace (most recent call first):\n");
        for (int i = 0; i < nframes; ++i)
        {
            const auto addr = reinterpret_cast<uintptr_t>(callstack[i]);
            safe_format_to_stderr("  #{:02}  {:#018x}  ", i, static_cast<unsigned long long>(addr));

            Dl_info dlinfo;
            if (dladdr(callstack[i], &dlinfo) != 0)
            {
                if (dlinfo.dli_sname != nullptr)
                {
                    const auto saddr = reinterpret_cast<uintptr_t>(dlinfo.dli_saddr);
                    safe_format_to_stderr("{} + {:#x}", demangle(dlinfo.dli_sname),
                                          static_cast<unsigned long long>(addr - saddr));
                }
                else if (dlinfo.dli_fname != nullptr)
                {
                    const auto base = reinterpret_cast<uintptr_t>(dlinfo.dli_fbase);
                    safe_format_to_stderr("({}) + {:#x}", dlinfo.dli_fname,
                                          static_cast<unsigned long long>(addr - base));
                }
                else
                {
                    safe_format_to_stderr("[symbol unknown]");
                }
            }
            else
            {
                safe_format_to_stderr("[symbol unknown]");
            }
            safe_format_to_stderr("\n");
        }
#else
        safe_format_to_stderr("  [Stack trace not supported on this platform]\n");
#endif
    }
    catch (const std::exception &e)
    {
        safe_format_to_stderr("  [Stack trace failed: {}]\n", e.what());
    }
    std::fflush(stderr);
}

} // namespace mydiarelay::debug

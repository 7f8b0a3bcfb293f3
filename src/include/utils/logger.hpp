#pragma once
/*******************************************************************************
 * @file logger.hpp
 * @brief Process-wide asynchronous logger.
 *
 * Call sites format with compile-time checked fmt strings through the LOGGER_* macros.
 * The formatted body is queued as a command and written by a worker thread to the
 * current sink (console by default). Messages beyond the queue limit are dropped, and
 * the worker writes a warning with the count once it catches up.
 *
 * The Logger is a lifecycle module. Using it before `GetLifecycleModule()` has been
 * started through the LifecycleManager is a programming error and panics.
 ******************************************************************************/
#include "mdr_base.hpp"
#include "mydiarelay_utils_export.h"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace mydiarelay::utils
{

class MYDIARELAY_UTILS_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
        L_SYSTEM = 5,
    };

    static Logger &instance();

    /// @brief Lifecycle module named "mydiarelay::utils::Logger".
    static ModuleDef GetLifecycleModule();

    /// @brief True once the Logger module has been started (it may already be shut down).
    static bool lifecycle_initialized() noexcept;

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    /**
     * @brief Switches to a file sink, blocking until the worker has switched.
     * @return false if the file cannot be opened; the error is logged to the current sink.
     */
    bool set_logfile(const std::string &utf8_path);
    bool set_logfile(const std::string &utf8_path, bool use_flock);

    void set_level(Level lvl);
    Level level() const;
    /// @brief Whether sink switches are announced in both the old and the new sink.
    void set_log_sink_messages_enabled(bool enabled);

    /// @brief Blocks until every command queued before this call has been written.
    void flush();
    void shutdown();

    bool should_log(Level lvl) const noexcept;

    template <typename... Args>
    void log_fmt(Level lvl, fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        if (!should_log(lvl))
            return;
        try
        {
            enqueue_log(lvl, format_tools::make_buffer(fmt_str, std::forward<Args>(args)...));
        }
        catch (const std::exception &e)
        {
            enqueue_log(Level::L_ERROR,
                        fmt::format("[FORMAT ERROR] '{}': {}", fmt::string_view(fmt_str), e.what()));
        }
    }

    template <typename... Args>
    void log_fmt_sync(Level lvl, fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        if (!should_log(lvl))
            return;
        try
        {
            write_sync(lvl, format_tools::make_buffer(fmt_str, std::forward<Args>(args)...));
        }
        catch (const std::exception &e)
        {
            write_sync(Level::L_ERROR, format_tools::make_buffer("[FORMAT ERROR] '{}': {}",
                                                                 fmt::string_view(fmt_str), e.what()));
        }
    }

    bool enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept;
    bool enqueue_log(Level lvl, std::string &&body_str) noexcept;
    bool write_sync(Level lvl, fmt::memory_buffer &&body) noexcept;

  private:
    Logger();
    ~Logger();

    friend void do_logger_startup(const char *arg);
    friend void do_logger_shutdown(const char *arg);

    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

/// @brief Maps "trace", "debug", "info", "warn", "error", "system" to a level.
MYDIARELAY_UTILS_EXPORT std::optional<Logger::Level> parse_log_level(std::string_view name);

} // namespace mydiarelay::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

#define LOGGER_TRACE(fmt, ...)                                                                     \
    ::mydiarelay::utils::Logger::instance().log_fmt(                                               \
        ::mydiarelay::utils::Logger::Level::L_TRACE, FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...)                                                                     \
    ::mydiarelay::utils::Logger::instance().log_fmt(                                               \
        ::mydiarelay::utils::Logger::Level::L_DEBUG, FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...)                                                                      \
    ::mydiarelay::utils::Logger::instance().log_fmt(                                               \
        ::mydiarelay::utils::Logger::Level::L_INFO, FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...)                                                                      \
    ::mydiarelay::utils::Logger::instance().log_fmt(                                               \
        ::mydiarelay::utils::Logger::Level::L_WARNING, FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...)                                                                     \
    ::mydiarelay::utils::Logger::instance().log_fmt(                                               \
        ::mydiarelay::utils::Logger::Level::L_ERROR, FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM(fmt, ...)                                                                    \
    ::mydiarelay::utils::Logger::instance().log_fmt(                                               \
        ::mydiarelay::utils::Logger::Level::L_SYSTEM, FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)

// Synchronous variant for paths that must reach the sink before returning (fatal exits).
#define LOGGER_ERROR_SYNC(fmt, ...)                                                                \
    ::mydiarelay::utils::Logger::instance().log_fmt_sync(                                          \
        ::mydiarelay::utils::Logger::Level::L_ERROR, FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)

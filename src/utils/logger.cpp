/*******************************************************************************
 * @file logger.cpp
 * @brief Asynchronous logger: a command queue drained by one worker thread.
 ******************************************************************************/

#include <condition_variable>
#include <future>
#include <stdexcept>
#include <thread>
#include <variant>
#include <vector>

#include "mdr_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/logger.hpp"

#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"
#include "utils/logger_sinks/sink.hpp"

#include <fmt/format.h>

using namespace mydiarelay::format_tools;

namespace mydiarelay::utils
{

namespace
{
// Log messages beyond this many queued are dropped; control commands get twice the room.
constexpr size_t kMaxQueuedMessages = 10000;
} // namespace

enum class LoggerState
{
    Uninitialized,
    Initialized,
    ShuttingDown,
    Shutdown
};

static std::atomic<LoggerState> g_logger_state{LoggerState::Uninitialized};

static bool logger_is_loggable(const char *function_name)
{
    const auto state = g_logger_state.load(std::memory_order_acquire);
    if (state == LoggerState::Uninitialized)
    {
        MDR_PANIC("Logger method '{}' was called before the Logger module was "
                  "initialized via LifecycleManager. Aborting.",
                  function_name);
    }
    return state == LoggerState::Initialized;
}

// ---- Commands ----

using Reply = std::shared_ptr<std::promise<bool>>;

struct SwitchSink
{
    std::unique_ptr<Sink> sink;
    Reply reply;
};
struct ReportSinkError
{
    std::string message;
    Reply reply;
};
struct Flush
{
    Reply reply;
};
struct AnnounceSinkSwitches
{
    bool enabled;
    Reply reply;
};

using Command = std::variant<LogMessage, SwitchSink, ReportSinkError, Flush, AnnounceSinkSwitches>;

static void answer(const Reply &reply, bool value)
{
    if (!reply)
        return;
    try
    {
        reply->set_value(value);
    }
    catch (const std::future_error &e)
    {
        MDR_DEBUG("Logger reply already set: {}", e.what());
    }
}

static void reject(Command &cmd)
{
    std::visit(
        [](auto &&arg)
        {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (!std::is_same_v<T, LogMessage>)
                answer(arg.reply, false);
        },
        cmd);
}

static LogMessage make_internal_message(Logger::Level lvl, fmt::memory_buffer &&body)
{
    return LogMessage{.timestamp = std::chrono::system_clock::now(),
                      .process_id = mydiarelay::platform::get_pid(),
                      .thread_id = mydiarelay::platform::get_native_thread_id(),
                      .level = static_cast<int>(lvl),
                      .body = std::move(body)};
}

struct Logger::Impl
{
    std::thread worker;
    std::mutex queue_mutex;
    std::condition_variable queue_cv;
    std::vector<Command> queue;

    std::mutex sink_mutex;
    std::unique_ptr<Sink> sink = std::make_unique<ConsoleSink>();
    bool announce_switches{true}; // worker thread only

    std::atomic<Logger::Level> level{Logger::Level::L_INFO};
    std::atomic<bool> stopping{false};
    std::atomic<bool> stopped{false};

    // Overflow bookkeeping, under queue_mutex.
    size_t dropped{0};
    std::chrono::steady_clock::time_point dropping_since;

    ~Impl()
    {
        if (worker.joinable() && !stopping.load())
            MDR_DEBUG("Logger destroyed without shutdown; check lifecycle ordering.");
    }

    bool push(Command &&cmd)
    {
        {
            std::lock_guard<std::mutex> lock(queue_mutex);
            if (stopping.load(std::memory_order_acquire))
            {
                reject(cmd);
                return false;
            }
            const bool is_log = std::holds_alternative<LogMessage>(cmd);
            if (queue.size() >= (is_log ? kMaxQueuedMessages : 2 * kMaxQueuedMessages))
            {
                if (dropped++ == 0)
                    dropping_since = std::chrono::steady_clock::now();
                reject(cmd);
                return false;
            }
            queue.emplace_back(std::move(cmd));
        }
        queue_cv.notify_one();
        return true;
    }

    void write_internal(Logger::Level lvl, fmt::memory_buffer &&body)
    {
        std::lock_guard<std::mutex> lock(sink_mutex);
        if (sink)
            sink->write(make_internal_message(lvl, std::move(body)), Sink::ASYNC_WRITE);
    }

    void handle(LogMessage &msg)
    {
        std::lock_guard<std::mutex> lock(sink_mutex);
        if (sink && msg.level >= static_cast<int>(level.load(std::memory_order_relaxed)))
            sink->write(msg, Sink::ASYNC_WRITE);
    }

    void handle(SwitchSink &cmd)
    {
        {
            std::lock_guard<std::mutex> lock(sink_mutex);
            const std::string from = sink ? sink->description() : "none";
            const std::string to = cmd.sink ? cmd.sink->description() : "none";
            if (announce_switches && sink)
            {
                sink->write(make_internal_message(Logger::Level::L_SYSTEM,
                                                  make_buffer("Switching log sink to: {}", to)),
                            Sink::ASYNC_WRITE);
                sink->flush();
            }
            sink = std::move(cmd.sink);
            if (announce_switches && sink)
                sink->write(make_internal_message(Logger::Level::L_SYSTEM,
                                                  make_buffer("Log sink switched from: {}", from)),
                            Sink::ASYNC_WRITE);
        }
        answer(cmd.reply, true);
    }

    void handle(ReportSinkError &cmd)
    {
        write_internal(Logger::Level::L_ERROR, make_buffer("{}", cmd.message));
        answer(cmd.reply, false);
    }

    void handle(Flush &cmd)
    {
        {
            std::lock_guard<std::mutex> lock(sink_mutex);
            if (sink)
                sink->flush();
        }
        answer(cmd.reply, true);
    }

    void handle(AnnounceSinkSwitches &cmd)
    {
        announce_switches = cmd.enabled;
        answer(cmd.reply, true);
    }

    void run()
    {
        std::vector<Command> batch;
        while (true)
        {
            size_t dropped_now = 0;
            std::chrono::steady_clock::time_point dropped_from;
            {
                std::unique_lock<std::mutex> lock(queue_mutex);
                queue_cv.wait(lock, [this] { return !queue.empty() || stopping.load(); });
                batch.swap(queue);
                std::swap(dropped_now, dropped);
                dropped_from = dropping_since;
                if (stopping.load())
                    g_logger_state.store(LoggerState::ShuttingDown, std::memory_order_release);
            }

            if (dropped_now > 0)
            {
                const std::chrono::duration<double> span =
                    std::chrono::steady_clock::now() - dropped_from;
                write_internal(Logger::Level::L_WARNING,
                               make_buffer("Logger queue full: dropped {} message(s) over {:.2f}s",
                                           dropped_now, span.count()));
            }

            for (auto &cmd : batch)
            {
                try
                {
                    std::visit([this](auto &arg) { handle(arg); }, cmd);
                }
                catch (const std::exception &e)
                {
                    MDR_DEBUG("Logger worker error: {}", e.what());
                    reject(cmd);
                }
            }
            batch.clear();

            if (!stopping.load())
                continue;
            {
                std::lock_guard<std::mutex> lock(queue_mutex);
                if (!queue.empty())
                    continue; // drain what arrived while this batch was written
            }
            {
                std::lock_guard<std::mutex> lock(sink_mutex);
                if (sink)
                {
                    sink->write(make_internal_message(Logger::Level::L_SYSTEM,
                                                      make_buffer("Logger is shutting down.")),
                                Sink::ASYNC_WRITE);
                    sink->flush();
                }
            }
            g_logger_state.store(LoggerState::Shutdown, std::memory_order_release);
            return;
        }
    }

    void start()
    {
        if (!worker.joinable())
            worker = std::thread([this] { run(); });
    }

    void stop()
    {
        {
            std::lock_guard<std::mutex> lock(queue_mutex);
            if (stopped.load() || stopping.exchange(true))
                return;
        }
        queue_cv.notify_one();
        if (worker.joinable())
            worker.join();
        stopped.store(true);
    }

    /// Queues @p cmd and waits for the worker's answer.
    template <typename C> bool round_trip(C &&cmd, Reply reply)
    {
        auto done = reply->get_future();
        if (!push(Command{std::forward<C>(cmd)}))
            return false;
        return done.get();
    }
};

// ---- Public API ----

Logger::Logger() : pImpl(std::make_unique<Impl>()) {}
Logger::~Logger() = default;

Logger &Logger::instance()
{
    static Logger instance;
    return instance;
}

bool Logger::lifecycle_initialized() noexcept
{
    return g_logger_state.load(std::memory_order_acquire) != LoggerState::Uninitialized;
}

bool Logger::set_logfile(const std::string &utf8_path)
{
    return set_logfile(utf8_path, true);
}

bool Logger::set_logfile(const std::string &utf8_path, bool use_flock)
{
    if (!logger_is_loggable("Logger::set_logfile"))
        return false;
    std::unique_ptr<Sink> file;
    try
    {
        file = std::make_unique<FileSink>(utf8_path, use_flock);
    }
    catch (const std::exception &e)
    {
        auto reply = std::make_shared<std::promise<bool>>();
        static_cast<void>(pImpl->round_trip(
            ReportSinkError{fmt::format("Failed to create FileSink: {}", e.what()), reply}, reply));
        return false;
    }
    auto reply = std::make_shared<std::promise<bool>>();
    return pImpl->round_trip(SwitchSink{std::move(file), reply}, reply);
}

void Logger::shutdown()
{
    if (lifecycle_initialized() && pImpl)
        pImpl->stop();
}

void Logger::flush()
{
    if (!logger_is_loggable("Logger::flush"))
        return;
    auto reply = std::make_shared<std::promise<bool>>();
    static_cast<void>(pImpl->round_trip(Flush{reply}, reply));
}

void Logger::set_level(Level lvl)
{
    if (!logger_is_loggable("Logger::set_level"))
        return;
    pImpl->level.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    if (!logger_is_loggable("Logger::level"))
        return Level::L_INFO;
    return pImpl->level.load(std::memory_order_relaxed);
}

void Logger::set_log_sink_messages_enabled(bool enabled)
{
    if (!logger_is_loggable("Logger::set_log_sink_messages_enabled"))
        return;
    auto reply = std::make_shared<std::promise<bool>>();
    static_cast<void>(pImpl->round_trip(AnnounceSinkSwitches{enabled, reply}, reply));
}

bool Logger::should_log(Level lvl) const noexcept
{
    if (g_logger_state.load(std::memory_order_acquire) != LoggerState::Initialized)
        return false;
    return pImpl &&
           static_cast<int>(lvl) >= static_cast<int>(pImpl->level.load(std::memory_order_relaxed));
}

bool Logger::enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept
{
    if (g_logger_state.load(std::memory_order_acquire) != LoggerState::Initialized || !pImpl)
        return false;
    try
    {
        return pImpl->push(make_internal_message(lvl, std::move(body)));
    }
    catch (const std::exception &e)
    {
        MDR_DEBUG("Logger::enqueue_log failed: {}", e.what());
        return false;
    }
}

bool Logger::enqueue_log(Level lvl, std::string &&body_str) noexcept
{
    try
    {
        return enqueue_log(lvl, make_buffer("{}", body_str));
    }
    catch (const std::exception &e)
    {
        MDR_DEBUG("Logger::enqueue_log failed: {}", e.what());
        return false;
    }
}

bool Logger::write_sync(Level lvl, fmt::memory_buffer &&body) noexcept
{
    if (g_logger_state.load(std::memory_order_acquire) != LoggerState::Initialized || !pImpl)
        return false;
    if (static_cast<int>(lvl) < static_cast<int>(pImpl->level.load(std::memory_order_relaxed)))
        return false;
    std::lock_guard<std::mutex> lock(pImpl->sink_mutex);
    if (!pImpl->sink)
        return false;
    try
    {
        pImpl->sink->write(make_internal_message(lvl, std::move(body)), Sink::SYNC_WRITE);
        return true;
    }
    catch (const std::exception &e)
    {
        // Logging from here could recurse.
        MDR_DEBUG("Logger::write_sync failed: {}", e.what());
        return false;
    }
}

std::optional<Logger::Level> parse_log_level(std::string_view name)
{
    const std::string upper = to_upper_ascii(name);
    if (upper == "TRACE")
        return Logger::Level::L_TRACE;
    if (upper == "DEBUG")
        return Logger::Level::L_DEBUG;
    if (upper == "INFO")
        return Logger::Level::L_INFO;
    if (upper == "WARN" || upper == "WARNING")
        return Logger::Level::L_WARNING;
    if (upper == "ERROR")
        return Logger::Level::L_ERROR;
    if (upper == "SYSTEM")
        return Logger::Level::L_SYSTEM;
    return std::nullopt;
}

// ---- Lifecycle ----

void do_logger_startup(const char *arg)
{
    (void)arg;
    Logger::instance().pImpl->start();
    g_logger_state.store(LoggerState::Initialized, std::memory_order_release);
}

void do_logger_shutdown(const char *arg)
{
    (void)arg;
    LoggerState expected = LoggerState::Initialized;
    if (!g_logger_state.compare_exchange_strong(expected, LoggerState::ShuttingDown,
                                                std::memory_order_acq_rel))
        return;
    // stop() joins the worker, which marks the state Shutdown on its way out.
    Logger::instance().shutdown();
    g_logger_state.store(LoggerState::Shutdown, std::memory_order_release);
}

ModuleDef Logger::GetLifecycleModule()
{
    ModuleDef module("mydiarelay::utils::Logger");
    module.set_startup(&do_logger_startup);
    module.set_shutdown(&do_logger_shutdown, std::chrono::milliseconds(5000));
    return module;
}

} // namespace mydiarelay::utils

#include "mdr_base.hpp"
#include "utils/logger_sinks/sink.hpp"

namespace mydiarelay::utils
{

const char *Sink::level_to_string_internal(int lvl)
{
    // Mirrors Logger::Level without including logger.hpp.
    constexpr int kTraceLevel = 0;
    constexpr int kDebugLevel = 1;
    constexpr int kInfoLevel = 2;
    constexpr int kWarnLevel = 3;
    constexpr int kErrorLevel = 4;
    constexpr int kSystemLevel = 5;
    switch (lvl)
    {
    case kTraceLevel:
        return "TRACE";
    case kDebugLevel:
        return "DEBUG";
    case kInfoLevel:
        return "INFO";
    case kWarnLevel:
        return "WARN";
    case kErrorLevel:
        return "ERROR";
    case kSystemLevel:
        return "SYSTEM";
    default:
        return "UNK";
    }
}

std::string Sink::format_logmsg(const LogMessage &msg, Sink::WRITE_MODE mode)
{
    const std::string time_str = format_tools::formatted_time(msg.timestamp);
    const char *tag = mode == Sink::ASYNC_WRITE ? "[LOGGER]" : "[LOGGER_SYNC]";
    return fmt::format("{} [{:<6}] [{}] [PID:{:5} TID:{:5}] {}\n", tag,
                       level_to_string_internal(msg.level), time_str, msg.process_id,
                       msg.thread_id, std::string_view(msg.body.data(), msg.body.size()));
}

} // namespace mydiarelay::utils

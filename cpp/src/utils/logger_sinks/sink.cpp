#include "utils/logger_sinks/sink.hpp"

#include <iterator>

namespace solohub::utils
{

const char *level_name(int level) noexcept
{
    static constexpr const char *kNames[] = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "SYSTEM"};
    if (level < 0 || level >= static_cast<int>(std::size(kNames)))
        return "UNK";
    return kNames[level];
}

std::string format_log_line(const LogMessage &msg)
{
    fmt::memory_buffer line;
    fmt::format_to(std::back_inserter(line), "[LOGGER] [{:<6}] [{}] [PID:{:5} TID:{:5}",
                   level_name(msg.level),
                   format_tools::formatted_time(msg.timestamp), msg.process_id, msg.thread_id);
    if (!msg.thread_name.empty())
        fmt::format_to(std::back_inserter(line), " {}", msg.thread_name);
    fmt::format_to(std::back_inserter(line), "] {}\n",
                   std::string_view(msg.body.data(), msg.body.size()));
    return fmt::to_string(line);
}

} // namespace solohub::utils

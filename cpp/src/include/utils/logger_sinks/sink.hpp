#pragma once

#include "solo_base.hpp"

#include <string_view>

namespace solohub::utils
{

/// One log record as it travels from the calling thread to the logger worker.
struct LogMessage
{
    std::chrono::system_clock::time_point timestamp;
    uint64_t process_id;
    uint64_t thread_id;
    std::string thread_name; // empty unless set_current_thread_name() was called
    int level;               // Logger::Level as int; keeps logger.hpp out of this header
    fmt::memory_buffer body;
};

/// Short upper-case name of a Logger::Level value, e.g. "WARN".
[[nodiscard]] const char *level_name(int level) noexcept;

/**
 * @brief Renders a record as one line.
 *
 * `[LOGGER] [INFO  ] [2026-01-01 10:00:00.123456] [PID:  123 TID:  456] text`, with the
 * thread name appended after the TID when the thread has one.
 */
[[nodiscard]] std::string format_log_line(const LogMessage &msg);

/// Destination for log lines. Only the logger worker thread calls into a sink.
class Sink
{
  public:
    virtual ~Sink() = default;

    virtual void write(const LogMessage &msg) = 0;
    virtual void flush() = 0;
    virtual std::string description() const = 0;
};

} // namespace solohub::utils

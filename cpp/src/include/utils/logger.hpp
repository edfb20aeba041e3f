/*******************************************************************************
 * @file logger.hpp
 * @brief Asynchronous, thread-safe logging utility.
 *
 * **Design: Command-Queue Pattern**
 * 1.  **Non-Blocking API**: `LOGGER_INFO(...)` formats the message on the calling
 *     thread and pushes it onto a queue. Application threads never do I/O.
 * 2.  **Worker Thread**: A single background thread is the sole consumer of the
 *     queue. It writes to the active sink and applies control commands (sink
 *     switch, flush, error callback) in the order they were issued.
 * 3.  **Sinks**: `ConsoleSink` (stderr, the default) and `FileSink` (append, with
 *     an optional advisory lock so several processes can share one file).
 * 4.  **Bounded Queue**: Past the soft limit log messages are dropped and counted;
 *     control commands are still accepted up to twice the limit. A summary
 *     warning reports the drop count once the worker catches up.
 * 5.  **Shutdown**: `shutdown()` drains the queue and joins the worker. Messages
 *     logged afterwards go straight to stderr with a `[solohub::Logger-fallback]`
 *     prefix, so late messages from detached threads are not lost.
 *
 * The worker starts on first use of `Logger::instance()`. The instance is never
 * destroyed; call `shutdown()` before exit to flush.
 *
 * **Usage**
 * ```cpp
 * #include "utils/logger.hpp"
 * LOGGER_INFO("subscriber {} started", id);
 *
 * auto &logger = solohub::utils::Logger::instance();
 * logger.set_logfile("/tmp/solohub.log");
 * logger.set_level(solohub::utils::Logger::Level::L_DEBUG);
 * logger.shutdown(); // Blocks until all logs are written
 * ```
 ******************************************************************************/

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "solohub_utils_export.h"

// Default initial reserve for fmt::memory_buffer used by Logger::log_fmt.
#ifndef LOGGER_FMT_BUFFER_RESERVE
#define LOGGER_FMT_BUFFER_RESERVE (1024u)
#endif

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace solohub::utils
{

class SOLOHUB_UTILS_EXPORT Logger
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

    // Singleton accessor; starts the worker thread on first call.
    static Logger &instance();

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    ~Logger();

    // --- Sinks ---
    // Sink switches are commands executed in order by the worker. These calls
    // block until the worker has applied the switch.

    /**
     * @brief Switch logging to the console (stderr).
     * @return true once the worker has installed the sink.
     */
    bool set_console();

    /**
     * @brief Switch logging to a file, appending.
     * @param utf8_path Path to the log file. The parent directory must exist.
     * @param use_flock If true, take an advisory file lock around each write (POSIX).
     * @return false if the file could not be opened; the previous sink stays active
     *         and the error callback (if any) receives the reason.
     */
    bool set_logfile(const std::string &utf8_path, bool use_flock = true);

    /**
     * @brief Drains the queue, flushes the sink and stops the worker thread.
     *
     * Idempotent. Blocks until every message queued before the call is written.
     */
    void shutdown();

    /// True once shutdown() has completed.
    [[nodiscard]] bool is_shut_down() const noexcept;

    /**
     * @brief Waits until every message queued before the call has been written
     *        and the sink flushed. Returns immediately after shutdown.
     */
    void flush();

    // --- Configuration & Diagnostics ---
    void set_level(Level lvl);
    Level level() const;

    void set_max_queue_size(size_t max_size);
    size_t get_max_queue_size() const;
    size_t get_total_dropped_since_sink_switch() const;

    /**
     * @brief Sets a callback invoked on sink errors (write failure, sink creation failure).
     *
     * The callback runs on a dedicated dispatcher thread, never on the worker.
     */
    void set_write_error_callback(std::function<void(const std::string &)> cb);

    /// Enables or disables the "Switching log sink" system lines on sink changes.
    void set_log_sink_messages_enabled(bool enabled);

    /// Parses "trace", "debug", "info", "warn"/"warning", "error", "system" (any case).
    static std::optional<Level> level_from_string(std::string_view name) noexcept;

    // --- Formatting API (header-only templates) ---
    template <Level lvl, typename... Args>
    void log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept;

    template <typename... Args>
    void trace_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_TRACE>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void debug_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_DEBUG>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void info_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_INFO>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void warn_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_WARNING>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void error_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_ERROR>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void system_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_SYSTEM>(fmt_str, std::forward<Args>(args)...);
    }

  private:
    Logger();

    struct Impl;
    std::unique_ptr<Impl> pImpl;

    bool enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept;
    bool should_log(Level lvl) const noexcept;
};

// --- Compile-Time Log Level ---
#ifndef LOGGER_COMPILE_LEVEL
#define LOGGER_COMPILE_LEVEL 0 // 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error
#endif

// ----------------- Template implementation (must be in header) -----------------

template <Logger::Level lvl, typename... Args>
void Logger::log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    if constexpr (static_cast<int>(lvl) >= LOGGER_COMPILE_LEVEL)
    {
        if (!should_log(lvl))
            return;

        fmt::memory_buffer mb;
        try
        {
            mb.reserve(LOGGER_FMT_BUFFER_RESERVE);
            fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
        }
        catch (const std::exception &ex)
        {
            mb.clear();
            constexpr std::string_view kPrefix = "[FORMAT ERROR] ";
            mb.append(kPrefix.data(), kPrefix.data() + kPrefix.size());
            const std::string_view what = ex.what();
            mb.append(what.data(), what.data() + what.size());
        }
        (void)enqueue_log(lvl, std::move(mb));
    }
}

} // namespace solohub::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

// --- Macro Implementation ---
#define LOGGER_TRACE(fmt, ...)                                                                     \
    ::solohub::utils::Logger::instance().trace_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...)                                                                     \
    ::solohub::utils::Logger::instance().debug_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...)                                                                      \
    ::solohub::utils::Logger::instance().info_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...)                                                                      \
    ::solohub::utils::Logger::instance().warn_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...)                                                                     \
    ::solohub::utils::Logger::instance().error_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM(fmt, ...)                                                                    \
    ::solohub::utils::Logger::instance().system_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)

/*******************************************************************************
 * @file logger.cpp
 * @brief Implementation of the asynchronous logger.
 ******************************************************************************/

#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <variant>
#include <vector>

#include "solo_base.hpp"

#include "utils/logger.hpp"
#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"
#include "utils/logger_sinks/sink.hpp"

using solohub::format_tools::make_buffer;

namespace solohub::utils
{

namespace
{

/**
 * @class CallbackDispatcher
 * @brief Runs user-provided error callbacks on their own thread.
 *
 * A slow or throwing callback never stalls the logger worker.
 */
class CallbackDispatcher
{
  public:
    CallbackDispatcher() : shutdown_requested_(false)
    {
        worker_ = std::thread([this] { this->run(); });
    }

    ~CallbackDispatcher() { shutdown(); }

    CallbackDispatcher(const CallbackDispatcher &) = delete;
    CallbackDispatcher &operator=(const CallbackDispatcher &) = delete;

    void post(std::function<void()> fn)
    {
        if (shutdown_requested_.load(std::memory_order_relaxed))
            return;
        {
            std::lock_guard<std::mutex> lg(mutex_);
            queue_.push_back(std::move(fn));
        }
        cv_.notify_one();
    }

    void shutdown()
    {
        if (shutdown_requested_.exchange(true))
            return;
        cv_.notify_one();
        if (worker_.joinable())
            worker_.join();
    }

  private:
    void run()
    {
        for (;;)
        {
            std::function<void()> fn;
            {
                std::unique_lock<std::mutex> ul(mutex_);
                cv_.wait(ul, [this] { return shutdown_requested_.load() || !queue_.empty(); });
                if (shutdown_requested_.load() && queue_.empty())
                    return;
                fn = std::move(queue_.front());
                queue_.pop_front();
            }
            try
            {
                fn();
            }
            catch (const std::exception &e)
            {
                fmt::print(stderr, "[solohub::Logger] error callback threw: {}\n", e.what());
            }
        }
    }

    std::deque<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_;
    std::atomic<bool> shutdown_requested_;
};

// Command Definitions
struct SetSinkCommand
{
    std::unique_ptr<Sink> new_sink;
    std::shared_ptr<std::promise<bool>> promise;
};
struct SinkCreationErrorCommand
{
    std::string error_message;
    std::shared_ptr<std::promise<bool>> promise;
};
struct FlushCommand
{
    std::shared_ptr<std::promise<bool>> promise;
};
struct SetErrorCallbackCommand
{
    std::function<void(const std::string &)> callback;
    std::shared_ptr<std::promise<bool>> promise;
};
struct SetLogSinkMessagesCommand
{
    bool enabled;
    std::shared_ptr<std::promise<bool>> promise;
};

using Command = std::variant<LogMessage, SetSinkCommand, SinkCreationErrorCommand, FlushCommand,
                             SetErrorCallbackCommand, SetLogSinkMessagesCommand>;

void promise_set_safe(const std::shared_ptr<std::promise<bool>> &p, bool value)
{
    if (!p)
        return;
    try
    {
        p->set_value(value);
    }
    catch (const std::future_error &)
    {
        // Already satisfied: a command is answered once.
    }
}

enum class EnqueueResult
{
    Queued,
    Dropped,
    ShutDown
};

LogMessage make_message(Logger::Level lvl, fmt::memory_buffer &&body)
{
    return LogMessage{.timestamp = std::chrono::system_clock::now(),
                      .process_id = platform::get_pid(),
                      .thread_id = platform::get_native_thread_id(),
                      .thread_name = platform::get_current_thread_name(),
                      .level = static_cast<int>(lvl),
                      .body = std::move(body)};
}

// Direct stderr write for messages that arrive after shutdown.
void write_fallback(const LogMessage &msg) noexcept
{
    try
    {
        fmt::print(stderr, "[solohub::Logger-fallback] {}", format_log_line(msg));
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[solohub::Logger-fallback] format error: %s\n", e.what());
    }
}

} // namespace

// Logger Pimpl and Implementation
struct Logger::Impl
{
    Impl();
    ~Impl();
    void start_worker();
    void worker_loop();
    EnqueueResult enqueue_command(Command &&cmd);
    void reject_command(Command &cmd);
    void process_batch(std::vector<Command> &batch);
    void write_to_sink(LogMessage &&msg);
    void report_error(const std::string &message);
    void shutdown();

    std::function<void(const std::string &)> error_callback_;
    std::thread worker_thread_;
    std::unique_ptr<Sink> sink_;
    size_t m_max_queue_size{10000};
    std::chrono::system_clock::time_point m_dropping_since;
    std::vector<Command> queue_;
    std::condition_variable cv_;
    std::mutex queue_mutex_;
    std::mutex m_sink_mutex;
    std::mutex m_shutdown_mutex;
    CallbackDispatcher callback_dispatcher_;
    std::atomic<Logger::Level> level_{Logger::Level::L_INFO};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> shutdown_completed_{false};
    std::atomic<bool> m_log_sink_messages_enabled_{true};
    std::atomic<bool> m_was_dropping{false};
    std::atomic<size_t> m_messages_dropped{0}; // exchange(0) when the summary is written
    std::atomic<size_t> m_total_dropped_since_sink_switch{0};
};

Logger::Impl::Impl() : sink_(std::make_unique<ConsoleSink>()) {}

Logger::Impl::~Impl()
{
    shutdown();
}

void Logger::Impl::start_worker()
{
    if (!worker_thread_.joinable())
        worker_thread_ = std::thread(&Logger::Impl::worker_loop, this);
}

void Logger::Impl::reject_command(Command &cmd)
{
    std::visit(
        [](auto &&arg)
        {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (!std::is_same_v<T, LogMessage>)
                promise_set_safe(arg.promise, false);
        },
        cmd);
}

EnqueueResult Logger::Impl::enqueue_command(Command &&cmd)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_.load(std::memory_order_acquire))
        {
            reject_command(cmd);
            return EnqueueResult::ShutDown;
        }

        const size_t current_queue_size = queue_.size();
        const bool is_log = std::holds_alternative<LogMessage>(cmd);

        // Log messages stop at the soft limit; control commands at twice that.
        if (current_queue_size >= m_max_queue_size * 2 ||
            (is_log && current_queue_size >= m_max_queue_size))
        {
            m_messages_dropped.fetch_add(1, std::memory_order_relaxed);
            m_total_dropped_since_sink_switch.fetch_add(1, std::memory_order_relaxed);
            if (!m_was_dropping.exchange(true, std::memory_order_relaxed))
                m_dropping_since = std::chrono::system_clock::now();
            reject_command(cmd);
            return EnqueueResult::Dropped;
        }

        queue_.emplace_back(std::move(cmd));
    }
    cv_.notify_one();
    return EnqueueResult::Queued;
}

void Logger::Impl::report_error(const std::string &message)
{
    if (error_callback_)
    {
        auto cb = error_callback_;
        callback_dispatcher_.post([cb, message]() { cb(message); });
    }
    else
    {
        SOLOHUB_DEBUG("Logger error with no error callback set: {}", message);
    }
}

void Logger::Impl::write_to_sink(LogMessage &&msg)
{
    std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
    if (sink_)
        sink_->write(msg);
}

void Logger::Impl::process_batch(std::vector<Command> &batch)
{
    // Only the last sink switch in a batch is applied; earlier ones are answered false.
    ptrdiff_t last_set_sink_idx = -1;
    for (ptrdiff_t i = static_cast<ptrdiff_t>(batch.size()) - 1; i >= 0; --i)
    {
        if (std::holds_alternative<SetSinkCommand>(batch[static_cast<size_t>(i)]))
        {
            last_set_sink_idx = i;
            break;
        }
    }

    for (size_t i = 0; i < batch.size(); ++i)
    {
        try
        {
            if (auto *msg = std::get_if<LogMessage>(&batch[i]))
            {
                if (msg->level >= static_cast<int>(level_.load(std::memory_order_relaxed)))
                    write_to_sink(std::move(*msg));
                continue;
            }

            std::visit(
                [&, this](auto &&arg)
                {
                    using T = std::decay_t<decltype(arg)>;
                    if constexpr (std::is_same_v<T, SetSinkCommand>)
                    {
                        if (static_cast<ptrdiff_t>(i) != last_set_sink_idx)
                            promise_set_safe(arg.promise, false);
                    }
                    else if constexpr (std::is_same_v<T, SinkCreationErrorCommand>)
                    {
                        report_error(arg.error_message);
                        promise_set_safe(arg.promise, false);
                    }
                    else if constexpr (std::is_same_v<T, FlushCommand>)
                    {
                        {
                            std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
                            if (sink_)
                                sink_->flush();
                        }
                        promise_set_safe(arg.promise, true);
                    }
                    else if constexpr (std::is_same_v<T, SetErrorCallbackCommand>)
                    {
                        error_callback_ = std::move(arg.callback);
                        promise_set_safe(arg.promise, true);
                    }
                    else if constexpr (std::is_same_v<T, SetLogSinkMessagesCommand>)
                    {
                        m_log_sink_messages_enabled_.store(arg.enabled, std::memory_order_relaxed);
                        promise_set_safe(arg.promise, true);
                    }
                },
                batch[i]);
        }
        catch (const std::exception &e)
        {
            report_error(fmt::format("Logger worker error: {}", e.what()));
            reject_command(batch[i]);
        }
    }

    if (last_set_sink_idx == -1)
        return;

    auto &sink_cmd = std::get<SetSinkCommand>(batch[static_cast<size_t>(last_set_sink_idx)]);
    try
    {
        std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
        const bool announce = m_log_sink_messages_enabled_.load(std::memory_order_relaxed);
        const std::string old_desc = sink_ ? sink_->description() : "null";
        const std::string new_desc = sink_cmd.new_sink ? sink_cmd.new_sink->description() : "null";
        if (announce && sink_)
        {
            sink_->write(make_message(Logger::Level::L_SYSTEM,
                                             make_buffer("Switching log sink to: {}", new_desc)));
            sink_->flush();
        }
        m_total_dropped_since_sink_switch.store(0, std::memory_order_relaxed);
        sink_ = std::move(sink_cmd.new_sink);
        if (announce && sink_)
        {
            sink_->write(make_message(Logger::Level::L_SYSTEM,
                                             make_buffer("Log sink switched from: {}", old_desc)));
        }
        promise_set_safe(sink_cmd.promise, true);
    }
    catch (const std::exception &e)
    {
        report_error(fmt::format("Logger sink switch error: {}", e.what()));
        promise_set_safe(sink_cmd.promise, sink_ != nullptr);
    }
}

void Logger::Impl::worker_loop()
{
    platform::set_current_thread_name("solohub_logger");
    std::vector<Command> local_queue;

    while (true)
    {
        size_t dropped_count = 0;
        double dropping_duration_s = 0.0;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || shutdown_requested_.load(); });
            local_queue.swap(queue_);

            if (m_was_dropping.exchange(false, std::memory_order_relaxed))
            {
                dropped_count = m_messages_dropped.exchange(0, std::memory_order_relaxed);
                dropping_duration_s = std::chrono::duration<double>(
                                          std::chrono::system_clock::now() - m_dropping_since)
                                          .count();
            }
        }

        try
        {
            if (dropped_count > 0)
            {
                write_to_sink(make_message(
                    Logger::Level::L_WARNING,
                    make_buffer("Overflow detected when processing the queue. Messages may have "
                                "been dropped in the following batch.")));
            }

            process_batch(local_queue);

            if (dropped_count > 0)
            {
                write_to_sink(make_message(
                    Logger::Level::L_WARNING,
                    make_buffer("Summary: the Logger dropped {} messages over {:.2f}s due to a "
                                "full queue.",
                                dropped_count, dropping_duration_s)));
            }
        }
        catch (const std::exception &e)
        {
            report_error(fmt::format("Logger worker error: {}", e.what()));
        }
        local_queue.clear();

        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_.load() && queue_.empty())
            break;
    }

    try
    {
        std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
        if (sink_)
        {
            sink_->write(make_message(Logger::Level::L_SYSTEM,
                                             make_buffer("Logger is shutting down.")));
            sink_->flush();
        }
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[solohub::Logger] final flush failed: {}\n", e.what());
    }
}

void Logger::Impl::shutdown()
{
    std::lock_guard<std::mutex> guard(m_shutdown_mutex);
    if (shutdown_completed_.load())
        return;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        shutdown_requested_.store(true, std::memory_order_release);
    }
    cv_.notify_one();
    if (worker_thread_.joinable())
        worker_thread_.join();
    callback_dispatcher_.shutdown();
    shutdown_completed_.store(true, std::memory_order_release);
}

// Logger Public API Implementation
Logger::Logger() : pImpl(std::make_unique<Impl>())
{
    pImpl->start_worker();
}

Logger::~Logger() = default;

Logger &Logger::instance()
{
    // Never destroyed: detached threads may log during static destruction.
    static Logger *instance = new Logger();
    return *instance;
}

bool Logger::set_console()
{
    try
    {
        auto promise = std::make_shared<std::promise<bool>>();
        auto future = promise->get_future();
        (void)pImpl->enqueue_command(SetSinkCommand{std::make_unique<ConsoleSink>(), promise});
        return future.get();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[solohub::Logger] set_console failed: {}\n", e.what());
    }
    return false;
}

bool Logger::set_logfile(const std::string &utf8_path, bool use_flock)
{
    std::unique_ptr<Sink> sink;
    std::string creation_error;
    try
    {
        sink = std::make_unique<FileSink>(std::filesystem::u8path(utf8_path), use_flock);
    }
    catch (const std::exception &e)
    {
        creation_error = fmt::format("Failed to create FileSink: {}", e.what());
    }

    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    if (sink)
        (void)pImpl->enqueue_command(SetSinkCommand{std::move(sink), promise});
    else
        (void)pImpl->enqueue_command(SinkCreationErrorCommand{std::move(creation_error), promise});
    return future.get();
}

void Logger::shutdown()
{
    pImpl->shutdown();
}

bool Logger::is_shut_down() const noexcept
{
    return pImpl->shutdown_completed_.load(std::memory_order_acquire);
}

void Logger::flush()
{
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    // A rejected command answers its promise, so this never blocks after shutdown.
    (void)pImpl->enqueue_command(FlushCommand{promise});
    (void)future.get();
}

void Logger::set_level(Level lvl)
{
    pImpl->level_.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    return pImpl->level_.load(std::memory_order_relaxed);
}

void Logger::set_max_queue_size(size_t max_size)
{
    std::lock_guard<std::mutex> lock(pImpl->queue_mutex_);
    pImpl->m_max_queue_size = (max_size > 0) ? max_size : 1;
}

size_t Logger::get_max_queue_size() const
{
    std::lock_guard<std::mutex> lock(pImpl->queue_mutex_);
    return pImpl->m_max_queue_size;
}

size_t Logger::get_total_dropped_since_sink_switch() const
{
    return pImpl->m_total_dropped_since_sink_switch.load(std::memory_order_relaxed);
}

void Logger::set_write_error_callback(std::function<void(const std::string &)> cb)
{
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    (void)pImpl->enqueue_command(SetErrorCallbackCommand{std::move(cb), promise});
    (void)future.get();
}

void Logger::set_log_sink_messages_enabled(bool enabled)
{
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    (void)pImpl->enqueue_command(SetLogSinkMessagesCommand{enabled, promise});
    (void)future.get();
}

std::optional<Logger::Level> Logger::level_from_string(std::string_view name) noexcept
{
    std::string lowered(name.size(), '\0');
    std::transform(name.begin(), name.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "trace")
        return Level::L_TRACE;
    if (lowered == "debug")
        return Level::L_DEBUG;
    if (lowered == "info")
        return Level::L_INFO;
    if (lowered == "warn" || lowered == "warning")
        return Level::L_WARNING;
    if (lowered == "error")
        return Level::L_ERROR;
    if (lowered == "system")
        return Level::L_SYSTEM;
    return std::nullopt;
}

bool Logger::should_log(Level lvl) const noexcept
{
    return static_cast<int>(lvl) >= static_cast<int>(pImpl->level_.load(std::memory_order_relaxed));
}

bool Logger::enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept
{
    try
    {
        Command cmd{make_message(lvl, std::move(body))};
        // enqueue_command only moves from cmd when it queues it.
        switch (pImpl->enqueue_command(std::move(cmd)))
        {
        case EnqueueResult::Queued:
            return true;
        case EnqueueResult::ShutDown:
            write_fallback(std::get<LogMessage>(cmd));
            return false;
        case EnqueueResult::Dropped:
            return false;
        }
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[solohub::Logger-fallback] enqueue failed: %s\n", e.what());
    }
    return false;
}

} // namespace solohub::utils

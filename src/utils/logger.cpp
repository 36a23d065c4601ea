/*******************************************************************************
 * @file logger.cpp
 * @brief Implementation of the asynchronous logger.
 *
 * @see src/include/utils/logger.hpp
 *
 * **Implementation Details**
 *
 * 1.  **Command Processing**: `Command` is a `std::variant` of a `LogMessage`
 *     to write, a `SetSinkCommand`, a `FlushCommand` carrying a promise, and
 *     error-callback plumbing. Public API calls are producers.
 *
 * 2.  **Worker Thread (`worker_loop`)**: sleeps on a condition variable until
 *     the queue is non-empty or shutdown is requested, then swaps the whole
 *     queue into a local vector and processes it unlocked (batching keeps
 *     producer lock hold times short).
 *
 * 3.  **Sinks**: polymorphic `Sink` objects owned by `std::unique_ptr`,
 *     touched only by the worker. Sink creation happens on the calling
 *     thread; a failure becomes a `SinkCreationErrorCommand`.
 *
 * 4.  **Error Callback (`CallbackDispatcher`)**: user callbacks run on their
 *     own thread so a callback that logs cannot deadlock the worker.
 ******************************************************************************/

#include "utils/logger.hpp"

#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <ctime>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <variant>
#include <vector>

#include <fmt/format.h>

#include <fcntl.h>
#include <sys/syscall.h>
#include <unistd.h>

namespace rangekv::utils
{

/**
 * @class CallbackDispatcher
 * @brief Executes user-provided callbacks on a separate thread.
 */
class CallbackDispatcher
{
  public:
    CallbackDispatcher() : shutdown_requested_(false)
    {
        worker_ = std::thread([this] { this->run(); });
    }

    ~CallbackDispatcher() { shutdown(); }

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
        {
            return;
        }
        cv_.notify_one();
        if (worker_.joinable())
        {
            worker_.join();
        }
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
                {
                    return;
                }
                fn = std::move(queue_.front());
                queue_.pop_front();
            }
            try
            {
                fn();
            }
            catch (const std::exception &e)
            {
                fmt::print(stderr, "[rangekv::Logger] error callback threw: {}\n", e.what());
            }
        }
    }

    std::deque<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_;
    std::atomic<bool> shutdown_requested_;
};

// ============================================================================
// Internal Command and Sink Definitions
// ============================================================================

struct LogMessage
{
    Logger::Level level;
    std::chrono::system_clock::time_point timestamp;
    uint64_t thread_id;
    std::string body;
};

/**
 * @class Sink
 * @brief Abstract log destination. Only ever called from the worker thread.
 */
class Sink
{
  public:
    virtual ~Sink() = default;
    virtual void write(const LogMessage &msg) = 0;
    virtual void flush() = 0;
    virtual std::string description() const = 0;
};

namespace
{

const char *level_to_string(Logger::Level lvl)
{
    switch (lvl)
    {
    case Logger::Level::L_TRACE: return "TRACE";
    case Logger::Level::L_DEBUG: return "DEBUG";
    case Logger::Level::L_INFO: return "INFO";
    case Logger::Level::L_WARNING: return "WARN";
    case Logger::Level::L_ERROR: return "ERROR";
    case Logger::Level::L_SYSTEM: return "SYSTEM";
    default: return "UNK";
    }
}

uint64_t get_native_thread_id() noexcept
{
#if defined(__linux__)
    return static_cast<uint64_t>(::syscall(SYS_gettid));
#else
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

// "YYYY-MM-DD HH:MM:SS.uuuuuu" in local time.
std::string formatted_time(std::chrono::system_clock::time_point tp)
{
    const auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    const auto micros =
        std::chrono::duration_cast<std::chrono::microseconds>(tp - secs).count();
    const std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf{};
    ::localtime_r(&tt, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return fmt::format("{}.{:06d}", buf, micros);
}

std::string format_message(const LogMessage &msg)
{
    return fmt::format("[{}] [{:<6}] [{:5}] {}\n", formatted_time(msg.timestamp),
                       level_to_string(msg.level), msg.thread_id, msg.body);
}

LogMessage make_system_message(std::string body)
{
    return LogMessage{Logger::Level::L_SYSTEM, std::chrono::system_clock::now(),
                      get_native_thread_id(), std::move(body)};
}

} // namespace

// ============================================================================
// Concrete Sink Implementations
// ============================================================================

class ConsoleSink : public Sink
{
  public:
    void write(const LogMessage &msg) override { fmt::print(stderr, "{}", format_message(msg)); }
    void flush() override { std::fflush(stderr); }
    std::string description() const override { return "Console"; }
};

class FileSink : public Sink
{
  public:
    explicit FileSink(const std::string &path) : path_(path)
    {
        fd_ = ::open(path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
        if (fd_ == -1)
        {
            throw std::runtime_error("Failed to open log file: " + path);
        }
    }

    ~FileSink() override
    {
        if (fd_ != -1)
            ::close(fd_);
    }

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    void write(const LogMessage &msg) override
    {
        const auto formatted = format_message(msg);
        const char *data = formatted.data();
        size_t remaining = formatted.size();
        while (remaining > 0)
        {
            const ssize_t n = ::write(fd_, data, remaining);
            if (n < 0)
            {
                if (errno == EINTR)
                    continue;
                throw std::runtime_error(fmt::format("write to '{}' failed: errno {}", path_, errno));
            }
            data += n;
            remaining -= static_cast<size_t>(n);
        }
    }

    void flush() override { ::fsync(fd_); }

    std::string description() const override { return "File: " + path_; }

  private:
    std::string path_;
    int fd_ = -1;
};

// --- Command Definitions ---
struct SetSinkCommand { std::unique_ptr<Sink> new_sink; };
struct SinkCreationErrorCommand { std::string error_message; };
struct FlushCommand { std::shared_ptr<std::promise<void>> promise; };
struct SetErrorCallbackCommand { std::function<void(const std::string &)> callback; };

using Command = std::variant<LogMessage, SetSinkCommand, SinkCreationErrorCommand, FlushCommand,
                             SetErrorCallbackCommand>;

// ============================================================================
// Logger Pimpl and Implementation
// ============================================================================

struct Impl
{
    Impl();
    ~Impl();

    void worker_loop();
    void enqueue_command(Command &&cmd);
    void report_error(std::string msg);
    void shutdown();

    std::thread worker_thread_;
    std::vector<Command> queue_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> shutdown_completed_{false};

    std::atomic<Logger::Level> level_{Logger::Level::L_INFO};

    // Worker-owned state.
    std::unique_ptr<Sink> sink_;
    std::function<void(const std::string &)> error_callback_;
    CallbackDispatcher callback_dispatcher_;
};

Impl::Impl() : sink_(std::make_unique<ConsoleSink>())
{
    worker_thread_ = std::thread(&Impl::worker_loop, this);
}

Impl::~Impl() { shutdown(); }

void Impl::enqueue_command(Command &&cmd)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!shutdown_requested_.load(std::memory_order_acquire))
        {
            queue_.emplace_back(std::move(cmd));
            cv_.notify_one();
            return;
        }
    }
    // Past shutdown: keep log lines visible instead of dropping them.
    if (std::holds_alternative<LogMessage>(cmd))
    {
        fmt::print(stderr, "[rangekv::Logger-fallback] {}", format_message(std::get<LogMessage>(cmd)));
    }
    else if (std::holds_alternative<FlushCommand>(cmd))
    {
        std::get<FlushCommand>(cmd).promise->set_value();
    }
}

void Impl::report_error(std::string msg)
{
    if (error_callback_)
    {
        auto cb = error_callback_;
        callback_dispatcher_.post([cb, msg = std::move(msg)]() { cb(msg); });
    }
}

void Impl::worker_loop()
{
    std::vector<Command> local_queue;

    while (true)
    {
        bool stop_after_batch = false;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || shutdown_requested_.load(); });
            stop_after_batch = shutdown_requested_.load();
            local_queue.swap(queue_);
        }

        for (auto &cmd : local_queue)
        {
            try
            {
                std::visit(
                    [this](auto &&arg)
                    {
                        using T = std::decay_t<decltype(arg)>;
                        if constexpr (std::is_same_v<T, LogMessage>)
                        {
                            if (sink_ && arg.level >= level_.load(std::memory_order_relaxed))
                                sink_->write(arg);
                        }
                        else if constexpr (std::is_same_v<T, SetSinkCommand>)
                        {
                            const std::string old_desc = sink_ ? sink_->description() : "null";
                            const std::string new_desc =
                                arg.new_sink ? arg.new_sink->description() : "null";
                            if (sink_)
                            {
                                sink_->write(make_system_message("Switching log sink to: " + new_desc));
                                sink_->flush();
                            }
                            sink_ = std::move(arg.new_sink);
                            if (sink_)
                            {
                                sink_->write(make_system_message("Log sink switched from: " + old_desc));
                            }
                        }
                        else if constexpr (std::is_same_v<T, SinkCreationErrorCommand>)
                        {
                            report_error(arg.error_message);
                        }
                        else if constexpr (std::is_same_v<T, FlushCommand>)
                        {
                            if (sink_)
                                sink_->flush();
                            arg.promise->set_value();
                        }
                        else if constexpr (std::is_same_v<T, SetErrorCallbackCommand>)
                        {
                            error_callback_ = std::move(arg.callback);
                        }
                    },
                    cmd);
            }
            catch (const std::exception &e)
            {
                report_error(fmt::format("Logger worker error: {}", e.what()));
            }
        }
        local_queue.clear();

        if (stop_after_batch)
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (queue_.empty())
                break;
        }
    }

    if (sink_)
        sink_->flush();
}

void Impl::shutdown()
{
    if (shutdown_completed_.load() || shutdown_requested_.exchange(true))
    {
        return;
    }
    {
        // Pairs with the predicate check in worker_loop.
        std::lock_guard<std::mutex> lock(queue_mutex_);
    }
    cv_.notify_one();
    if (worker_thread_.joinable())
    {
        worker_thread_.join();
    }
    callback_dispatcher_.shutdown();
    shutdown_completed_.store(true);
}

// --- Logger Public API Implementation ---

Logger::Logger() : pImpl(std::make_unique<Impl>()) {}

Logger::~Logger() = default;

Logger &Logger::instance()
{
    // Function-local static: constructed on first use, destroyed (and drained)
    // at process exit.
    static Logger instance;
    return instance;
}

void Logger::set_console()
{
    pImpl->enqueue_command(SetSinkCommand{std::make_unique<ConsoleSink>()});
}

void Logger::set_logfile(const std::string &utf8_path)
{
    try
    {
        pImpl->enqueue_command(SetSinkCommand{std::make_unique<FileSink>(utf8_path)});
    }
    catch (const std::exception &e)
    {
        pImpl->enqueue_command(
            SinkCreationErrorCommand{fmt::format("Failed to create FileSink: {}", e.what())});
    }
}

void Logger::shutdown()
{
    pImpl->shutdown();
}

void Logger::flush()
{
    if (pImpl->shutdown_requested_.load())
        return;

    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(FlushCommand{promise});
    future.wait();
}

void Logger::set_level(Level lvl)
{
    pImpl->level_.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    return pImpl->level_.load(std::memory_order_relaxed);
}

void Logger::set_write_error_callback(std::function<void(const std::string &)> cb)
{
    pImpl->enqueue_command(SetErrorCallbackCommand{std::move(cb)});
}

bool Logger::should_log(Level lvl) const noexcept
{
    return static_cast<int>(lvl) >= static_cast<int>(pImpl->level_.load(std::memory_order_relaxed));
}

void Logger::enqueue_log(Level lvl, std::string &&body) noexcept
{
    try
    {
        pImpl->enqueue_command(
            LogMessage{lvl, std::chrono::system_clock::now(), get_native_thread_id(), std::move(body)});
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[rangekv::Logger] dropped message: {}\n", e.what());
    }
}

std::optional<Logger::Level> parse_log_level(std::string_view name) noexcept
{
    if (name == "trace") return Logger::Level::L_TRACE;
    if (name == "debug") return Logger::Level::L_DEBUG;
    if (name == "info") return Logger::Level::L_INFO;
    if (name == "warn" || name == "warning") return Logger::Level::L_WARNING;
    if (name == "error") return Logger::Level::L_ERROR;
    if (name == "system") return Logger::Level::L_SYSTEM;
    return std::nullopt;
}

} // namespace rangekv::utils

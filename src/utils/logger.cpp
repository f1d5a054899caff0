/*******************************************************************************
 * @file logger.cpp
 * @brief Implementation of the asynchronous logger.
 ******************************************************************************/
#include <condition_variable>
#include <future>
#include <mutex>
#include <thread>
#include <variant>
#include <vector>

#include "ph_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/logger.hpp"
#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"
#include "utils/logger_sinks/sink.hpp"

using namespace poolhub::format_tools;

namespace poolhub::utils
{

enum class LoggerState
{
    Uninitialized,
    Initialized,
    ShuttingDown,
    Shutdown
};

static std::atomic<LoggerState> g_logger_state{LoggerState::Uninitialized};

// Configuration calls before lifecycle startup are programming errors.
static bool logger_is_loggable(const char *function_name)
{
    const auto state = g_logger_state.load(std::memory_order_acquire);
    if (state == LoggerState::Uninitialized)
    {
        PH_PANIC("Logger method '{}' was called before the Logger module was "
                 "initialized via LifecycleManager. Aborting.",
                 function_name);
    }
    return state == LoggerState::Initialized;
}

// Command Definitions
struct SetSinkCommand
{
    std::unique_ptr<Sink> new_sink;
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

using Command = std::variant<LogMessage, SetSinkCommand, FlushCommand, SetErrorCallbackCommand>;

namespace
{
LogMessage make_system_message(fmt::memory_buffer &&body)
{
    return LogMessage{.timestamp = std::chrono::system_clock::now(),
                      .process_id = poolhub::platform::get_pid(),
                      .thread_id = poolhub::platform::get_native_thread_id(),
                      .level = static_cast<int>(Logger::Level::L_SYSTEM),
                      .body = std::move(body)};
}

template <typename Cmd> void reject_command(Cmd &cmd)
{
    if constexpr (!std::is_same_v<Cmd, LogMessage>)
    {
        if (cmd.promise)
        {
            cmd.promise->set_value(false);
        }
    }
}
} // namespace

struct Logger::Impl
{
    void start_worker();
    void worker_loop();
    bool enqueue_command(Command &&cmd);
    void report_error(const std::string &msg);
    void shutdown();

    std::function<void(const std::string &)> error_callback_;
    std::thread worker_thread_;
    std::unique_ptr<Sink> sink_ = std::make_unique<ConsoleSink>();
    size_t max_queue_size_{10000};
    std::vector<Command> queue_;
    std::condition_variable cv_;
    std::mutex queue_mutex_;
    std::atomic<Logger::Level> level_{Logger::Level::L_INFO};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> shutdown_completed_{false};
    std::atomic<size_t> messages_dropped_{0};
};

void Logger::Impl::start_worker()
{
    if (!worker_thread_.joinable())
    {
        worker_thread_ = std::thread(&Logger::Impl::worker_loop, this);
    }
}

bool Logger::Impl::enqueue_command(Command &&cmd)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_.load(std::memory_order_acquire))
        {
            std::visit([](auto &arg) { reject_command(arg); }, cmd);
            return false;
        }
        if (queue_.size() >= max_queue_size_ && std::holds_alternative<LogMessage>(cmd))
        {
            messages_dropped_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        queue_.emplace_back(std::move(cmd));
    }
    cv_.notify_one();
    return true;
}

// Runs on the worker thread.
void Logger::Impl::report_error(const std::string &msg)
{
    if (error_callback_)
    {
        error_callback_(msg);
    }
    else
    {
        fmt::print(stderr, "[LOGGER] sink error: {}\n", msg);
    }
}

void Logger::Impl::worker_loop()
{
    std::vector<Command> local_queue;

    while (true)
    {
        bool stopping = false;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || shutdown_requested_.load(); });
            local_queue.swap(queue_);
            stopping = shutdown_requested_.load() && local_queue.empty();
        }

        if (const size_t dropped = messages_dropped_.exchange(0); dropped > 0 && sink_)
        {
            sink_->write(make_system_message(make_buffer(
                             "Logger queue overflow: {} messages were dropped.", dropped)),
                         Sink::ASYNC_WRITE);
        }

        for (auto &cmd : local_queue)
        {
            try
            {
                if (auto *msg = std::get_if<LogMessage>(&cmd))
                {
                    if (sink_ &&
                        msg->level >= static_cast<int>(level_.load(std::memory_order_relaxed)))
                    {
                        sink_->write(*msg, Sink::ASYNC_WRITE);
                    }
                    continue;
                }

                std::visit(
                    [this](auto &&arg)
                    {
                        using T = std::decay_t<decltype(arg)>;
                        if constexpr (std::is_same_v<T, SetSinkCommand>)
                        {
                            const std::string old_desc = sink_ ? sink_->description() : "null";
                            if (sink_)
                            {
                                sink_->write(make_system_message(make_buffer(
                                                 "Switching log sink to: {}",
                                                 arg.new_sink->description())),
                                             Sink::ASYNC_WRITE);
                                sink_->flush();
                            }
                            sink_ = std::move(arg.new_sink);
                            sink_->write(make_system_message(
                                             make_buffer("Log sink switched from: {}", old_desc)),
                                         Sink::ASYNC_WRITE);
                            arg.promise->set_value(true);
                        }
                        else if constexpr (std::is_same_v<T, FlushCommand>)
                        {
                            if (sink_)
                            {
                                sink_->flush();
                            }
                            arg.promise->set_value(true);
                        }
                        else if constexpr (std::is_same_v<T, SetErrorCallbackCommand>)
                        {
                            error_callback_ = std::move(arg.callback);
                            arg.promise->set_value(true);
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

        if (stopping)
        {
            if (sink_)
            {
                sink_->write(make_system_message(make_buffer("Logger is shutting down.")),
                             Sink::ASYNC_WRITE);
                sink_->flush();
            }
            g_logger_state.store(LoggerState::Shutdown, std::memory_order_release);
            break;
        }
    }
}

void Logger::Impl::shutdown()
{
    if (shutdown_completed_.load() || shutdown_requested_.exchange(true))
    {
        return;
    }
    cv_.notify_one();
    if (worker_thread_.joinable())
    {
        worker_thread_.join();
    }
    shutdown_completed_.store(true);
}

// Logger Public API Implementation
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

std::optional<Logger::Level> Logger::level_from_string(std::string_view name)
{
    const std::string lowered = to_lower(trim_whitespace(name));
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

bool Logger::set_console()
{
    if (!logger_is_loggable("Logger::set_console"))
        return false;
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    if (!pImpl->enqueue_command(SetSinkCommand{std::make_unique<ConsoleSink>(), promise}))
        return false;
    return future.get();
}

bool Logger::set_logfile(const std::string &utf8_path, bool use_flock)
{
    if (!logger_is_loggable("Logger::set_logfile"))
        return false;
    std::unique_ptr<Sink> sink;
    try
    {
        sink = std::make_unique<FileSink>(utf8_path, use_flock);
    }
    catch (const std::runtime_error &e)
    {
        LOGGER_ERROR("Logger: {}", e.what());
        return false;
    }
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    if (!pImpl->enqueue_command(SetSinkCommand{std::move(sink), promise}))
        return false;
    return future.get();
}

void Logger::shutdown()
{
    if (!lifecycle_initialized())
    {
        return;
    }
    pImpl->shutdown();
}

void Logger::flush()
{
    if (!logger_is_loggable("Logger::flush"))
        return;
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    if (pImpl->enqueue_command(FlushCommand{promise}))
    {
        (void)future.get();
    }
}

void Logger::set_level(Level lvl)
{
    if (!logger_is_loggable("Logger::set_level"))
        return;
    pImpl->level_.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    if (!logger_is_loggable("Logger::level"))
        return Level::L_INFO;
    return pImpl->level_.load(std::memory_order_relaxed);
}

void Logger::set_write_error_callback(std::function<void(const std::string &)> cb)
{
    if (!logger_is_loggable("Logger::set_write_error_callback"))
        return;
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    if (pImpl->enqueue_command(SetErrorCallbackCommand{std::move(cb), promise}))
    {
        (void)future.get();
    }
}

bool Logger::should_log(Level lvl) const noexcept
{
    if (g_logger_state.load(std::memory_order_acquire) != LoggerState::Initialized)
        return false;
    return static_cast<int>(lvl) >= static_cast<int>(pImpl->level_.load(std::memory_order_relaxed));
}

bool Logger::enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept
{
    if (g_logger_state.load(std::memory_order_acquire) != LoggerState::Initialized)
        return false;
    try
    {
        return pImpl->enqueue_command(LogMessage{.timestamp = std::chrono::system_clock::now(),
                                                 .process_id = poolhub::platform::get_pid(),
                                                 .thread_id =
                                                     poolhub::platform::get_native_thread_id(),
                                                 .level = static_cast<int>(lvl),
                                                 .body = std::move(body)});
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[LOGGER] failed to enqueue message: {}\n", e.what());
        return false;
    }
}

// C-style callbacks for the lifecycle API.
void do_logger_startup(const char * /*arg*/)
{
    Logger::instance().pImpl->start_worker();
    g_logger_state.store(LoggerState::Initialized, std::memory_order_release);
}

static void do_logger_shutdown(const char * /*arg*/)
{
    LoggerState expected = LoggerState::Initialized;
    if (g_logger_state.compare_exchange_strong(expected, LoggerState::ShuttingDown,
                                               std::memory_order_acq_rel))
    {
        Logger::instance().shutdown();
        g_logger_state.store(LoggerState::Shutdown, std::memory_order_release);
    }
}

ModuleDef Logger::GetLifecycleModule()
{
    ModuleDef module("poolhub::utils::Logger");
    module.set_startup(&do_logger_startup);
    module.set_shutdown(&do_logger_shutdown, std::chrono::milliseconds(5000));
    return module;
}

} // namespace poolhub::utils

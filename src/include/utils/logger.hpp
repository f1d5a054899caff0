/*******************************************************************************
 * @file logger.hpp
 * @brief Asynchronous, thread-safe logging utility.
 *
 * **Command-Queue Pattern**
 * Calls from application threads (e.g. `LOGGER_INFO(...)`) format the message and push
 * a command onto a queue. A single worker thread is the sole consumer: it performs all
 * I/O and owns the active sink. Configuration changes (switching sink, flushing) are
 * commands too, so they are applied in order with the messages around them.
 *
 * The logger is a lifecycle module. Calling a configuration method before
 * `Logger::GetLifecycleModule()` has been started is a fatal error; log macros issued
 * before startup or after shutdown are dropped.
 *
 * @code
 * LOGGER_INFO("Pool '{}' activated with {} slots", label, size);
 * Logger::instance().set_logfile("/tmp/poolhub.log");
 * Logger::instance().set_level(Logger::Level::L_DEBUG);
 * @endcode
 ******************************************************************************/
#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "poolhub_utils_export.h"
#include "utils/module_def.hpp"

#ifndef LOGGER_FMT_BUFFER_RESERVE
#define LOGGER_FMT_BUFFER_RESERVE (1024u)
#endif

namespace poolhub::utils
{

class POOLHUB_UTILS_EXPORT Logger
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

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    ~Logger();

    /** @brief The lifecycle module that starts and stops the worker thread. */
    static ModuleDef GetLifecycleModule();

    /** @brief True once the lifecycle has started the logger (stays true after shutdown). */
    static bool lifecycle_initialized() noexcept;

    /** @brief Parses "trace", "debug", "info", "warn"/"warning", "error", "system". */
    static std::optional<Level> level_from_string(std::string_view name);

    // --- Sinks ---
    /** @brief Switch to stderr. Blocks until the worker has switched. */
    bool set_console();

    /**
     * @brief Switch to appending to a file. Blocks until the worker has switched.
     * @return false if the file could not be opened; the previous sink stays active.
     */
    bool set_logfile(const std::string &utf8_path, bool use_flock = true);

    /** @brief Blocks until every message queued before the call has been written. */
    void flush();

    /** @brief Drains the queue and stops the worker. Called by the lifecycle module. */
    void shutdown();

    void set_level(Level lvl);
    Level level() const;

    /**
     * @brief Invoked from the worker thread when a sink fails to write or open.
     */
    void set_write_error_callback(std::function<void(const std::string &)> cb);

    // --- Formatting API ---
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

    friend void do_logger_startup(const char *arg);

    bool enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept;
    bool should_log(Level lvl) const noexcept;
};

#ifndef LOGGER_COMPILE_LEVEL
#define LOGGER_COMPILE_LEVEL 0 // 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error
#endif

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
            fmt::format_to(std::back_inserter(mb), "[FORMAT ERROR] {}", ex.what());
        }
        enqueue_log(lvl, std::move(mb));
    }
}

} // namespace poolhub::utils

#define LOGGER_TRACE(fmt, ...)                                                                     \
    ::poolhub::utils::Logger::instance().trace_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...)                                                                     \
    ::poolhub::utils::Logger::instance().debug_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...)                                                                      \
    ::poolhub::utils::Logger::instance().info_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...)                                                                      \
    ::poolhub::utils::Logger::instance().warn_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...)                                                                     \
    ::poolhub::utils::Logger::instance().error_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM(fmt, ...)                                                                    \
    ::poolhub::utils::Logger::instance().system_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)

/**
 * @file debug_info.hpp
 * @brief Stack trace printing, panic handling for fatal errors, and debug messaging.
 *
 * The functions here use `fmt` for compile-time format string checks and
 * `std::source_location` for automatic source location reporting.
 */
#pragma once

#include <cstdio>
#include <cstdlib>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "poolhub_utils_export.h"
#include "utils/format_tools.hpp"

inline std::string SRCLOC_TO_STR(std::source_location loc)
{
    return fmt::format("{}:{}:{}", poolhub::format_tools::filename_only(loc.file_name()),
                       loc.line(), loc.function_name());
}

namespace poolhub::debug
{

/**
 * @brief Prints the current call stack to `stderr`.
 *
 * Uses `backtrace`, `dladdr` and `__cxa_demangle`. Not async-signal-safe.
 */
POOLHUB_UTILS_EXPORT void print_stack_trace() noexcept;

/**
 * @brief Halts the program with a fatal error message and a stack trace.
 *
 * Intended for violated programming contracts only. Recoverable conditions are
 * reported through exceptions or absent values instead.
 *
 * @param loc The source location where `panic` was called (captured by PH_PANIC).
 * @param fmt_str The `fmt`-style format string for the error message.
 */
template <typename... Args>
[[noreturn]] inline void panic(std::source_location loc, fmt::format_string<Args...> fmt_str,
                               Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[PANIC] {} -- {}\n", SRCLOC_TO_STR(loc), body);
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr,
                   "[PANIC] {} -- FATAL FORMAT ERROR WHEN PANIC fmt_str['{}']\n"
                   "[PANIC]  Exception: '{}'\n",
                   SRCLOC_TO_STR(loc), fmt::string_view(fmt_str), e.what());
    }
    std::fflush(stderr);
    print_stack_trace();
    std::abort();
}

/**
 * @brief Prints a debug message to `stderr`. Compiled in only when
 *        POOLHUB_ENABLE_DEBUG_MESSAGES is defined (see PH_DEBUG).
 */
template <typename... Args>
inline void debug_msg(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[DBG]  {}\n", body);
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr,
                   "[DBG]  FATAL FORMAT ERROR DURING DEBUG_MSG: fmt_str['{}']\n"
                   "[DBG]  Exception: '{}'\n",
                   fmt::string_view(fmt_str), e.what());
        std::fflush(stderr);
    }
}

} // namespace poolhub::debug

#ifndef PH_LOC_HERE_STR
#define PH_LOC_HERE_STR (SRCLOC_TO_STR(std::source_location::current()))
#endif

/**
 * @brief Calls `poolhub::debug::panic` with the current source location.
 */
#ifndef PH_PANIC
#define PH_PANIC(fmt, ...)                                                                         \
    ::poolhub::debug::panic(std::source_location::current(),                                       \
                            FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#endif

#ifndef PH_DEBUG
#if defined(POOLHUB_ENABLE_DEBUG_MESSAGES)
#define PH_DEBUG(fmt, ...) ::poolhub::debug::debug_msg(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#else
#define PH_DEBUG(fmt, ...)                                                                         \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif
#endif

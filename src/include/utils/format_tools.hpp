// Tools for formatting strings
#pragma once
#include <chrono>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "poolhub_utils_export.h"

namespace poolhub::format_tools
{

/**
 * @brief Formats a timestamp as local time with microsecond resolution,
 *        e.g. "2025-01-31 14:02:11.004512".
 */
POOLHUB_UTILS_EXPORT std::string formatted_time(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Returns @p str without leading and trailing ASCII whitespace.
 */
POOLHUB_UTILS_EXPORT std::string_view trim_whitespace(std::string_view str) noexcept;

/** @brief ASCII lower-case copy of @p str. */
POOLHUB_UTILS_EXPORT std::string to_lower(std::string_view str);

/**
 * @brief Formats into a fresh fmt::memory_buffer (compile-time checked format string).
 */
template <typename... Args>
fmt::memory_buffer make_buffer(fmt::format_string<Args...> fmt_str, Args &&...args)
{
    fmt::memory_buffer mb;
    mb.reserve(128);
    fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
    return mb;
}

/**
 * @brief Extracts the filename component of a path at compile time.
 */
constexpr std::string_view filename_only(std::string_view file_path) noexcept
{
    const auto last_separator_pos = file_path.find_last_of("/\\");
    if (last_separator_pos == std::string_view::npos)
    {
        return file_path;
    }
    return file_path.substr(last_separator_pos + 1);
}

} // namespace poolhub::format_tools

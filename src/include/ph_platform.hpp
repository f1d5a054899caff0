#pragma once
/**
 * @file ph_platform.hpp
 * @brief Layer 0: Platform detection and platform utility declarations.
 *
 * Every file that needs platform macros (POOLHUB_PLATFORM_LINUX, POOLHUB_IS_POSIX, etc.)
 * should include this. It is self-contained and can be included at any point.
 *
 * Prefer build-system macros (PLATFORM_LINUX, etc.); fall back to compiler predefined macros.
 * poolhub talks to its peers over AF_UNIX sockets and launches backends with fork/exec,
 * so only POSIX targets are supported.
 */
#include <cstddef>
#include <cstdint>
#include <string>

#if defined(PLATFORM_APPLE)
#define POOLHUB_PLATFORM_APPLE 1
#elif defined(PLATFORM_FREEBSD)
#define POOLHUB_PLATFORM_FREEBSD 1
#elif defined(PLATFORM_LINUX)
#define POOLHUB_PLATFORM_LINUX 1
#elif defined(__APPLE__) && defined(__MACH__)
#define POOLHUB_PLATFORM_APPLE 1
#elif defined(__FreeBSD__)
#define POOLHUB_PLATFORM_FREEBSD 1
#elif defined(__linux__)
#define POOLHUB_PLATFORM_LINUX 1
#else
#define POOLHUB_PLATFORM_UNKNOWN 1
#endif

#if defined(POOLHUB_PLATFORM_APPLE) || defined(POOLHUB_PLATFORM_FREEBSD) ||                        \
    defined(POOLHUB_PLATFORM_LINUX)
#define POOLHUB_IS_POSIX 1
#else
#error "poolhub requires a POSIX platform (Linux, macOS or FreeBSD)."
#endif

#if __cplusplus < 202002L
#error "This project requires C++20 or later. Please compile with -std=c++20 or newer."
#endif

#include "poolhub_utils_export.h"

namespace poolhub::platform
{

/**
 * @brief Gets a platform-native thread ID, suitable for logging.
 */
POOLHUB_UTILS_EXPORT uint64_t get_native_thread_id() noexcept;

/** @brief Gets the current process ID. */
POOLHUB_UTILS_EXPORT uint64_t get_pid();

/**
 * @brief Discovers the name and optionally the full path of the current executable.
 * @param include_path If `true`, returns the absolute path; otherwise only the filename.
 * @return The name or path, or "unknown" on failure.
 */
POOLHUB_UTILS_EXPORT std::string get_executable_name(bool include_path = false) noexcept;

POOLHUB_UTILS_EXPORT int get_version_major() noexcept;
POOLHUB_UTILS_EXPORT int get_version_minor() noexcept;
POOLHUB_UTILS_EXPORT int get_version_rolling() noexcept;
POOLHUB_UTILS_EXPORT const char *get_version_string() noexcept;

/**
 * @brief Checks if a process with the given PID is currently alive.
 *
 * Uses kill(pid, 0). ESRCH means dead; EPERM means alive but owned by another user.
 * PID 0 is always reported as not alive.
 */
POOLHUB_UTILS_EXPORT bool is_process_alive(uint64_t pid) noexcept;

/**
 * @brief Monotonic timestamp in nanoseconds. Use for deltas only.
 */
POOLHUB_UTILS_EXPORT uint64_t monotonic_time_ns() noexcept;

/**
 * @brief Nanoseconds elapsed since @p start_ns (a value from monotonic_time_ns()).
 * @return 0 if @p start_ns lies in the future.
 */
POOLHUB_UTILS_EXPORT uint64_t elapsed_time_ns(uint64_t start_ns) noexcept;

/**
 * @brief Wall-clock time in milliseconds since the Unix epoch.
 */
POOLHUB_UTILS_EXPORT int64_t wall_clock_ms() noexcept;

/**
 * @brief Resolves the current user's home directory ($HOME, then the passwd entry).
 * @return Empty string if neither is available.
 */
POOLHUB_UTILS_EXPORT std::string get_home_directory();

} // namespace poolhub::platform

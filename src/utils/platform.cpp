/**
 * @file platform.cpp
 * @brief POSIX implementations of the `poolhub::platform` utilities.
 *
 * Process and thread identity, executable discovery, version information,
 * liveness probing and clocks.
 */
#include "ph_base.hpp"
#include "poolhub_version.h"

#include <chrono>
#include <thread>
#include <vector>

#include <errno.h>
#include <limits.h>
#include <pwd.h>
#include <signal.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>

#ifdef POOLHUB_PLATFORM_FREEBSD
#include <sys/sysctl.h>
#endif

#if defined(POOLHUB_PLATFORM_APPLE)
#include <mach-o/dyld.h> // _NSGetExecutablePath
#endif

namespace poolhub::platform
{

uint64_t get_pid()
{
    return static_cast<uint64_t>(getpid());
}

uint64_t get_native_thread_id() noexcept
{
#if defined(POOLHUB_PLATFORM_APPLE)
    uint64_t tid;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(POOLHUB_PLATFORM_LINUX)
    return static_cast<uint64_t>(syscall(SYS_gettid));
#else
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

std::string get_executable_name(bool include_path) noexcept
{
    try
    {
        std::string full_path;
#if defined(POOLHUB_PLATFORM_LINUX)
        std::vector<char> buf(PATH_MAX);
        ssize_t count = readlink("/proc/self/exe", buf.data(), buf.size());
        if (count == -1)
        {
            return "unknown_linux";
        }
        full_path.assign(buf.data(), static_cast<size_t>(count));
#elif defined(POOLHUB_PLATFORM_APPLE)
        uint32_t size = 0;
        if (_NSGetExecutablePath(nullptr, &size) == -1 && size > 0)
        {
            std::vector<char> buf(size);
            if (_NSGetExecutablePath(buf.data(), &size) == 0)
            {
                char resolved[PATH_MAX];
                full_path = realpath(buf.data(), resolved) != nullptr ? resolved : buf.data();
            }
        }
        if (full_path.empty())
        {
            return "unknown_macos";
        }
#elif defined(POOLHUB_PLATFORM_FREEBSD)
        int mib[4] = {CTL_KERN, KERN_PROC, KERN_PROC_PATHNAME, -1};
        size_t buffer_size = 0;
        if (sysctl(mib, 4, nullptr, &buffer_size, nullptr, 0) == -1)
        {
            return "unknown_freebsd";
        }
        std::vector<char> buf(buffer_size);
        if (sysctl(mib, 4, buf.data(), &buffer_size, nullptr, 0) == -1)
        {
            return "unknown_freebsd";
        }
        full_path.assign(buf.data(), buffer_size - 1);
#endif

        if (include_path)
        {
            return full_path;
        }
        return std::filesystem::path(full_path).filename().string();
    }
    catch (const std::exception &e)
    {
        // std::filesystem operations can throw on invalid paths.
        fmt::print(stderr, "Warning: get_executable_name failed: {}.\n", e.what());
    }
    return "unknown";
}

// --- Version information (from poolhub_version.h, generated at configure time) ---

int get_version_major() noexcept
{
    return POOLHUB_VERSION_MAJOR;
}

int get_version_minor() noexcept
{
    return POOLHUB_VERSION_MINOR;
}

int get_version_rolling() noexcept
{
    return POOLHUB_VERSION_ROLLING;
}

const char *get_version_string() noexcept
{
    return POOLHUB_VERSION_STRING;
}

bool is_process_alive(uint64_t pid) noexcept
{
    if (pid == 0)
    {
        return false;
    }
    if (kill(static_cast<pid_t>(pid), 0) == 0)
    {
        return true;
    }
    // ESRCH: no such process. EPERM: exists, but we may not signal it.
    return errno != ESRCH;
}

uint64_t monotonic_time_ns() noexcept
{
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                     std::chrono::steady_clock::now().time_since_epoch())
                                     .count());
}

uint64_t elapsed_time_ns(uint64_t start_ns) noexcept
{
    uint64_t now = monotonic_time_ns();
    if (now < start_ns)
    {
        return 0;
    }
    return now - start_ns;
}

int64_t wall_clock_ms() noexcept
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::string get_home_directory()
{
    if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0')
    {
        return home;
    }
    std::vector<char> buf(16384);
    struct passwd pwd{};
    struct passwd *result = nullptr;
    if (getpwuid_r(getuid(), &pwd, buf.data(), buf.size(), &result) == 0 && result != nullptr &&
        result->pw_dir != nullptr)
    {
        return result->pw_dir;
    }
    return {};
}

} // namespace poolhub::platform

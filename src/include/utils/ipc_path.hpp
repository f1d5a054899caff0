#pragma once
/**
 * @file ipc_path.hpp
 * @brief Well-known per-user locations of the pool endpoint and its leader lockfile.
 *
 * Layout under the state directory (default `~/.poolhub`):
 *   - `pool.sock`  AF_UNIX stream socket of the current leader
 *   - `pool.lock`  JSON `{pid, timestamp}` record of the current leader
 */
#include "ph_base.hpp"

#include <filesystem>
#include <string>

namespace poolhub::utils
{

struct POOLHUB_UTILS_EXPORT IpcPaths
{
    std::filesystem::path state_dir;
    std::filesystem::path socket_path;
    std::filesystem::path lock_path;

    static constexpr const char *kSocketName = "pool.sock";
    static constexpr const char *kLockName = "pool.lock";
    static constexpr const char *kStateDirEnv = "POOLHUB_STATE_DIR";

    /** @brief Paths rooted at @p state_dir. */
    static IpcPaths under(const std::filesystem::path &state_dir);

    /**
     * @brief `$POOLHUB_STATE_DIR` if set, otherwise `<home>/.poolhub`.
     * @throws std::runtime_error if no home directory can be determined.
     */
    static std::filesystem::path default_state_dir();
};

/**
 * @brief Creates the state directory (mode 0700) if it does not exist.
 * @throws std::filesystem::filesystem_error on failure.
 */
POOLHUB_UTILS_EXPORT void ensure_state_dir(const IpcPaths &paths);

/**
 * @brief Removes a socket file left behind by a leader that did not shut down cleanly.
 *        A missing file is not an error.
 */
POOLHUB_UTILS_EXPORT void cleanup_stale_endpoint(const IpcPaths &paths);

/** @brief True if the socket file exists, i.e. a connect attempt is worth making. */
POOLHUB_UTILS_EXPORT bool endpoint_may_exist(const IpcPaths &paths);

} // namespace poolhub::utils

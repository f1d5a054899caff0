#include "ph_base.hpp"
#include "utils/ipc_path.hpp"

#include <cstdlib>
#include <stdexcept>

namespace fs = std::filesystem;

namespace poolhub::utils
{

IpcPaths IpcPaths::under(const fs::path &state_dir)
{
    IpcPaths paths;
    paths.state_dir = state_dir;
    paths.socket_path = state_dir / kSocketName;
    paths.lock_path = state_dir / kLockName;
    return paths;
}

fs::path IpcPaths::default_state_dir()
{
    if (const char *env = std::getenv(kStateDirEnv); env != nullptr && *env != '\0')
    {
        return fs::path(env);
    }
    const std::string home = poolhub::platform::get_home_directory();
    if (home.empty())
    {
        throw std::runtime_error("IpcPaths: cannot determine the home directory for the "
                                 "state directory; set POOLHUB_STATE_DIR");
    }
    return fs::path(home) / ".poolhub";
}

void ensure_state_dir(const IpcPaths &paths)
{
    if (fs::create_directories(paths.state_dir))
    {
        fs::permissions(paths.state_dir, fs::perms::owner_all, fs::perm_options::replace);
    }
}

void cleanup_stale_endpoint(const IpcPaths &paths)
{
    std::error_code ec;
    if (fs::remove(paths.socket_path, ec))
    {
        PH_DEBUG("Removed stale endpoint {}", paths.socket_path.string());
    }
}

bool endpoint_may_exist(const IpcPaths &paths)
{
    std::error_code ec;
    return fs::exists(paths.socket_path, ec);
}

} // namespace poolhub::utils

#pragma once
/**
 * @file pool_config.hpp
 * @brief Runtime configuration of the pool server, its backends and the host process.
 *
 * Loading strategy (priority low → high):
 *  1. Built-in defaults (the member initializers below)
 *  2. poolhub.default.json found in the config directory next to the executable
 *  3. <state_dir>/poolhub.json  user customisations, merged on top
 *  4. An explicit file (`--config` or POOLHUB_CONFIG_FILE) replaces both file sources
 *  5. POOLHUB_MODEL / POOLHUB_STATE_DIR / POOLHUB_BACKEND / POOLHUB_LOG_LEVEL overrides
 */
#include "ph_base.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace poolhub::utils
{

/** @brief Thrown for unreadable explicit config files and invalid values. */
class ConfigError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

struct POOLHUB_UTILS_EXPORT PoolConfig
{
    std::string model{"haiku"};

    int completion_pool_size{2};
    int completion_max_reuses{8};
    int command_max_reuses{24};

    /// argv prefix of the backend; the stream-json flags are appended to it.
    std::vector<std::string> backend_command{"claude"};
    std::vector<std::string> backend_extra_args;
    /// Working directory of backend sessions. Empty means the state directory.
    std::string cwd;

    /// Empty means IpcPaths::default_state_dir().
    std::string state_dir;

    std::string log_level{"info"};
    std::string log_file;

    std::string completion_system_prompt;
    std::string command_system_prompt;

    /**
     * @brief Applies the recognised keys of @p j on top of the current values.
     * @throws ConfigError on a wrongly typed or out-of-range value.
     */
    void apply_json(const nlohmann::json &j);

    /** @brief Serializes every field (same layout apply_json() reads). */
    [[nodiscard]] nlohmann::json to_json() const;

    /**
     * @brief Throws ConfigError unless sizes are positive and a backend command is set.
     */
    void validate() const;

    /** @brief The state directory after defaults are applied. */
    [[nodiscard]] std::filesystem::path resolved_state_dir() const;

    /**
     * @brief Performs the layered load described in the file header.
     * @param explicit_file Optional file that replaces the default and user files.
     * @throws ConfigError if @p explicit_file (or POOLHUB_CONFIG_FILE) cannot be parsed,
     *         or the merged result is invalid.
     */
    static PoolConfig load(const std::filesystem::path &explicit_file = {});

    /** @brief `<root>/config` or `<bin>/config` relative to the executable, if present. */
    static std::filesystem::path discover_config_dir();
};

/// Recursively merges `overrides` into `base` (object keys override, arrays replace).
POOLHUB_UTILS_EXPORT void json_merge(nlohmann::json &base, const nlohmann::json &overrides);

} // namespace poolhub::utils

/**
 * @file pool_config.cpp
 * @brief Layered JSON configuration loading for poolhub.
 */
#include "ph_base.hpp"
#include "utils/ipc_path.hpp"
#include "utils/logger.hpp"
#include "utils/pool_config.hpp"

#include <cstdlib>
#include <fstream>

namespace fs = std::filesystem;

namespace poolhub::utils
{

namespace
{

constexpr const char *kDefaultFileName = "poolhub.default.json";
constexpr const char *kUserFileName = "poolhub.json";

/// Reads a JSON file. A missing file yields a null value; a malformed one throws.
nlohmann::json read_json_file(const fs::path &path)
{
    std::ifstream f(path);
    if (!f.is_open())
        return nlohmann::json{};
    try
    {
        return nlohmann::json::parse(f);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw ConfigError(fmt::format("PoolConfig: '{}' is not valid JSON: {}", path.string(),
                                      e.what()));
    }
}

std::vector<std::string> split_command(std::string_view text)
{
    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos < text.size())
    {
        const size_t start = text.find_first_not_of(' ', pos);
        if (start == std::string_view::npos)
            break;
        const size_t end = text.find(' ', start);
        parts.emplace_back(text.substr(start, end == std::string_view::npos ? end : end - start));
        pos = end == std::string_view::npos ? text.size() : end;
    }
    return parts;
}

} // namespace

void json_merge(nlohmann::json &base, const nlohmann::json &overrides)
{
    if (!overrides.is_object())
        return;
    for (auto it = overrides.begin(); it != overrides.end(); ++it)
    {
        if (it.value().is_object() && base.contains(it.key()) && base.at(it.key()).is_object())
        {
            json_merge(base[it.key()], it.value());
        }
        else
        {
            base[it.key()] = it.value();
        }
    }
}

void PoolConfig::apply_json(const nlohmann::json &j)
{
    if (!j.is_object())
    {
        return;
    }
    try
    {
        if (j.contains("model"))
            model = j.at("model").get<std::string>();
        if (j.contains("pools"))
        {
            const auto &p = j.at("pools");
            if (p.contains("completion_size"))
                completion_pool_size = p.at("completion_size").get<int>();
            if (p.contains("completion_max_reuses"))
                completion_max_reuses = p.at("completion_max_reuses").get<int>();
            if (p.contains("command_max_reuses"))
                command_max_reuses = p.at("command_max_reuses").get<int>();
        }
        if (j.contains("backend"))
        {
            const auto &b = j.at("backend");
            if (b.contains("command"))
                backend_command = b.at("command").get<std::vector<std::string>>();
            if (b.contains("extra_args"))
                backend_extra_args = b.at("extra_args").get<std::vector<std::string>>();
            if (b.contains("cwd"))
                cwd = b.at("cwd").get<std::string>();
        }
        if (j.contains("state_dir"))
            state_dir = j.at("state_dir").get<std::string>();
        if (j.contains("logging"))
        {
            const auto &l = j.at("logging");
            if (l.contains("level"))
                log_level = l.at("level").get<std::string>();
            if (l.contains("file"))
                log_file = l.at("file").get<std::string>();
        }
        if (j.contains("system_prompts"))
        {
            const auto &s = j.at("system_prompts");
            if (s.contains("completion"))
                completion_system_prompt = s.at("completion").get<std::string>();
            if (s.contains("command"))
                command_system_prompt = s.at("command").get<std::string>();
        }
    }
    catch (const nlohmann::json::exception &e)
    {
        throw ConfigError(fmt::format("PoolConfig: invalid value: {}", e.what()));
    }
}

nlohmann::json PoolConfig::to_json() const
{
    return nlohmann::json{
        {"model", model},
        {"pools",
         {{"completion_size", completion_pool_size},
          {"completion_max_reuses", completion_max_reuses},
          {"command_max_reuses", command_max_reuses}}},
        {"backend", {{"command", backend_command}, {"extra_args", backend_extra_args}, {"cwd", cwd}}},
        {"state_dir", state_dir},
        {"logging", {{"level", log_level}, {"file", log_file}}},
        {"system_prompts",
         {{"completion", completion_system_prompt}, {"command", command_system_prompt}}},
    };
}

void PoolConfig::validate() const
{
    if (model.empty())
        throw ConfigError("PoolConfig: 'model' must not be empty");
    if (completion_pool_size < 1)
        throw ConfigError("PoolConfig: 'pools.completion_size' must be at least 1");
    if (completion_max_reuses < 1 || command_max_reuses < 1)
        throw ConfigError("PoolConfig: max reuse counts must be at least 1");
    if (backend_command.empty() || backend_command.front().empty())
        throw ConfigError("PoolConfig: 'backend.command' must name an executable");
    if (!Logger::level_from_string(log_level))
        throw ConfigError(fmt::format("PoolConfig: unknown log level '{}'", log_level));
}

fs::path PoolConfig::resolved_state_dir() const
{
    if (!state_dir.empty())
        return fs::path(state_dir);
    return IpcPaths::default_state_dir();
}

fs::path PoolConfig::discover_config_dir()
{
    const std::string exe = platform::get_executable_name(/*include_path=*/true);
    if (exe.empty() || exe.rfind("unknown", 0) == 0)
        return {};
    const fs::path bin = fs::path(exe).parent_path();
    std::error_code ec;
    // Staged layout: <root>/bin/ + <root>/config/
    if (fs::is_directory(bin / ".." / "config", ec))
        return fs::weakly_canonical(bin / ".." / "config", ec);
    // Flat layout: config/ next to the binary
    if (fs::is_directory(bin / "config", ec))
        return fs::weakly_canonical(bin / "config", ec);
    return {};
}

PoolConfig PoolConfig::load(const fs::path &explicit_file)
{
    PoolConfig config;
    nlohmann::json merged = nlohmann::json::object();

    fs::path override_path = explicit_file;
    if (override_path.empty())
    {
        if (const char *env = std::getenv("POOLHUB_CONFIG_FILE"); env != nullptr && *env != '\0')
            override_path = env;
    }

    if (!override_path.empty())
    {
        nlohmann::json j = read_json_file(override_path);
        if (j.is_null())
            throw ConfigError(fmt::format("PoolConfig: cannot read '{}'", override_path.string()));
        LOGGER_INFO("PoolConfig: loading override file '{}'", override_path.string());
        merged = std::move(j);
    }
    else
    {
        if (const fs::path cfg_dir = discover_config_dir(); !cfg_dir.empty())
        {
            nlohmann::json defaults = read_json_file(cfg_dir / kDefaultFileName);
            if (defaults.is_object())
            {
                LOGGER_DEBUG("PoolConfig: loaded defaults from '{}'", cfg_dir.string());
                json_merge(merged, defaults);
            }
        }
        // The user file lives in the state directory, which the defaults may relocate.
        PoolConfig staged;
        staged.apply_json(merged);
        if (const char *env = std::getenv(IpcPaths::kStateDirEnv); env != nullptr && *env != '\0')
            staged.state_dir = env;
        const fs::path user_file = staged.resolved_state_dir() / kUserFileName;
        nlohmann::json user = read_json_file(user_file);
        if (user.is_object())
        {
            LOGGER_INFO("PoolConfig: merging user file '{}'", user_file.string());
            json_merge(merged, user);
        }
    }
    config.apply_json(merged);

    if (const char *env = std::getenv("POOLHUB_MODEL"); env != nullptr && *env != '\0')
        config.model = env;
    if (const char *env = std::getenv(IpcPaths::kStateDirEnv); env != nullptr && *env != '\0')
        config.state_dir = env;
    if (const char *env = std::getenv("POOLHUB_BACKEND"); env != nullptr && *env != '\0')
        config.backend_command = split_command(env);
    if (const char *env = std::getenv("POOLHUB_LOG_LEVEL"); env != nullptr && *env != '\0')
        config.log_level = env;

    config.validate();
    return config;
}

} // namespace poolhub::utils

/**
 * @file poolhub.cpp
 * @brief poolhub command-line entry point.
 *
 * Every invocation is an ordinary pool participant: it joins the running leader over the
 * socket or, when there is none, becomes the leader itself. `serve` keeps a leader (or
 * standby follower) alive until SIGINT/SIGTERM; the other commands issue one request
 * and exit.
 *
 * Shutdown sequence for `serve`
 * -----------------------------
 * 1. SIGINT / SIGTERM sets `g_shutdown_requested`.
 * 2. main() disposes the PoolClient (a leader broadcasts server-shutting-down, kills its
 *    sessions and releases the lock), then stops the EventLoop.
 * 3. LifecycleGuard tears down EventLoop setup and the Logger in reverse order.
 *
 * A second signal during shutdown exits immediately.
 */
#include "ph_pool.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <string>
#include <thread>
#include <vector>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

using namespace poolhub;

namespace
{

std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int /*sig*/) noexcept
{
    if (g_shutdown_requested.load(std::memory_order_relaxed))
    {
        std::_Exit(1);
    }
    g_shutdown_requested.store(true, std::memory_order_relaxed);
}

void print_usage()
{
    fmt::print(stderr,
               "Usage: poolhub [--config <file>] [--state-dir <dir>] [--log-level <level>] "
               "<command> [<args>]\n"
               "Commands:\n"
               "  serve                      Join or lead the pool until SIGINT/SIGTERM.\n"
               "  status                     Print the status of the running pool as JSON.\n"
               "  complete <prefix> [suffix] Request one completion at the cursor.\n"
               "  command <message> [--timeout <ms>]\n"
               "                             Send a one-shot prompt to the command pool.\n"
               "  recycle                    Recycle every session of the running pool.\n"
               "  shutdown                   Ask the running leader to shut down.\n");
}

struct CliArgs
{
    std::string config_file;
    std::string state_dir;
    std::string log_level;
    std::string command;
    std::vector<std::string> positional;
    std::optional<int> timeout_ms;
};

/// @return false on a usage error.
bool parse_args(int argc, char *argv[], CliArgs &args)
{
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        auto next_value = [&](std::string &out)
        {
            if (i + 1 >= argc)
            {
                fmt::print(stderr, "poolhub: {} needs a value\n", arg);
                return false;
            }
            out = argv[++i];
            return true;
        };
        if (arg == "-h" || arg == "--help")
        {
            return false;
        }
        if (arg == "--config")
        {
            if (!next_value(args.config_file))
                return false;
        }
        else if (arg == "--state-dir")
        {
            if (!next_value(args.state_dir))
                return false;
        }
        else if (arg == "--log-level")
        {
            if (!next_value(args.log_level))
                return false;
        }
        else if (arg == "--timeout")
        {
            std::string value;
            if (!next_value(value))
                return false;
            try
            {
                args.timeout_ms = std::stoi(value);
            }
            catch (const std::logic_error &)
            {
                fmt::print(stderr, "poolhub: invalid --timeout value '{}'\n", value);
                return false;
            }
        }
        else if (args.command.empty())
        {
            args.command = arg;
        }
        else
        {
            args.positional.push_back(arg);
        }
    }
    return !args.command.empty();
}

void configure_logger(const utils::PoolConfig &config)
{
    auto &logger = utils::Logger::instance();
    if (const auto level = utils::Logger::level_from_string(config.log_level))
    {
        logger.set_level(*level);
    }
    if (!config.log_file.empty() && !logger.set_logfile(config.log_file))
    {
        LOGGER_WARN("poolhub: cannot open log file {}, logging to the console",
                    config.log_file);
    }
}

int run_serve(ipc::PoolClient &client)
{
    const ipc::Role role = client.activate();
    LOGGER_INFO("poolhub: serving as {}. Send SIGINT to stop.", ipc::to_string(role));
    while (!g_shutdown_requested.load(std::memory_order_relaxed))
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    LOGGER_INFO("poolhub: shutdown requested");
    client.dispose();
    return 0;
}

int run_command(const CliArgs &args, const utils::PoolConfig &config, ipc::PoolClient &client)
{
    const std::string &cmd = args.command;
    const bool needs_running_leader = cmd == "status" || cmd == "recycle" || cmd == "shutdown";
    if (needs_running_leader &&
        !utils::endpoint_may_exist(utils::IpcPaths::under(config.resolved_state_dir())))
    {
        fmt::print(stderr, "poolhub: no pool server is running\n");
        return 1;
    }

    client.activate();

    if (cmd == "status")
    {
        const auto status = client.get_pool_status();
        if (!status)
        {
            fmt::print(stderr, "poolhub: status request failed\n");
            return 1;
        }
        fmt::print("{}\n", status->dump(2));
        return 0;
    }
    if (cmd == "complete")
    {
        if (args.positional.empty())
        {
            print_usage();
            return 2;
        }
        pool::CompletionContext ctx;
        ctx.prefix = args.positional[0];
        ctx.suffix = args.positional.size() > 1 ? args.positional[1] : std::string{};
        const auto completion = client.get_completion(ctx);
        if (!completion)
        {
            fmt::print(stderr, "poolhub: no completion\n");
            return 1;
        }
        fmt::print("{}\n", *completion);
        return 0;
    }
    if (cmd == "command")
    {
        if (args.positional.empty())
        {
            print_usage();
            return 2;
        }
        const pool::CommandResult result = client.send_command(args.positional[0], args.timeout_ms);
        if (!result.text)
        {
            fmt::print(stderr, "poolhub: command produced no result\n");
            return 1;
        }
        fmt::print("{}\n", *result.text);
        if (result.meta)
        {
            LOGGER_DEBUG("poolhub: command meta {}", result.meta->dump());
        }
        return 0;
    }
    if (cmd == "recycle")
    {
        return client.recycle_all() ? 0 : 1;
    }
    if (cmd == "shutdown")
    {
        return client.shutdown_server() ? 0 : 1;
    }

    fmt::print(stderr, "poolhub: unknown command '{}'\n", cmd);
    print_usage();
    return 2;
}

} // namespace

int main(int argc, char *argv[])
{
    CliArgs args;
    if (!parse_args(argc, argv, args))
    {
        print_usage();
        return 2;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    utils::LifecycleGuard app_lifecycle(utils::MakeModDefList(
        utils::Logger::GetLifecycleModule(), utils::EventLoop::GetLifecycleModule()));

    utils::PoolConfig config;
    try
    {
        config = utils::PoolConfig::load(args.config_file);
        if (!args.state_dir.empty())
        {
            config.state_dir = args.state_dir;
        }
        if (!args.log_level.empty())
        {
            config.log_level = args.log_level;
        }
        config.validate();
    }
    catch (const utils::ConfigError &e)
    {
        fmt::print(stderr, "poolhub: configuration error: {}\n", e.what());
        return 2;
    }
    configure_logger(config);

    utils::EventLoop loop;
    loop.start();

    int rc = 0;
    {
        ipc::PoolClient::Options options;
        options.config = config;
        options.on_degraded = [](ipc::PoolKind pool)
        { LOGGER_ERROR("poolhub: {} pool is degraded", ipc::to_string(pool)); };
        options.on_role_change = [](ipc::Role role)
        { LOGGER_INFO("poolhub: role is now {}", ipc::to_string(role)); };
        ipc::PoolClient client(loop, std::move(options));

        rc = args.command == "serve" ? run_serve(client) : run_command(args, config, client);
    }

    loop.stop();
    return rc;
}

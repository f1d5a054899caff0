/**
 * @file session_channel_workers.cpp
 * @brief Worker processes that run real backend subprocesses (tests/fake_backend).
 *
 * Child processes, SIGPIPE handling and the Logger are process-wide concerns, so these
 * scenarios run under their own lifecycle instead of inside the test runner.
 */
#include "session_channel_workers.h"
#include "ph_pool.hpp"
#include "shared_test_helpers.h"
#include "test_entrypoint.h"

#include <gtest/gtest.h>

#include <cerrno>
#include <csignal>
#include <fstream>
#include <future>
#include <mutex>
#include <thread>

using namespace poolhub;
using namespace poolhub::pool;
using namespace poolhub::utils;
using namespace poolhub::tests::helper;
using namespace std::chrono_literals;

namespace
{

constexpr auto kWait = std::chrono::seconds(10);

/// Everything a channel reported, filled in on the loop thread.
struct Recorder
{
    std::mutex mu;
    std::vector<nlohmann::json> events;
    std::vector<std::string> ends;

    SessionChannel::EventHandler event_handler()
    {
        return [this](const nlohmann::json &event)
        {
            std::lock_guard<std::mutex> lock(mu);
            events.push_back(event);
        };
    }

    SessionChannel::EndHandler end_handler()
    {
        return [this](const std::string &reason)
        {
            std::lock_guard<std::mutex> lock(mu);
            ends.push_back(reason);
        };
    }

    std::vector<std::string> results()
    {
        std::lock_guard<std::mutex> lock(mu);
        std::vector<std::string> out;
        for (const auto &e : events)
        {
            if (e.value("type", "") == "result")
                out.push_back(e.value("result", ""));
        }
        return out;
    }

    size_t count_type(const std::string &type)
    {
        std::lock_guard<std::mutex> lock(mu);
        return static_cast<size_t>(std::count_if(events.begin(), events.end(),
                                                 [&](const nlohmann::json &e)
                                                 { return e.value("type", "") == type; }));
    }

    size_t end_count()
    {
        std::lock_guard<std::mutex> lock(mu);
        return ends.size();
    }
};

/// Owns an object that must be created and destroyed on the loop thread.
template <typename T> class OnLoop
{
  public:
    explicit OnLoop(EventLoop &loop) : m_loop(loop) {}
    ~OnLoop()
    {
        if (m_loop.running())
            m_loop.run_sync([this] { m_obj.reset(); });
    }

    template <typename Make> void create(Make make)
    {
        m_loop.run_sync([&] { m_obj = make(); });
    }

    T *operator->() const { return m_obj.get(); }
    T &operator*() const { return *m_obj; }

  private:
    EventLoop &m_loop;
    std::unique_ptr<T> m_obj;
};

std::vector<int> spawned_pids(const std::string &spawn_log)
{
    std::vector<int> pids;
    std::ifstream in(spawn_log);
    std::string line;
    while (std::getline(in, line))
    {
        if (line.rfind("pid=", 0) == 0)
            pids.push_back(std::atoi(line.c_str() + 4));
    }
    return pids;
}

} // namespace

namespace poolhub::tests::worker::session_channel
{

int round_trip(const std::string &backend)
{
    return run_gtest_worker(
        [&]()
        {
            EventLoop loop;
            loop.start();
            SubprocessChannelFactory factory({backend});
            Recorder rec;
            OnLoop<SessionChannel> channel(loop);
            ChannelOptions options;
            options.model = "fake-model";
            channel.create([&]
                           { return factory.open(loop, options, rec.event_handler(),
                                                 rec.end_handler()); });

            loop.run_sync([&] { channel->push(CommandPool::kWarmupMessage); });
            ASSERT_TRUE(wait_until([&] { return rec.results().size() == 1; }, kWait));
            EXPECT_EQ(rec.results()[0], "READY");

            // A message with embedded newlines still travels as one stdin line.
            loop.run_sync([&] { channel->push("line one\nline two"); });
            ASSERT_TRUE(wait_until([&] { return rec.results().size() == 2; }, kWait));
            EXPECT_EQ(rec.results()[1], "echo: line one\nline two");
            EXPECT_EQ(rec.count_type("system"), 1u);
            EXPECT_EQ(rec.count_type("assistant"), 2u);

            const bool open_before = loop.run_sync([&] { return channel->is_open(); });
            EXPECT_TRUE(open_before);
            loop.run_sync([&] { channel->close(); });
            EXPECT_FALSE(loop.run_sync([&] { return channel->is_open(); }));
            // Pushing after close is ignored.
            loop.run_sync([&] { channel->push("ignored"); });
            std::this_thread::sleep_for(100ms);
            EXPECT_EQ(rec.results().size(), 2u);
            EXPECT_EQ(rec.end_count(), 0u);
        },
        "session_channel::round_trip", Logger::GetLifecycleModule(),
        EventLoop::GetLifecycleModule());
}

int crash_reported(const std::string &backend)
{
    return run_gtest_worker(
        [&]()
        {
            EventLoop loop;
            loop.start();
            SubprocessChannelFactory factory({backend});
            Recorder rec;
            OnLoop<SessionChannel> channel(loop);
            ChannelOptions options;
            options.extra_args = {"--crash-after", "0"};
            channel.create([&]
                           { return factory.open(loop, options, rec.event_handler(),
                                                 rec.end_handler()); });

            loop.run_sync([&] { channel->push(CommandPool::kWarmupMessage); });
            ASSERT_TRUE(wait_until([&] { return rec.results().size() == 1; }, kWait));

            loop.run_sync([&] { channel->push("first request"); });
            ASSERT_TRUE(wait_until([&] { return rec.end_count() == 1; }, kWait));
            EXPECT_FALSE(loop.run_sync([&] { return channel->is_open(); }));
            EXPECT_EQ(rec.results().size(), 1u);

            // The end handler fires exactly once.
            loop.run_sync([&] { channel->push("after the end"); });
            std::this_thread::sleep_for(100ms);
            EXPECT_EQ(rec.end_count(), 1u);
        },
        "session_channel::crash_reported", Logger::GetLifecycleModule(),
        EventLoop::GetLifecycleModule());
}

int exit_immediately(const std::string &backend)
{
    return run_gtest_worker(
        [&]()
        {
            EventLoop loop;
            loop.start();
            SubprocessChannelFactory factory({backend});
            Recorder rec;
            OnLoop<SessionChannel> channel(loop);
            ChannelOptions options;
            options.extra_args = {"--exit-immediately"};
            channel.create([&]
                           { return factory.open(loop, options, rec.event_handler(),
                                                 rec.end_handler()); });

            ASSERT_TRUE(wait_until([&] { return rec.end_count() == 1; }, kWait));
            EXPECT_EQ(rec.count_type("system"), 0u);
            EXPECT_FALSE(loop.run_sync([&] { return channel->is_open(); }));
        },
        "session_channel::exit_immediately", Logger::GetLifecycleModule(),
        EventLoop::GetLifecycleModule());
}

int close_terminates(const std::string &backend, const std::string &spawn_log)
{
    return run_gtest_worker(
        [&]()
        {
            EventLoop loop;
            loop.start();
            SubprocessChannelFactory factory({backend});
            Recorder rec;
            OnLoop<SessionChannel> channel(loop);
            ChannelOptions options;
            options.extra_args = {"--hang", "--spawn-log", spawn_log};
            channel.create([&]
                           { return factory.open(loop, options, rec.event_handler(),
                                                 rec.end_handler()); });

            loop.run_sync([&] { channel->push(CommandPool::kWarmupMessage); });
            ASSERT_TRUE(wait_until([&] { return rec.results().size() == 1; }, kWait));
            loop.run_sync([&] { channel->push("never answered"); });

            const std::vector<int> pids = spawned_pids(spawn_log);
            ASSERT_EQ(pids.size(), 1u);
            const pid_t child = pids[0];
            ASSERT_EQ(::kill(child, 0), 0);

            loop.run_sync([&] { channel->close(); });
            // Reaped after SIGTERM, or after SIGKILL once the grace period expires.
            EXPECT_TRUE(wait_until([&] { return ::kill(child, 0) == -1 && errno == ESRCH; },
                                   kWait));
            EXPECT_EQ(rec.end_count(), 0u);
            EXPECT_EQ(rec.results().size(), 1u);
        },
        "session_channel::close_terminates", Logger::GetLifecycleModule(),
        EventLoop::GetLifecycleModule());
}

int pools_end_to_end(const std::string &backend)
{
    return run_gtest_worker(
        [&]()
        {
            EventLoop loop;
            loop.start();
            auto factory = std::make_shared<SubprocessChannelFactory>(std::vector<std::string>{backend});

            OnLoop<CompletionPool> completions(loop);
            OnLoop<CommandPool> commands(loop);
            auto warm = std::make_shared<std::promise<void>>();
            auto warm_cmd = std::make_shared<std::promise<void>>();
            auto warmed = warm->get_future();
            auto warmed_cmd = warm_cmd->get_future();
            completions.create(
                [&]
                {
                    CompletionPoolOptions opts;
                    opts.model = "fake-completion";
                    opts.extra_args = {"--completion-text", " tail"};
                    opts.size = 2;
                    auto p = std::make_unique<CompletionPool>(loop, factory, opts);
                    p->activate([warm] { warm->set_value(); });
                    return p;
                });
            commands.create(
                [&]
                {
                    CommandPoolOptions opts;
                    opts.model = "fake-command";
                    auto p = std::make_unique<CommandPool>(loop, factory, opts);
                    p->activate([warm_cmd] { warm_cmd->set_value(); });
                    return p;
                });
            ASSERT_EQ(warmed.wait_for(kWait), std::future_status::ready);
            ASSERT_EQ(warmed_cmd.wait_for(kWait), std::future_status::ready);
            ASSERT_TRUE(loop.run_sync([&] { return completions->is_available(); }));

            auto completion = std::make_shared<std::promise<std::optional<std::string>>>();
            auto completion_future = completion->get_future();
            loop.run_sync(
                [&]
                {
                    CompletionContext ctx;
                    ctx.prefix = "Hello";
                    ctx.suffix = "\n";
                    completions->get_completion(ctx, {},
                                                [completion](std::optional<std::string> text)
                                                { completion->set_value(std::move(text)); });
                });
            ASSERT_EQ(completion_future.wait_for(kWait), std::future_status::ready);
            EXPECT_EQ(completion_future.get(), " tail");

            auto reply = std::make_shared<std::promise<CommandResult>>();
            auto reply_future = reply->get_future();
            loop.run_sync(
                [&]
                {
                    commands->send_prompt("summarize", 5000,
                                          [reply](CommandResult r) { reply->set_value(std::move(r)); });
                });
            ASSERT_EQ(reply_future.wait_for(kWait), std::future_status::ready);
            const CommandResult result = reply_future.get();
            ASSERT_TRUE(result.text.has_value());
            EXPECT_EQ(*result.text, "echo: summarize");
            ASSERT_TRUE(result.meta.has_value());
            EXPECT_EQ((*result.meta)["model"], "fake-command");
            EXPECT_EQ((*result.meta)["inputTokens"], 10);
            EXPECT_EQ((*result.meta)["cacheReadInputTokens"], 2);
            EXPECT_EQ((*result.meta)["durationApiMs"], 10);

            const nlohmann::json stats = loop.run_sync([&] { return completions->stats().to_json(); });
            EXPECT_EQ(stats["totalRequests"], 1);
            // Two warm-ups plus one completion.
            EXPECT_EQ(stats["totalInputTokens"], 30);
            EXPECT_EQ(stats["totalOutputTokens"], 15);
        },
        "session_channel::pools_end_to_end", Logger::GetLifecycleModule(),
        EventLoop::GetLifecycleModule());
}

int warmup_failure_degrades(const std::string &backend, const std::string &spawn_log)
{
    return run_gtest_worker(
        [&]()
        {
            EventLoop loop;
            loop.start();
            auto factory = std::make_shared<SubprocessChannelFactory>(std::vector<std::string>{backend});
            std::atomic<int> degraded{0};

            OnLoop<CompletionPool> pool(loop);
            pool.create(
                [&]
                {
                    CompletionPoolOptions opts;
                    opts.extra_args = {"--warmup-fail", "--spawn-log", spawn_log};
                    opts.size = 2;
                    auto p = std::make_unique<CompletionPool>(loop, factory, opts);
                    p->set_on_degraded([&degraded] { degraded++; });
                    p->activate();
                    return p;
                });

            ASSERT_TRUE(wait_until([&] { return degraded.load() == 1; }, kWait));
            EXPECT_FALSE(loop.run_sync([&] { return pool->is_available(); }));
            // One attempt plus one retry. A sibling killed mid-start may never log itself.
            const size_t spawned = spawned_pids(spawn_log).size();
            EXPECT_GE(spawned, 2u);
            EXPECT_LE(spawned, 4u);
        },
        "session_channel::warmup_failure_degrades", Logger::GetLifecycleModule(),
        EventLoop::GetLifecycleModule());
}

} // namespace poolhub::tests::worker::session_channel

namespace
{
struct SessionChannelWorkerRegistrar
{
    SessionChannelWorkerRegistrar()
    {
        register_worker_dispatcher(
            [](int argc, char **argv) -> int
            {
                if (argc < 2)
                    return -1;
                std::string_view mode = argv[1];
                auto dot = mode.find('.');
                if (dot == std::string_view::npos || mode.substr(0, dot) != "session_channel")
                    return -1;
                std::string scenario(mode.substr(dot + 1));
                using namespace poolhub::tests::worker::session_channel;
                if (scenario == "round_trip" && argc > 2)
                    return round_trip(argv[2]);
                if (scenario == "crash_reported" && argc > 2)
                    return crash_reported(argv[2]);
                if (scenario == "exit_immediately" && argc > 2)
                    return exit_immediately(argv[2]);
                if (scenario == "close_terminates" && argc > 3)
                    return close_terminates(argv[2], argv[3]);
                if (scenario == "pools_end_to_end" && argc > 2)
                    return pools_end_to_end(argv[2]);
                if (scenario == "warmup_failure_degrades" && argc > 3)
                    return warmup_failure_degrades(argv[2], argv[3]);
                fmt::print(stderr, "ERROR: Unknown session_channel scenario '{}'\n", scenario);
                return 1;
            });
    }
};
static SessionChannelWorkerRegistrar g_session_channel_registrar;
} // namespace

/**
 * @file test_pool_client.cpp
 * @brief Leader election, follower requests and failover.
 *
 * PoolClientTest runs a leader and a follower in this process, each on its own
 * EventLoop with its own FakeChannelFactory. PoolClientProcessTest uses real worker
 * processes and the fake_backend executable (see workers/pool_client_workers.cpp).
 */
#include "fake_session_channel.h"
#include "ph_pool.hpp"
#include "shared_test_helpers.h"
#include "test_patterns.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <csignal>
#include <fstream>
#include <mutex>

using namespace poolhub;
using namespace poolhub::ipc;
using namespace poolhub::tests;
using namespace poolhub::tests::helper;
using ::testing::ElementsAre;
using ::testing::StartsWith;

namespace
{

/// Roles a client went through, in order.
struct RoleLog
{
    std::mutex mu;
    std::vector<Role> roles;

    PoolClient::RoleCallback callback()
    {
        return [this](Role role)
        {
            std::lock_guard<std::mutex> lock(mu);
            roles.push_back(role);
        };
    }

    std::vector<Role> snapshot()
    {
        std::lock_guard<std::mutex> lock(mu);
        return roles;
    }
};

pool::CompletionContext context(const std::string &prefix)
{
    pool::CompletionContext ctx;
    ctx.prefix = prefix;
    ctx.language_id = "plaintext";
    return ctx;
}

void write_lock_record(const fs::path &path, uint64_t pid)
{
    std::ofstream out(path);
    out << nlohmann::json{{"pid", pid}, {"timestamp", platform::wall_clock_ms()}}.dump();
}

} // namespace

class PoolClientTest : public PureApiTest
{
  protected:
    void SetUp() override
    {
        config_.state_dir = dir_.str();
        paths_ = utils::IpcPaths::under(dir_.path());
        factory_a_ = std::make_shared<FakeChannelFactory>();
        factory_b_ = std::make_shared<FakeChannelFactory>();
        loop_a_.start();
        loop_b_.start();
    }

    void TearDown() override
    {
        // Follower first, so it does not fail over to the departing leader's lock.
        b_.reset();
        a_.reset();
        loop_a_.stop();
        loop_b_.stop();
    }

    std::unique_ptr<PoolClient> make(utils::EventLoop &loop,
                                     std::shared_ptr<FakeChannelFactory> factory, RoleLog &log)
    {
        PoolClient::Options opts;
        opts.config = config_;
        opts.factory = std::move(factory);
        opts.on_role_change = log.callback();
        opts.on_degraded = [this](PoolKind pool)
        {
            std::lock_guard<std::mutex> lock(mu_);
            degraded_.push_back(pool);
        };
        return std::make_unique<PoolClient>(loop, std::move(opts));
    }

    /// Leader on loop A, follower on loop B.
    void start_pair()
    {
        a_ = make(loop_a_, factory_a_, roles_a_);
        ASSERT_EQ(a_->activate(), Role::Server);
        b_ = make(loop_b_, factory_b_, roles_b_);
        ASSERT_EQ(b_->activate(), Role::Client);
    }

    size_t degraded_count()
    {
        std::lock_guard<std::mutex> lock(mu_);
        return degraded_.size();
    }

    TempStateDir dir_{"phcli"};
    utils::PoolConfig config_;
    utils::IpcPaths paths_;
    std::shared_ptr<FakeChannelFactory> factory_a_;
    std::shared_ptr<FakeChannelFactory> factory_b_;
    utils::EventLoop loop_a_;
    utils::EventLoop loop_b_;
    RoleLog roles_a_;
    RoleLog roles_b_;
    std::unique_ptr<PoolClient> a_;
    std::unique_ptr<PoolClient> b_;
    std::mutex mu_;
    std::vector<PoolKind> degraded_;
};

TEST_F(PoolClientTest, FirstClientBecomesServer)
{
    a_ = make(loop_a_, factory_a_, roles_a_);
    EXPECT_EQ(a_->role(), Role::None);
    EXPECT_THAT(a_->client_id(), StartsWith(std::to_string(platform::get_pid()) + "-"));

    ASSERT_EQ(a_->activate(), Role::Server);
    EXPECT_THAT(roles_a_.snapshot(), ElementsAre(Role::Server));
    EXPECT_TRUE(fs::exists(paths_.socket_path));
    EXPECT_EQ(utils::LeaderLock::read_record_at(paths_.lock_path).value().pid,
              platform::get_pid());

    EXPECT_TRUE(a_->is_available());
    EXPECT_TRUE(a_->is_command_available());
    EXPECT_EQ(a_->get_completion(context("Hello")), " world");
    EXPECT_EQ(a_->send_command("hi").text, "echo: hi");
    EXPECT_EQ(a_->current_model(), "haiku");

    const auto status = a_->get_pool_status();
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ((*status)["role"], "server");
    EXPECT_EQ((*status)["connectedClients"], 0);
    EXPECT_EQ((*status)["completionPoolAvailable"], true);
    EXPECT_EQ((*status)["completionPool"]["totalRequests"], 1);
    EXPECT_EQ((*status)["commandPool"]["totalRequests"], 1);
}

TEST_F(PoolClientTest, ActivateIsIdempotent)
{
    a_ = make(loop_a_, factory_a_, roles_a_);
    ASSERT_EQ(a_->activate(), Role::Server);
    EXPECT_EQ(a_->activate(), Role::Server);
    EXPECT_EQ(factory_a_->session_count(), 3u);
    EXPECT_EQ(roles_a_.snapshot().size(), 1u);
}

TEST_F(PoolClientTest, FollowerIsServedByTheLeader)
{
    start_pair();
    EXPECT_THAT(roles_b_.snapshot(), ElementsAre(Role::Client));
    EXPECT_TRUE(b_->is_available());
    EXPECT_TRUE(b_->is_command_available());

    EXPECT_EQ(b_->get_completion(context("Hello")), " world");
    const pool::CommandResult reply = b_->send_command("describe the diff", 5000);
    EXPECT_EQ(reply.text, "echo: describe the diff");
    ASSERT_TRUE(reply.meta.has_value());
    EXPECT_EQ((*reply.meta)["inputTokens"], 11);

    // Every session lives in the leader.
    EXPECT_EQ(factory_a_->session_count(), 3u);
    EXPECT_EQ(factory_b_->session_count(), 0u);

    const auto status = b_->get_pool_status();
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ((*status)["role"], "client");
    EXPECT_EQ((*status)["connectedClients"], 1);
    EXPECT_EQ((*status)["model"], "haiku");
    EXPECT_EQ((*status)["completionPool"]["totalRequests"], 1);
}

TEST_F(PoolClientTest, StoppedRequestIsNeverSent)
{
    start_pair();
    std::stop_source source;
    source.request_stop();
    EXPECT_EQ(b_->get_completion(context("Hello"), source.get_token()), std::nullopt);
    EXPECT_EQ(a_->get_completion(context("Hello"), source.get_token()), std::nullopt);
    EXPECT_EQ((*a_->get_pool_status())["completionPool"]["totalRequests"], 0);
}

TEST_F(PoolClientTest, CommandTimeoutAppliesThroughTheLeader)
{
    start_pair();
    loop_a_.run_sync(
        [this]
        {
            factory_a_->responder = [](const FakeSession &, size_t, const std::string &msg)
            { return msg == "slow" ? FakeReply::Silent : FakeReply::Answer; };
        });
    const pool::CommandResult result = b_->send_command("slow", 100);
    EXPECT_FALSE(result.text.has_value());
    EXPECT_FALSE(result.meta.has_value());
    // The abandoned slot is recycled and serves the next request.
    EXPECT_EQ(b_->send_command("fast", 5000).text, "echo: fast");
}

TEST_F(PoolClientTest, ModelChangesReachTheLeader)
{
    start_pair();
    utils::PoolConfig changed = config_;
    changed.model = "opus";
    b_->update_config(changed);
    EXPECT_EQ(a_->current_model(), "opus");
    EXPECT_EQ(b_->current_model(), "opus");
    ASSERT_TRUE(wait_until(
        [this]
        {
            const auto open = factory_a_->open_sessions();
            return open.size() == 3 &&
                   std::all_of(open.begin(), open.end(),
                               [](const auto &s) { return s->options().model == "opus"; });
        }));

    changed.model = "sonnet";
    a_->update_config(changed);
    EXPECT_EQ((*b_->get_pool_status())["model"], "sonnet");

    // Unchanged model: nothing is recycled.
    const size_t before = factory_a_->session_count();
    a_->update_config(changed);
    EXPECT_EQ(factory_a_->session_count(), before);
}

TEST_F(PoolClientTest, RecycleAndRestart)
{
    start_pair();
    EXPECT_TRUE(b_->recycle_all());
    EXPECT_EQ(factory_a_->session_count(), 6u);
    EXPECT_TRUE(a_->recycle_all());
    EXPECT_EQ(factory_a_->session_count(), 9u);
    EXPECT_TRUE(a_->restart());
    EXPECT_TRUE(b_->restart());
    EXPECT_TRUE(a_->is_available());
}

TEST_F(PoolClientTest, FollowerTakesOverWhenLeaderLeaves)
{
    start_pair();
    a_->dispose();
    EXPECT_EQ(a_->role(), Role::None);
    EXPECT_THAT(roles_a_.snapshot(), ElementsAre(Role::Server, Role::None));

    ASSERT_TRUE(wait_until([this] { return b_->role() == Role::Server; }));
    EXPECT_THAT(roles_b_.snapshot(), ElementsAre(Role::Client, Role::None, Role::Server));
    EXPECT_EQ(b_->get_completion(context("Hello")), " world");
    EXPECT_EQ(factory_b_->session_count(), 3u);
    EXPECT_TRUE(fs::exists(paths_.socket_path));
    EXPECT_TRUE(fs::exists(paths_.lock_path));
}

TEST_F(PoolClientTest, FollowerCanShutDownTheLeader)
{
    start_pair();
    EXPECT_TRUE(b_->shutdown_server());

    ASSERT_TRUE(wait_until([this] { return b_->role() == Role::Server; }));
    // The old leader keeps its role but no longer serves anything.
    EXPECT_EQ(a_->role(), Role::Server);
    EXPECT_FALSE(a_->is_available());
    EXPECT_EQ(a_->get_completion(context("Hello")), std::nullopt);

    EXPECT_EQ(b_->get_completion(context("Hello")), " world");
}

TEST_F(PoolClientTest, LeaderShutdownIsDispose)
{
    a_ = make(loop_a_, factory_a_, roles_a_);
    ASSERT_EQ(a_->activate(), Role::Server);
    EXPECT_TRUE(a_->shutdown_server());
    EXPECT_EQ(a_->role(), Role::None);
    EXPECT_FALSE(fs::exists(paths_.socket_path));
    EXPECT_FALSE(fs::exists(paths_.lock_path));
}

TEST_F(PoolClientTest, DisposedClientRefusesWork)
{
    start_pair();
    b_->dispose();
    b_->dispose();
    EXPECT_EQ(b_->role(), Role::None);
    EXPECT_EQ(b_->get_completion(context("Hello")), std::nullopt);
    EXPECT_FALSE(b_->send_command("hi").text.has_value());
    EXPECT_FALSE(b_->recycle_all());
    EXPECT_FALSE(b_->restart());
    EXPECT_FALSE(b_->is_available());
    EXPECT_FALSE(b_->get_pool_status().has_value());
    EXPECT_TRUE(wait_until([this] { return (*a_->get_pool_status())["connectedClients"] == 0; }));

    a_->dispose();
    EXPECT_FALSE(fs::exists(paths_.socket_path));
    EXPECT_FALSE(fs::exists(paths_.lock_path));
    EXPECT_TRUE(factory_a_->open_sessions().empty());
}

TEST_F(PoolClientTest, DegradationIsReported)
{
    factory_a_->responder = [](const FakeSession &, size_t, const std::string &)
    { return FakeReply::BadWarm; };
    a_ = make(loop_a_, factory_a_, roles_a_);
    ASSERT_EQ(a_->activate(), Role::Server);
    ASSERT_TRUE(wait_until([this] { return degraded_count() == 2; }));
    EXPECT_FALSE(a_->is_available());
    EXPECT_FALSE(a_->is_command_available());
    EXPECT_EQ(a_->get_completion(context("Hello")), std::nullopt);
    EXPECT_FALSE(a_->send_command("hi").text.has_value());

    // restart() clears the degradation once the backend behaves again.
    loop_a_.run_sync([this] { factory_a_->responder = nullptr; });
    EXPECT_TRUE(a_->restart());
    EXPECT_TRUE(a_->is_available());
}

TEST_F(PoolClientTest, StaleLockIsTakenOver)
{
    utils::ensure_state_dir(paths_);
    write_lock_record(paths_.lock_path, 2147483646u);
    {
        std::ofstream stale(paths_.socket_path);
    }
    a_ = make(loop_a_, factory_a_, roles_a_);
    ASSERT_EQ(a_->activate(), Role::Server);
    EXPECT_EQ(utils::LeaderLock::read_record_at(paths_.lock_path).value().pid,
              platform::get_pid());
}

TEST_F(PoolClientTest, LiveLockWithoutEndpointIsForced)
{
    utils::ensure_state_dir(paths_);
    // A live process that is not serving: our parent.
    write_lock_record(paths_.lock_path, static_cast<uint64_t>(::getppid()));
    a_ = make(loop_a_, factory_a_, roles_a_);

    const auto started = std::chrono::steady_clock::now();
    ASSERT_EQ(a_->activate(), Role::Server);
    EXPECT_GE(std::chrono::steady_clock::now() - started,
              PoolClient::RECONNECT_DELAY * PoolClient::MAX_RECONNECT_ATTEMPTS);
    EXPECT_EQ(utils::LeaderLock::read_record_at(paths_.lock_path).value().pid,
              platform::get_pid());
}

TEST_F(PoolClientTest, UnusableStateDirLeavesNoRole)
{
    const fs::path blocker = dir_.path() / "blocker";
    {
        std::ofstream file(blocker);
    }
    config_.state_dir = (blocker / "state").string();
    a_ = make(loop_a_, factory_a_, roles_a_);
    EXPECT_EQ(a_->activate(), Role::None);
    EXPECT_FALSE(a_->is_available());
    EXPECT_EQ(a_->get_completion(context("Hello")), std::nullopt);
}

// ============================================================================
// Separate processes
// ============================================================================

class PoolClientProcessTest : public IsolatedProcessTest
{
  protected:
    TempStateDir dir_{"phproc"};
};

TEST_F(PoolClientProcessTest, FollowerProcessUsesLeaderPools)
{
    auto leader = SpawnWorkerWithReadySignal("pool_client.leader_until_idle",
                                             {dir_.str(), fake_backend_path()});
    ASSERT_TRUE(leader->wait_for_ready());
    auto follower = SpawnWorker("pool_client.follower_round_trip", {dir_.str(), fake_backend_path()});
    ExpectWorkerOk(follower);
    ExpectWorkerOk(leader, {"active as server"});
}

TEST_F(PoolClientProcessTest, FollowerTakesOverFromKilledLeader)
{
    auto leader =
        SpawnWorkerWithReadySignal("pool_client.leader_hold", {dir_.str(), fake_backend_path()});
    ASSERT_TRUE(leader->wait_for_ready());
    auto follower = SpawnWorkerWithReadySignal("pool_client.follower_survives_leader",
                                               {dir_.str(), fake_backend_path()});
    ASSERT_TRUE(follower->wait_for_ready());

    leader->send_signal(SIGKILL);
    // Reap at once: a zombie still counts as a live lock holder.
    leader->wait_for_exit();
    EXPECT_EQ(leader->term_signal(), SIGKILL);

    ExpectWorkerOk(follower, {"lost the server connection"}, /*allow_expected_logger_errors=*/true);
}

TEST_F(PoolClientProcessTest, ContendersElectOneLeader)
{
    const int n = 3;
    std::vector<std::pair<std::string, std::vector<std::string>>> scenarios;
    for (int i = 0; i < n; ++i)
        scenarios.push_back(
            {"pool_client.contend", {dir_.str(), fake_backend_path(), std::to_string(n)}});
    auto workers = SpawnWorkers(scenarios);
    ExpectAllWorkersOk(workers);

    int servers = 0;
    int clients = 0;
    for (auto &w : workers)
    {
        servers += static_cast<int>(count_lines(w.get_stdout(), "ROLE=server"));
        clients += static_cast<int>(count_lines(w.get_stdout(), "ROLE=client"));
    }
    EXPECT_EQ(servers, 1);
    EXPECT_EQ(clients, n - 1);
}

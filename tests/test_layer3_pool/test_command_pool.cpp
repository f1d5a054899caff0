/**
 * @file test_command_pool.cpp
 * @brief CommandPool prompts, reply metadata and timeouts.
 */
#include "pool_test_fixture.h"

#include <gtest/gtest.h>

#include <thread>

using namespace poolhub;
using namespace poolhub::pool;
using namespace poolhub::tests;

class CommandPoolTest : public PoolFixture<CommandPool>
{
  protected:
    void start(CommandPoolOptions options = {"sonnet", "", "", {}, 24})
    {
        create_and_activate([this, options]
                            { return std::make_unique<CommandPool>(loop_, factory_, options); });
    }

    CommandResult send(const std::string &message, std::optional<int> timeout_ms = std::nullopt)
    {
        auto p = std::make_shared<std::promise<CommandResult>>();
        auto f = p->get_future();
        on_loop(
            [this, p, message, timeout_ms]
            {
                pool_->send_prompt(message, timeout_ms,
                                   [p](CommandResult result) { p->set_value(std::move(result)); });
            });
        return await(f);
    }
};

TEST_F(CommandPoolTest, SingleSlotWarmsWithReadyProbe)
{
    start();
    ASSERT_TRUE(wait_idle());
    EXPECT_EQ(on_loop([this] { return pool_->size(); }), 1u);
    const std::vector<std::string> pushed = on_loop([this] { return factory_->session(0)->pushed(); });
    ASSERT_EQ(pushed.size(), 1u);
    EXPECT_EQ(pushed[0], "Reply with exactly the word: READY");
    const ChannelOptions seen = factory_->session(0)->options();
    EXPECT_EQ(seen.model, "sonnet");
    EXPECT_EQ(seen.system_prompt, CommandPool::kDefaultCommandSystemPrompt);
}

TEST_F(CommandPoolTest, ReplyCarriesMetadata)
{
    start();
    ASSERT_TRUE(wait_idle());
    const CommandResult result = send("write a commit message");
    ASSERT_TRUE(result.text.has_value());
    EXPECT_EQ(*result.text, "echo: write a commit message");
    ASSERT_TRUE(result.meta.has_value());
    const nlohmann::json &meta = *result.meta;
    EXPECT_EQ(meta["model"], "sonnet");
    EXPECT_EQ(meta["inputTokens"], 11);
    EXPECT_EQ(meta["outputTokens"], 3);
    EXPECT_EQ(meta["durationMs"], 7);
    EXPECT_EQ(meta["numTurns"], 1);
    EXPECT_EQ(meta["sessionId"], "fake-session");
    EXPECT_EQ(meta["cacheReadInputTokens"], 0);
    EXPECT_DOUBLE_EQ(meta["totalCostUsd"].get<double>(), 0.002);
}

TEST_F(CommandPoolTest, WarmupAcceptsReadyInAnyCase)
{
    factory_->manual = true;
    on_loop(
        [this]
        {
            pool_ = std::make_unique<CommandPool>(loop_, factory_, CommandPoolOptions{});
            pool_->activate();
        });
    on_loop([this] { factory_->session(0)->emit_result("  Ready.\n"); });
    ASSERT_TRUE(wait_idle());
}

TEST_F(CommandPoolTest, TimeoutAbandonsAndRecycles)
{
    start();
    ASSERT_TRUE(wait_idle());
    on_loop(
        [this]
        {
            factory_->responder = [](const FakeSession &, size_t, const std::string &msg)
            { return msg == "slow" ? FakeReply::Silent : FakeReply::Answer; };
        });

    const CommandResult result = send("slow", 100);
    EXPECT_FALSE(result.text.has_value());
    EXPECT_FALSE(result.meta.has_value());

    ASSERT_TRUE(helper::wait_until([this] { return factory_->session_count() == 2; }));
    ASSERT_TRUE(wait_idle());
    EXPECT_TRUE(session_closed(0));
    EXPECT_EQ(send("fast", 5000).text, "echo: fast");
}

TEST_F(CommandPoolTest, ReplyBeforeTimeoutCancelsIt)
{
    start();
    ASSERT_TRUE(wait_idle());
    EXPECT_EQ(send("quick", 200).text, "echo: quick");
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    EXPECT_EQ(factory_->session_count(), 1u);
    EXPECT_EQ(stats().total_recycles, 0u);
}

TEST_F(CommandPoolTest, SetModelRecycles)
{
    start();
    ASSERT_TRUE(wait_idle());
    ASSERT_TRUE(run_and_wait([this](auto done) { pool_->set_model("haiku", done); }));
    ASSERT_TRUE(wait_idle());
    EXPECT_EQ(factory_->session_count(), 2u);
    EXPECT_EQ(factory_->session(1)->options().model, "haiku");
    EXPECT_EQ(send("hi").meta.value()["model"], "haiku");
}

TEST_F(CommandPoolTest, UnavailablePoolAnswersEmpty)
{
    factory_->usable = false;
    start();
    const CommandResult result = send("anyone");
    EXPECT_FALSE(result.text.has_value());
    EXPECT_FALSE(result.meta.has_value());
}

/**
 * @file test_event_loop.cpp
 * @brief Tests for the poll(2) reactor: posting, timers, run_sync and fd watchers.
 *
 * The loop needs no lifecycle module, so everything here runs in-process.
 */
#include "ph_service.hpp"
#include "shared_test_helpers.h"
#include "test_patterns.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <future>
#include <mutex>
#include <string>
#include <vector>

#include <poll.h>
#include <unistd.h>

using namespace poolhub::utils;
using namespace poolhub::tests::helper;
using namespace std::chrono_literals;
using ::testing::ElementsAre;

class EventLoopTest : public poolhub::tests::PureApiTest
{
  protected:
    void SetUp() override { loop_.start(); }
    void TearDown() override { loop_.stop(); }

    EventLoop loop_;
};

TEST_F(EventLoopTest, PostRunsOnLoopThread)
{
    std::promise<bool> in_loop;
    auto future = in_loop.get_future();
    ASSERT_TRUE(loop_.post([&] { in_loop.set_value(loop_.in_loop_thread()); }));
    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    EXPECT_TRUE(future.get());
    EXPECT_FALSE(loop_.in_loop_thread());
}

TEST_F(EventLoopTest, PostAfterStopIsRejected)
{
    loop_.stop();
    EXPECT_FALSE(loop_.running());
    EXPECT_FALSE(loop_.post([] {}));
}

TEST_F(EventLoopTest, PostedTasksKeepSubmissionOrder)
{
    std::vector<int> seen;
    for (int i = 0; i < 50; ++i)
    {
        ASSERT_TRUE(loop_.post([&seen, i] { seen.push_back(i); }));
    }
    const size_t count = loop_.run_sync([&] { return seen.size(); });
    ASSERT_EQ(count, 50u);
    for (int i = 0; i < 50; ++i)
    {
        EXPECT_EQ(seen[static_cast<size_t>(i)], i);
    }
}

TEST_F(EventLoopTest, TimersFireInDeadlineOrder)
{
    std::mutex mu;
    std::vector<std::string> fired;
    auto record = [&](const char *name)
    {
        return [&, name]
        {
            std::lock_guard<std::mutex> lock(mu);
            fired.emplace_back(name);
        };
    };
    loop_.call_later(60ms, record("late"));
    loop_.call_later(20ms, record("early"));
    loop_.call_later(0ms, record("now"));

    ASSERT_TRUE(wait_until(
        [&]
        {
            std::lock_guard<std::mutex> lock(mu);
            return fired.size() == 3;
        }));
    std::lock_guard<std::mutex> lock(mu);
    EXPECT_THAT(fired, ElementsAre("now", "early", "late"));
}

TEST_F(EventLoopTest, CancelledTimerNeverRuns)
{
    std::atomic<int> runs{0};
    const auto id = loop_.call_later(30ms, [&] { runs++; });
    ASSERT_NE(id, EventLoop::kInvalidTimer);
    loop_.cancel(id);
    auto marker = std::make_shared<std::promise<void>>();
    auto marked = marker->get_future();
    loop_.call_later(80ms, [marker] { marker->set_value(); });
    ASSERT_EQ(marked.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(runs.load(), 0);

    // Cancelling an unknown or already-fired id is a no-op.
    loop_.cancel(id);
    loop_.cancel(987654);
}

TEST_F(EventLoopTest, ZeroDelayTimerIsNeverSynchronous)
{
    auto ran = std::make_shared<std::atomic<bool>>(false);
    const bool ran_inline = loop_.run_sync(
        [&]
        {
            loop_.call_later(0ms, [ran] { ran->store(true); });
            return ran->load();
        });
    EXPECT_FALSE(ran_inline);
    EXPECT_TRUE(wait_until([&] { return ran->load(); }));
}

TEST_F(EventLoopTest, RunSyncReturnsValueAndRethrows)
{
    EXPECT_EQ(loop_.run_sync([] { return 42; }), 42);
    EXPECT_THROW(loop_.run_sync([]() -> int { throw std::logic_error("boom"); }),
                 std::logic_error);
    // Nested run_sync from the loop thread runs inline instead of deadlocking.
    EXPECT_EQ(loop_.run_sync([this] { return loop_.run_sync([] { return 7; }); }), 7);
}

TEST_F(EventLoopTest, RunSyncThrowsWhenNotRunning)
{
    EventLoop idle;
    EXPECT_THROW(idle.run_sync([] { return 1; }), std::runtime_error);
}

TEST_F(EventLoopTest, WatchReportsReadableDescriptor)
{
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);
    auto close_fds = poolhub::basics::make_scope_guard(
        [&]
        {
            ::close(fds[0]);
            ::close(fds[1]);
        });

    std::promise<std::string> received;
    auto future = received.get_future();
    loop_.run_sync(
        [&]
        {
            loop_.watch(fds[0], POLLIN,
                        [&, fd = fds[0]](short revents)
                        {
                            char buf[16] = {};
                            if ((revents & POLLIN) == 0)
                                return;
                            const ssize_t n = ::read(fd, buf, sizeof(buf));
                            loop_.unwatch(fd);
                            received.set_value(std::string(buf, n > 0 ? static_cast<size_t>(n) : 0));
                        });
        });

    ASSERT_EQ(::write(fds[1], "ping", 4), 4);
    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(future.get(), "ping");

    // The handler unwatched itself: further data is not delivered.
    ASSERT_EQ(::write(fds[1], "x", 1), 1);
    loop_.run_sync([] { return 0; });
}

TEST_F(EventLoopTest, StopFromLoopThreadEndsTheLoop)
{
    std::promise<void> stopped;
    ASSERT_TRUE(loop_.post(
        [&]
        {
            loop_.stop();
            stopped.set_value();
        }));
    ASSERT_EQ(stopped.get_future().wait_for(5s), std::future_status::ready);
    EXPECT_FALSE(loop_.post([] {}));
}

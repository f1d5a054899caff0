/**
 * @file lock_file_workers.cpp
 * @brief Worker processes that compete for the leader lockfile.
 */
#include "lock_file_workers.h"
#include "ph_service.hpp"
#include "shared_test_helpers.h"
#include "test_entrypoint.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <thread>

using namespace poolhub::utils;
using namespace poolhub::tests::helper;
using namespace std::chrono_literals;

namespace poolhub::tests::worker::leader_lock
{

int contend(const std::string &lock_path, int hold_ms)
{
    return run_gtest_worker(
        [&]()
        {
            LeaderLock lock(lock_path);
            const bool won = lock.try_acquire();
            fmt::print("RESULT:{}\n", won ? "WON" : "LOST");
            std::fflush(stdout);
            if (won)
            {
                ASSERT_TRUE(lock.held());
                const auto record = lock.read_record();
                ASSERT_TRUE(record.has_value());
                EXPECT_EQ(record->pid, platform::get_pid());
                std::this_thread::sleep_for(std::chrono::milliseconds(hold_ms));
                lock.release();
                EXPECT_FALSE(lock.held());
            }
            else
            {
                EXPECT_FALSE(lock.held());
            }
        },
        "leader_lock::contend", Logger::GetLifecycleModule());
}

int hold_until_killed(const std::string &lock_path)
{
    return run_gtest_worker(
        [&]()
        {
            LeaderLock lock(lock_path);
            ASSERT_TRUE(lock.try_acquire());
            signal_test_ready();
            for (int i = 0; i < 600; ++i)
            {
                std::this_thread::sleep_for(100ms);
            }
            FAIL() << "hold_until_killed was never killed";
        },
        "leader_lock::hold_until_killed", Logger::GetLifecycleModule());
}

} // namespace poolhub::tests::worker::leader_lock

namespace
{
struct LeaderLockWorkerRegistrar
{
    LeaderLockWorkerRegistrar()
    {
        register_worker_dispatcher(
            [](int argc, char **argv) -> int
            {
                if (argc < 2)
                    return -1;
                std::string_view mode = argv[1];
                auto dot = mode.find('.');
                if (dot == std::string_view::npos || mode.substr(0, dot) != "leader_lock")
                    return -1;
                std::string scenario(mode.substr(dot + 1));
                using namespace poolhub::tests::worker::leader_lock;
                if (scenario == "contend" && argc > 3)
                    return contend(argv[2], std::stoi(argv[3]));
                if (scenario == "hold_until_killed" && argc > 2)
                    return hold_until_killed(argv[2]);
                fmt::print(stderr, "ERROR: Unknown leader_lock scenario '{}'\n", scenario);
                return 1;
            });
    }
};
static LeaderLockWorkerRegistrar g_leader_lock_registrar;
} // namespace

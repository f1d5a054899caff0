// tests/test_framework/test_process_utils.cpp
/**
 * @file test_process_utils.cpp
 * @brief Implements spawning and managing worker processes (fork/execv).
 */
#include "test_process_utils.h"
#include "shared_test_helpers.h" // For read_file_contents

#include <poll.h>
#include <signal.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <fcntl.h>
#include <string>
#include <string_view>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <fmt/core.h>

extern char **environ;

namespace poolhub::tests::helper
{

static void decode_wait_status(int status, int &exit_code, int &term_signal)
{
    if (WIFEXITED(status))
    {
        exit_code = WEXITSTATUS(status);
        term_signal = 0;
    }
    else if (WIFSIGNALED(status))
    {
        exit_code = -1;
        term_signal = WTERMSIG(status);
    }
}

static ProcessHandle spawn_worker_process(const std::string &exe_path, const std::string &mode,
                                          const std::vector<std::string> &args,
                                          const fs::path &stdout_path,
                                          const fs::path &stderr_path,
                                          bool redirect_stderr_to_console, int ready_write_fd)
{
    // Everything the child needs is built before fork(): the parent may be multithreaded.
    std::vector<std::string> env_strings;
    for (char **e = environ; e != nullptr && *e != nullptr; ++e)
    {
        if (std::string_view(*e).rfind("PH_TEST_READY_FD=", 0) != 0)
            env_strings.emplace_back(*e);
    }
    if (ready_write_fd >= 0)
    {
        env_strings.push_back(fmt::format("PH_TEST_READY_FD={}", ready_write_fd));
    }
    std::vector<char *> envp;
    for (auto &e : env_strings)
        envp.push_back(e.data());
    envp.push_back(nullptr);

    std::vector<char *> argv;
    argv.push_back(const_cast<char *>(exe_path.c_str()));
    argv.push_back(const_cast<char *>(mode.c_str()));
    for (const auto &arg : args)
    {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid == 0)
    {
        int stdout_fd = open(stdout_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
        if (stdout_fd != -1)
        {
            dup2(stdout_fd, 1);
            close(stdout_fd);
        }
        if (!redirect_stderr_to_console)
        {
            int stderr_fd = open(stderr_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
            if (stderr_fd != -1)
            {
                dup2(stderr_fd, 2);
                close(stderr_fd);
            }
        }

        execve(exe_path.c_str(), argv.data(), envp.data());
        _exit(127);
    }
    return pid < 0 ? NULL_PROC_HANDLE : pid;
}

WorkerProcess::WorkerProcess(const std::string &exe_path, const std::string &mode,
                             const std::vector<std::string> &args,
                             bool redirect_stderr_to_console, bool with_ready_signal)
    : redirect_stderr_to_console_(redirect_stderr_to_console)
{
    auto base_name = fs::path(exe_path).filename().string() + "_" + mode;
    std::replace(base_name.begin(), base_name.end(), '.', '_');
    auto ts = std::chrono::high_resolution_clock::now().time_since_epoch().count();

    stdout_path_ = fs::temp_directory_path() / fmt::format("{}_{}_stdout.log", base_name, ts);
    stderr_path_ = fs::temp_directory_path() / fmt::format("{}_{}_stderr.log", base_name, ts);

    int ready_pipe[2] = {-1, -1};
    if (with_ready_signal && pipe(ready_pipe) != 0)
    {
        ready_pipe[0] = ready_pipe[1] = -1;
    }
    if (ready_pipe[0] >= 0)
    {
        // Only the write end belongs in the child.
        fcntl(ready_pipe[0], F_SETFD, FD_CLOEXEC);
    }

    handle_ = spawn_worker_process(exe_path, mode, args, stdout_path_, stderr_path_,
                                   redirect_stderr_to_console, ready_pipe[1]);
    pid_ = handle_;

    if (ready_pipe[1] >= 0)
    {
        close(ready_pipe[1]);
        ready_fd_ = ready_pipe[0];
    }
}

WorkerProcess::~WorkerProcess()
{
    if (handle_ != NULL_PROC_HANDLE && !waited_)
    {
        wait_for_exit();
    }
    if (ready_fd_ >= 0)
    {
        close(ready_fd_);
    }
    std::error_code ec;
    fs::remove(stdout_path_, ec);
    fs::remove(stderr_path_, ec);
}

int WorkerProcess::wait_for_exit()
{
    if (waited_)
        return exit_code_;

    if (handle_ != NULL_PROC_HANDLE)
    {
        int status = 0;
        pid_t r;
        do
        {
            r = waitpid(handle_, &status, 0);
        } while (r == -1 && errno == EINTR);
        if (r == handle_)
        {
            decode_wait_status(status, exit_code_, term_signal_);
        }
    }
    waited_ = true;
    handle_ = NULL_PROC_HANDLE;

    read_file_contents(stdout_path_.string(), stdout_content_);
    if (!redirect_stderr_to_console_)
        read_file_contents(stderr_path_.string(), stderr_content_);
    return exit_code_;
}

bool WorkerProcess::wait_for_ready(std::chrono::milliseconds timeout)
{
    if (ready_fd_ < 0)
        return false;
    pollfd pfd{ready_fd_, POLLIN, 0};
    int r;
    do
    {
        r = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    } while (r == -1 && errno == EINTR);
    if (r <= 0)
        return false;
    char byte = 0;
    return ::read(ready_fd_, &byte, 1) == 1;
}

void WorkerProcess::send_signal(int sig)
{
    if (handle_ != NULL_PROC_HANDLE && !waited_)
    {
        ::kill(handle_, sig);
    }
}

const std::string &WorkerProcess::get_stdout() const
{
    if (!waited_)
        read_file_contents(stdout_path_.string(), stdout_content_);
    return stdout_content_;
}

const std::string &WorkerProcess::get_stderr() const
{
    if (!waited_ && !redirect_stderr_to_console_)
        read_file_contents(stderr_path_.string(), stderr_content_);
    return stderr_content_;
}

void expect_worker_ok(const WorkerProcess &proc,
                      const std::vector<std::string> &expected_stderr_substrings,
                      bool allow_expected_logger_errors)
{
    using ::testing::HasSubstr;
    using ::testing::Not;

    ASSERT_TRUE(proc.valid()) << "WorkerProcess was not successfully spawned.";
    const auto &stderr_out = proc.get_stderr();
    ASSERT_EQ(proc.exit_code(), 0) << "worker stderr:\n" << stderr_out;

    if (!allow_expected_logger_errors)
    {
        EXPECT_THAT(stderr_out, Not(HasSubstr("[ERROR")));
    }
    EXPECT_THAT(stderr_out, Not(HasSubstr("[PANIC]")));
    EXPECT_THAT(stderr_out, Not(HasSubstr("[WORKER FAILURE]")));
    for (const auto &expected : expected_stderr_substrings)
    {
        EXPECT_THAT(stderr_out, HasSubstr(expected));
    }
}

} // namespace poolhub::tests::helper

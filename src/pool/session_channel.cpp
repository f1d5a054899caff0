#include "ph_base.hpp"
#include "pool/session_channel.hpp"
#include "utils/logger.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace poolhub::pool
{

namespace
{

constexpr size_t kReadChunk = 16 * 1024;
constexpr size_t kLogPreviewLen = 120;

void set_nonblocking(int fd)
{
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags == -1 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1)
    {
        throw std::system_error(errno, std::generic_category(), "SessionChannel: fcntl");
    }
}

void close_fd(int &fd) noexcept
{
    if (fd >= 0)
    {
        ::close(fd);
        fd = -1;
    }
}

bool is_executable(const std::string &path)
{
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

/// Resolves a bare program name against $PATH the way execvp(3) will.
std::string find_in_path(const std::string &program)
{
    if (program.find('/') != std::string::npos)
    {
        return is_executable(program) ? program : std::string{};
    }
    const char *path_env = std::getenv("PATH");
    std::string_view dirs = path_env != nullptr ? path_env : "/usr/bin:/bin";
    while (!dirs.empty())
    {
        const size_t sep = dirs.find(':');
        std::string dir(dirs.substr(0, sep));
        dirs = sep == std::string_view::npos ? std::string_view{} : dirs.substr(sep + 1);
        if (dir.empty())
            dir = ".";
        std::string candidate = dir + "/" + program;
        if (is_executable(candidate))
            return candidate;
    }
    return {};
}

/**
 * Shared by the channel object and the loop watchers so that a handler which closes the
 * channel (directly or by destroying it) never runs on freed memory.
 */
struct ChannelState : std::enable_shared_from_this<ChannelState>
{
    explicit ChannelState(utils::EventLoop &l) : loop(l) {}

    utils::EventLoop &loop;
    pid_t pid = -1;
    int in_fd = -1;
    int out_fd = -1;
    int err_fd = -1;
    bool watching_stdin = false;

    std::string pending_input;
    std::string stdout_buffer;
    std::string stderr_buffer;

    SessionChannel::EventHandler on_event;
    SessionChannel::EndHandler on_end;
    bool ended = false;
    bool closed = false;

    void start_watching()
    {
        std::weak_ptr<ChannelState> weak = weak_from_this();
        loop.watch(out_fd, POLLIN,
                   [weak](short)
                   {
                       if (auto self = weak.lock())
                           self->read_stdout();
                   });
        loop.watch(err_fd, POLLIN,
                   [weak](short)
                   {
                       if (auto self = weak.lock())
                           self->read_stderr();
                   });
    }

    void write(const std::string &line)
    {
        if (closed || ended || in_fd < 0)
            return;
        pending_input += line;
        flush_input();
    }

    void flush_input()
    {
        while (!pending_input.empty())
        {
            const ssize_t n = ::write(in_fd, pending_input.data(), pending_input.size());
            if (n > 0)
            {
                pending_input.erase(0, static_cast<size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR)
                continue;
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
            {
                if (!watching_stdin)
                {
                    std::weak_ptr<ChannelState> weak = weak_from_this();
                    loop.watch(in_fd, POLLOUT,
                               [weak](short)
                               {
                                   if (auto self = weak.lock())
                                       self->flush_input();
                               });
                    watching_stdin = true;
                }
                return;
            }
            LOGGER_WARN("SessionChannel[{}]: write to backend failed: {}", pid,
                        std::strerror(errno));
            pending_input.clear();
            break;
        }
        if (watching_stdin)
        {
            loop.unwatch(in_fd);
            watching_stdin = false;
        }
    }

    void read_stdout()
    {
        std::array<char, kReadChunk> buf{};
        for (;;)
        {
            const ssize_t n = ::read(out_fd, buf.data(), buf.size());
            if (n > 0)
            {
                stdout_buffer.append(buf.data(), static_cast<size_t>(n));
                dispatch_lines();
                if (closed || ended)
                    return;
                continue;
            }
            if (n == 0)
            {
                finish("backend closed its output");
                return;
            }
            if (errno == EINTR)
                continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK)
                return;
            finish(fmt::format("read error: {}", std::strerror(errno)));
            return;
        }
    }

    void dispatch_lines()
    {
        size_t pos = 0;
        while (!closed && !ended)
        {
            const size_t nl = stdout_buffer.find('\n', pos);
            if (nl == std::string::npos)
                break;
            std::string line(format_tools::trim_whitespace(
                std::string_view(stdout_buffer).substr(pos, nl - pos)));
            pos = nl + 1;
            if (line.empty())
                continue;
            nlohmann::json event = nlohmann::json::parse(line, nullptr, false);
            if (event.is_discarded() || !event.is_object())
            {
                LOGGER_WARN("SessionChannel[{}]: ignoring non-JSON output: {}", pid,
                            line.substr(0, kLogPreviewLen));
                continue;
            }
            auto handler = on_event; // the handler may close this channel
            handler(event);
        }
        if (!closed)
            stdout_buffer.erase(0, pos);
    }

    void read_stderr()
    {
        std::array<char, kReadChunk> buf{};
        for (;;)
        {
            const ssize_t n = ::read(err_fd, buf.data(), buf.size());
            if (n > 0)
            {
                stderr_buffer.append(buf.data(), static_cast<size_t>(n));
                size_t nl;
                while ((nl = stderr_buffer.find('\n')) != std::string::npos)
                {
                    if (nl > 0)
                        LOGGER_DEBUG("SessionChannel[{}] stderr: {}", pid,
                                     stderr_buffer.substr(0, nl));
                    stderr_buffer.erase(0, nl + 1);
                }
                continue;
            }
            if (n < 0 && errno == EINTR)
                continue;
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
                return;
            // EOF or error: stop watching, the stdout side decides the end of the session.
            loop.unwatch(err_fd);
            close_fd(err_fd);
            return;
        }
    }

    void release_io() noexcept
    {
        for (int *fd : {&in_fd, &out_fd, &err_fd})
        {
            if (*fd >= 0)
            {
                loop.unwatch(*fd);
                close_fd(*fd);
            }
        }
        watching_stdin = false;
        pending_input.clear();
    }

    void finish(const std::string &reason)
    {
        if (ended || closed)
            return;
        ended = true;
        release_io();
        LOGGER_DEBUG("SessionChannel[{}]: stream ended ({})", pid, reason);
        auto handler = std::move(on_end);
        on_end = nullptr;
        on_event = nullptr;
        if (handler)
            handler(reason);
    }

    void terminate() noexcept
    {
        if (closed)
            return;
        closed = true;
        on_event = nullptr;
        on_end = nullptr;
        release_io();
        if (pid <= 0)
            return;

        const pid_t child = pid;
        pid = -1;
        ::kill(child, SIGTERM);
        if (::waitpid(child, nullptr, WNOHANG) == child)
            return;
        if (loop.running())
        {
            loop.call_later(SubprocessChannelFactory::kTerminateGrace,
                            [child]()
                            {
                                if (::waitpid(child, nullptr, WNOHANG) == 0)
                                {
                                    ::kill(child, SIGKILL);
                                    ::waitpid(child, nullptr, 0);
                                }
                            });
        }
        else
        {
            ::kill(child, SIGKILL);
            ::waitpid(child, nullptr, 0);
        }
    }
};

class SubprocessChannel final : public SessionChannel
{
  public:
    explicit SubprocessChannel(std::shared_ptr<ChannelState> state) : m_state(std::move(state)) {}
    ~SubprocessChannel() override { m_state->terminate(); }

    void push(const std::string &message) override
    {
        m_state->write(SubprocessChannelFactory::encode_user_message(message));
    }

    void close() override { m_state->terminate(); }

    [[nodiscard]] bool is_open() const noexcept override
    {
        return !m_state->closed && !m_state->ended;
    }

  private:
    std::shared_ptr<ChannelState> m_state;
};

} // namespace

SubprocessChannelFactory::SubprocessChannelFactory(std::vector<std::string> backend_command)
    : m_backend_command(std::move(backend_command))
{
}

bool SubprocessChannelFactory::is_usable(std::string &why) const
{
    if (m_backend_command.empty() || m_backend_command.front().empty())
    {
        why = "no backend command configured";
        return false;
    }
    if (find_in_path(m_backend_command.front()).empty())
    {
        why = fmt::format("backend executable '{}' not found", m_backend_command.front());
        return false;
    }
    return true;
}

std::vector<std::string> SubprocessChannelFactory::build_argv(const ChannelOptions &options) const
{
    std::vector<std::string> argv = m_backend_command;
    argv.insert(argv.end(), {"--print", "--input-format", "stream-json", "--output-format",
                             "stream-json", "--verbose"});
    if (!options.model.empty())
    {
        argv.insert(argv.end(), {"--model", options.model});
    }
    if (!options.system_prompt.empty())
    {
        argv.insert(argv.end(), {"--system-prompt", options.system_prompt});
    }
    argv.insert(argv.end(),
                {"--max-turns", "50", "--permission-mode", "bypassPermissions"});
    argv.insert(argv.end(), options.extra_args.begin(), options.extra_args.end());
    return argv;
}

std::string SubprocessChannelFactory::encode_user_message(const std::string &message)
{
    const nlohmann::json line = {
        {"type", "user"},
        {"message", {{"role", "user"}, {"content", message}}},
        {"parent_tool_use_id", nullptr},
        {"session_id", ""},
    };
    return line.dump() + "\n";
}

std::unique_ptr<SessionChannel>
SubprocessChannelFactory::open(utils::EventLoop &loop, const ChannelOptions &options,
                               SessionChannel::EventHandler on_event,
                               SessionChannel::EndHandler on_end)
{
    const std::vector<std::string> args = build_argv(options);
    std::vector<char *> argv;
    argv.reserve(args.size() + 1);
    for (const auto &a : args)
    {
        argv.push_back(const_cast<char *>(a.c_str()));
    }
    argv.push_back(nullptr);

    // Everything the child touches between fork and exec is prepared here.
    const std::string cwd = options.cwd;
    static constexpr char kChdirFailed[] = "poolhub: cannot chdir to session cwd\n";
    static constexpr char kExecFailed[] = "poolhub: cannot exec backend\n";

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    auto close_all = [&]() noexcept
    {
        for (int *p : {in_pipe, out_pipe, err_pipe})
        {
            close_fd(p[0]);
            close_fd(p[1]);
        }
    };
    if (::pipe2(in_pipe, O_CLOEXEC) == -1 || ::pipe2(out_pipe, O_CLOEXEC) == -1 ||
        ::pipe2(err_pipe, O_CLOEXEC) == -1)
    {
        const int err = errno;
        close_all();
        throw std::system_error(err, std::generic_category(), "SessionChannel: pipe2");
    }

    const pid_t pid = ::fork();
    if (pid == -1)
    {
        const int err = errno;
        close_all();
        throw std::system_error(err, std::generic_category(), "SessionChannel: fork");
    }
    if (pid == 0)
    {
        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        if (!cwd.empty() && ::chdir(cwd.c_str()) == -1)
        {
            (void)!::write(STDERR_FILENO, kChdirFailed, sizeof(kChdirFailed) - 1);
            ::_exit(126);
        }
        ::execvp(argv[0], argv.data());
        (void)!::write(STDERR_FILENO, kExecFailed, sizeof(kExecFailed) - 1);
        ::_exit(127);
    }

    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    auto state = std::make_shared<ChannelState>(loop);
    state->pid = pid;
    state->in_fd = in_pipe[1];
    state->out_fd = out_pipe[0];
    state->err_fd = err_pipe[0];
    state->on_event = std::move(on_event);
    state->on_end = std::move(on_end);
    auto channel = std::make_unique<SubprocessChannel>(state);

    set_nonblocking(state->in_fd);
    set_nonblocking(state->out_fd);
    set_nonblocking(state->err_fd);
    state->start_watching();

    LOGGER_DEBUG("SessionChannel[{}]: started '{}' (model={}, cwd={})", pid, args.front(),
                 options.model, cwd.empty() ? "." : cwd);
    return channel;
}

} // namespace poolhub::pool

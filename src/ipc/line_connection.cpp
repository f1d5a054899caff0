#include "ph_base.hpp"
#include "ipc/line_connection.hpp"
#include "utils/logger.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace poolhub::ipc::detail
{

namespace
{
constexpr size_t kReadChunk = 16 * 1024;
} // namespace

void set_nonblocking(int fd)
{
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags == -1 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1)
    {
        throw std::system_error(errno, std::generic_category(), "fcntl(O_NONBLOCK)");
    }
}

struct LineConnection::State : std::enable_shared_from_this<LineConnection::State>
{
    State(utils::EventLoop &l, int f, std::string n, LineHandler line_handler,
          CloseHandler close_handler)
        : loop(l), fd(f), name(std::move(n)), on_line(std::move(line_handler)),
          on_close(std::move(close_handler))
    {
    }

    utils::EventLoop &loop;
    int fd;
    std::string name;
    LineHandler on_line;
    CloseHandler on_close;
    std::string in_buffer;
    std::string out_buffer;
    bool want_write = false;
    bool closed = false;

    void start()
    {
        std::weak_ptr<State> weak = weak_from_this();
        loop.watch(fd, POLLIN,
                   [weak](short revents)
                   {
                       if (auto self = weak.lock())
                           self->on_io(revents);
                   });
    }

    void on_io(short revents)
    {
        if ((revents & POLLOUT) != 0)
        {
            flush(/*from_io=*/true);
            if (closed)
                return;
        }
        if ((revents & (POLLIN | POLLHUP | POLLERR)) != 0)
        {
            read_available();
        }
    }

    /**
     * @return false if the socket failed while writing. Outside of an I/O callback the
     *         close handler is left to the read side, which sees the same failure on the
     *         next poll, so that send() never calls back into its caller.
     */
    bool flush(bool from_io)
    {
        while (!out_buffer.empty())
        {
            const ssize_t n = ::send(fd, out_buffer.data(), out_buffer.size(), MSG_NOSIGNAL);
            if (n > 0)
            {
                out_buffer.erase(0, static_cast<size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR)
                continue;
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
            {
                if (!want_write)
                {
                    loop.update_events(fd, POLLIN | POLLOUT);
                    want_write = true;
                }
                return true;
            }
            const std::string reason = fmt::format("write failed: {}", std::strerror(errno));
            if (from_io)
            {
                fail(reason);
            }
            else
            {
                LOGGER_DEBUG("{}: {}", name, reason);
                out_buffer.clear();
                if (want_write)
                {
                    loop.update_events(fd, POLLIN);
                    want_write = false;
                }
            }
            return false;
        }
        if (want_write)
        {
            loop.update_events(fd, POLLIN);
            want_write = false;
        }
        return true;
    }

    void read_available()
    {
        std::array<char, kReadChunk> buf{};
        for (;;)
        {
            const ssize_t n = ::recv(fd, buf.data(), buf.size(), 0);
            if (n > 0)
            {
                in_buffer.append(buf.data(), static_cast<size_t>(n));
                dispatch_lines();
                if (closed)
                    return;
                if (in_buffer.size() > kMaxLineBytes)
                {
                    fail("line too long");
                    return;
                }
                continue;
            }
            if (n == 0)
            {
                fail("peer closed the connection");
                return;
            }
            if (errno == EINTR)
                continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK)
                return;
            fail(fmt::format("read failed: {}", std::strerror(errno)));
            return;
        }
    }

    void dispatch_lines()
    {
        size_t pos = 0;
        while (!closed)
        {
            const size_t nl = in_buffer.find('\n', pos);
            if (nl == std::string::npos)
                break;
            const std::string line = in_buffer.substr(pos, nl - pos);
            pos = nl + 1;
            if (format_tools::trim_whitespace(line).empty())
                continue;
            auto handler = on_line; // may close or destroy the connection
            handler(line);
        }
        if (!closed)
            in_buffer.erase(0, pos);
    }

    void release() noexcept
    {
        closed = true;
        if (fd >= 0)
        {
            loop.unwatch(fd);
            ::close(fd);
            fd = -1;
        }
        in_buffer.clear();
        out_buffer.clear();
    }

    void fail(const std::string &reason)
    {
        if (closed)
            return;
        LOGGER_DEBUG("{}: connection closed ({})", name, reason);
        auto handler = std::move(on_close);
        on_close = nullptr;
        on_line = nullptr;
        release();
        if (handler)
            handler(reason);
    }
};

LineConnection::LineConnection(utils::EventLoop &loop, int fd, std::string name,
                               LineHandler on_line, CloseHandler on_close)
    : m_state(std::make_shared<State>(loop, fd, std::move(name), std::move(on_line),
                                      std::move(on_close)))
{
    m_state->start();
}

LineConnection::~LineConnection()
{
    close();
}

bool LineConnection::send(std::string_view line)
{
    if (m_state->closed)
    {
        return false;
    }
    m_state->out_buffer.append(line);
    return m_state->flush(/*from_io=*/false);
}

void LineConnection::close() noexcept
{
    if (m_state->closed)
    {
        return;
    }
    m_state->on_line = nullptr;
    m_state->on_close = nullptr;
    // Nothing polls for POLLOUT after this: write what the socket takes right now.
    while (!m_state->out_buffer.empty())
    {
        const ssize_t n = ::send(m_state->fd, m_state->out_buffer.data(),
                                 m_state->out_buffer.size(), MSG_NOSIGNAL | MSG_DONTWAIT);
        if (n > 0)
        {
            m_state->out_buffer.erase(0, static_cast<size_t>(n));
        }
        else if (!(n < 0 && errno == EINTR))
        {
            break;
        }
    }
    m_state->release();
}

bool LineConnection::is_open() const noexcept
{
    return !m_state->closed;
}

const std::string &LineConnection::name() const noexcept
{
    return m_state->name;
}

} // namespace poolhub::ipc::detail

#include "ph_base.hpp"
#include "utils/event_loop.hpp"

#include <cerrno>
#include <csignal>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace poolhub::utils
{

namespace
{
void set_nonblocking_cloexec(int fd)
{
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags == -1 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1 ||
        ::fcntl(fd, F_SETFD, FD_CLOEXEC) == -1)
    {
        throw std::system_error(errno, std::generic_category(), "fcntl on wake pipe");
    }
}
} // namespace

EventLoop::EventLoop()
{
    if (::pipe(m_wake_pipe) == -1)
    {
        throw std::system_error(errno, std::generic_category(), "EventLoop: pipe()");
    }
    set_nonblocking_cloexec(m_wake_pipe[0]);
    set_nonblocking_cloexec(m_wake_pipe[1]);
}

EventLoop::~EventLoop()
{
    stop();
    if (m_thread.joinable())
    {
        if (m_thread.get_id() == std::this_thread::get_id())
        {
            m_thread.detach();
        }
        else
        {
            m_thread.join();
        }
    }
    ::close(m_wake_pipe[0]);
    ::close(m_wake_pipe[1]);
}

void EventLoop::start()
{
    if (m_running.exchange(true, std::memory_order_acq_rel))
    {
        return;
    }
    m_stop_requested.store(false, std::memory_order_release);
    m_thread = std::thread(&EventLoop::run, this);
}

void EventLoop::stop()
{
    if (!m_running.load(std::memory_order_acquire))
    {
        return;
    }
    m_stop_requested.store(true, std::memory_order_release);
    wake();
    if (in_loop_thread())
    {
        return;
    }
    if (m_thread.joinable())
    {
        m_thread.join();
    }
    m_running.store(false, std::memory_order_release);

    std::lock_guard<std::mutex> lock(m_mutex);
    m_posted.clear();
    m_timers.clear();
    m_timer_index.clear();
}

bool EventLoop::in_loop_thread() const noexcept
{
    return m_loop_thread_id.load(std::memory_order_acquire) == std::this_thread::get_id();
}

bool EventLoop::post(Task task)
{
    if (!m_running.load(std::memory_order_acquire) ||
        m_stop_requested.load(std::memory_order_acquire))
    {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_posted.push_back(std::move(task));
    }
    wake();
    return true;
}

EventLoop::TimerId EventLoop::call_later(std::chrono::milliseconds delay, Task task)
{
    TimerId id = kInvalidTimer;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        id = m_next_timer_id++;
        auto iter = m_timers.emplace(Clock::now() + delay, Timer{id, std::move(task)});
        m_timer_index.emplace(id, iter);
    }
    if (!in_loop_thread())
    {
        wake();
    }
    return id;
}

void EventLoop::cancel(TimerId id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto iter = m_timer_index.find(id);
    if (iter == m_timer_index.end())
    {
        return;
    }
    m_timers.erase(iter->second);
    m_timer_index.erase(iter);
}

void EventLoop::watch(int fd, short events, IoHandler handler)
{
    m_watchers[fd] = Watcher{events, m_next_watch_serial++,
                             std::make_shared<IoHandler>(std::move(handler))};
}

void EventLoop::update_events(int fd, short events)
{
    if (auto iter = m_watchers.find(fd); iter != m_watchers.end())
    {
        iter->second.events = events;
    }
}

void EventLoop::unwatch(int fd)
{
    m_watchers.erase(fd);
}

void EventLoop::wake()
{
    const char byte = 1;
    // EAGAIN means a wake-up is already pending.
    (void)!::write(m_wake_pipe[1], &byte, 1);
}

int EventLoop::next_timeout_ms()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_posted.empty())
    {
        return 0;
    }
    if (m_timers.empty())
    {
        return -1;
    }
    const auto now = Clock::now();
    const auto due = m_timers.begin()->first;
    if (due <= now)
    {
        return 0;
    }
    // Round up so a timer is never polled for slightly too early.
    const auto wait = std::chrono::ceil<std::chrono::milliseconds>(due - now);
    return static_cast<int>(std::min<int64_t>(wait.count(), 60'000));
}

void EventLoop::run_due_timers()
{
    const auto now = Clock::now();
    while (!m_stop_requested.load(std::memory_order_acquire))
    {
        Task task;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_timers.empty() || m_timers.begin()->first > now)
            {
                return;
            }
            auto node = m_timers.extract(m_timers.begin());
            m_timer_index.erase(node.mapped().id);
            task = std::move(node.mapped().task);
        }
        task();
    }
}

void EventLoop::run_posted()
{
    std::vector<Task> batch;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        batch.swap(m_posted);
    }
    for (auto &task : batch)
    {
        if (m_stop_requested.load(std::memory_order_acquire))
        {
            return;
        }
        task();
    }
}

void EventLoop::run()
{
    m_loop_thread_id.store(std::this_thread::get_id(), std::memory_order_release);
    std::vector<pollfd> fds;
    std::vector<uint64_t> serials;

    while (!m_stop_requested.load(std::memory_order_acquire))
    {
        fds.clear();
        serials.clear();
        fds.push_back(pollfd{m_wake_pipe[0], POLLIN, 0});
        serials.push_back(0);
        for (const auto &[fd, watcher] : m_watchers)
        {
            fds.push_back(pollfd{fd, watcher.events, 0});
            serials.push_back(watcher.serial);
        }

        const int ready = ::poll(fds.data(), fds.size(), next_timeout_ms());
        if (ready == -1 && errno != EINTR)
        {
            PH_PANIC("EventLoop: poll() failed: {}", std::system_category().message(errno));
        }

        if (ready > 0)
        {
            if ((fds[0].revents & POLLIN) != 0)
            {
                char drain[64];
                while (::read(m_wake_pipe[0], drain, sizeof(drain)) > 0)
                {
                }
            }
            for (size_t i = 1; i < fds.size(); ++i)
            {
                if (fds[i].revents == 0 || m_stop_requested.load(std::memory_order_acquire))
                {
                    continue;
                }
                auto iter = m_watchers.find(fds[i].fd);
                // Skip descriptors unwatched (or re-registered) by an earlier handler.
                if (iter == m_watchers.end() || iter->second.serial != serials[i])
                {
                    continue;
                }
                auto handler = iter->second.handler;
                (*handler)(fds[i].revents);
            }
        }

        run_posted();
        run_due_timers();
    }
    m_loop_thread_id.store(std::thread::id{}, std::memory_order_release);
}

// ============================================================================
// Lifecycle module
// ============================================================================

static void do_event_loop_startup(const char * /*arg*/)
{
    struct sigaction sa{};
    sa.sa_handler = SIG_IGN;
    sigemptyset(&sa.sa_mask);
    if (::sigaction(SIGPIPE, &sa, nullptr) == -1)
    {
        throw std::system_error(errno, std::generic_category(), "sigaction(SIGPIPE)");
    }
}

ModuleDef EventLoop::GetLifecycleModule()
{
    ModuleDef module("poolhub::utils::EventLoop");
    module.set_startup(&do_event_loop_startup);
    return module;
}

} // namespace poolhub::utils

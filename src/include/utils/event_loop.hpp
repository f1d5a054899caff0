#pragma once
/**
 * @file event_loop.hpp
 * @brief Single-threaded poll(2) reactor with timers and a cross-thread task queue.
 *
 * Every pool, server and client object in a process is driven by one EventLoop.
 * Their state is touched only from the loop thread; other threads hand work over with
 * `post()` (fire and forget) or `run_sync()` (wait for the result).
 *
 * Handlers registered with `watch()` and tasks queued with `call_later()` always run
 * on the loop thread, one at a time, so they need no locking among themselves.
 * A zero-delay `call_later` runs on a later turn of the loop, never synchronously,
 * which bounds the call-stack depth of callback chains.
 */
#include "ph_base.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace poolhub::utils
{

class POOLHUB_UTILS_EXPORT EventLoop
{
  public:
    using TimerId = uint64_t;
    using Task = std::function<void()>;
    /// Receives the poll() revents for the watched descriptor.
    using IoHandler = std::function<void(short revents)>;

    static constexpr TimerId kInvalidTimer = 0;

    EventLoop();
    /// Stops the loop (if running) and joins the thread.
    ~EventLoop();

    EventLoop(const EventLoop &) = delete;
    EventLoop &operator=(const EventLoop &) = delete;

    /** @brief Spawns the loop thread. No-op if already running. */
    void start();

    /**
     * @brief Stops the loop and joins its thread. Tasks still queued are discarded.
     *        When called from the loop thread itself the loop exits after the current
     *        callback returns and the join happens in the destructor.
     */
    void stop();

    [[nodiscard]] bool running() const noexcept { return m_running.load(std::memory_order_acquire); }
    [[nodiscard]] bool in_loop_thread() const noexcept;

    /**
     * @brief Queues @p task to run on the loop thread. Thread-safe.
     * @return false if the loop is not running (the task is dropped).
     */
    bool post(Task task);

    /**
     * @brief Runs @p task on the loop thread after @p delay. Thread-safe.
     * @return An id usable with cancel().
     */
    TimerId call_later(std::chrono::milliseconds delay, Task task);

    /** @brief Cancels a pending timer. Unknown or already-fired ids are ignored. */
    void cancel(TimerId id);

    /**
     * @brief Watches @p fd for @p events (POLLIN/POLLOUT). Loop thread only.
     *        Replaces any existing watcher on the same descriptor.
     */
    void watch(int fd, short events, IoHandler handler);

    /** @brief Changes the event mask of a watched descriptor. Loop thread only. */
    void update_events(int fd, short events);

    /** @brief Stops watching @p fd. Safe to call from inside that fd's handler. */
    void unwatch(int fd);

    /**
     * @brief Runs @p fn on the loop thread and returns its result (or rethrows its
     *        exception). Runs inline when already on the loop thread.
     * @throws std::runtime_error if the loop is not running.
     */
    template <typename F> auto run_sync(F &&fn) -> std::invoke_result_t<std::decay_t<F> &>
    {
        using R = std::invoke_result_t<std::decay_t<F> &>;
        if (in_loop_thread())
        {
            return fn();
        }
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        auto future = task->get_future();
        if (!post([task]() { (*task)(); }))
        {
            throw std::runtime_error("EventLoop::run_sync: event loop is not running");
        }
        return future.get();
    }

    /**
     * @brief Lifecycle module for process-wide reactor setup (ignores SIGPIPE so that a
     *        peer closing a socket or pipe surfaces as EPIPE instead of killing us).
     */
    static ModuleDef GetLifecycleModule();

  private:
    struct Watcher
    {
        short events = 0;
        uint64_t serial = 0;
        std::shared_ptr<IoHandler> handler;
    };
    struct Timer
    {
        TimerId id;
        Task task;
    };
    using Clock = std::chrono::steady_clock;

    void run();
    void wake();
    int next_timeout_ms();
    void run_due_timers();
    void run_posted();

    std::thread m_thread;
    std::atomic<std::thread::id> m_loop_thread_id{};
    std::atomic<bool> m_running{false};
    std::atomic<bool> m_stop_requested{false};
    int m_wake_pipe[2] = {-1, -1};

    std::mutex m_mutex; // guards m_posted, m_timers, m_timer_index, m_next_timer_id
    std::vector<Task> m_posted;
    std::multimap<Clock::time_point, Timer> m_timers;
    std::map<TimerId, std::multimap<Clock::time_point, Timer>::iterator> m_timer_index;
    TimerId m_next_timer_id = 1;

    // Loop thread only.
    std::map<int, Watcher> m_watchers;
    uint64_t m_next_watch_serial = 1;
};

} // namespace poolhub::utils

#pragma once
/**
 * @file pool_client.hpp
 * @brief Per-process entry point to the shared pools, with leader election and failover.
 *
 * Every participating process owns one PoolClient. On activate() it either connects to
 * the running leader's socket (role Client) or, if there is none, takes the leader lock
 * and starts an embedded PoolServer (role Server). A leader talks to its own server
 * through direct method calls; followers send requests over the socket.
 *
 * Activation:
 *   1. connect to an existing endpoint (connect plus hello, bounded by CONNECT_TIMEOUT)
 *   2. otherwise try the lock; on success become the server
 *   3. otherwise retry the connection up to MAX_RECONNECT_ATTEMPTS times,
 *      RECONNECT_DELAY apart, taking the lock as soon as its holder is dead
 *   4. as a last resort force the lock and become the server
 *
 * Failover: when a follower loses its connection, every in-flight request fails, and
 * the client retries with linear backoff (attempt n waits n * RECONNECT_DELAY): a
 * reconnect wins if another follower became leader first, otherwise the first to get
 * the lock does. A single guard prevents overlapping takeovers.
 *
 * Threading: the public API blocks and must be called from a thread other than the
 * EventLoop's; the work itself runs on the loop. Callbacks run on the loop thread.
 */
#include "ph_base.hpp"
#include "ipc/pool_protocol.hpp"
#include "pool/command_pool.hpp"
#include "pool/completion_pool.hpp"
#include "utils/event_loop.hpp"
#include "utils/ipc_path.hpp"
#include "utils/lock_file.hpp"
#include "utils/pool_config.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace poolhub::ipc
{

class PoolServer;

namespace detail
{
class LineConnection;
}

enum class Role
{
    None,
    Client,
    Server,
};

POOLHUB_UTILS_EXPORT const char *to_string(Role role) noexcept;

class POOLHUB_UTILS_EXPORT PoolClient
{
  public:
    using DegradedCallback = std::function<void(PoolKind)>;
    using RoleCallback = std::function<void(Role)>;

    static constexpr std::chrono::milliseconds CONNECT_TIMEOUT{2000};
    static constexpr std::chrono::milliseconds RECONNECT_DELAY{500};
    static constexpr int MAX_RECONNECT_ATTEMPTS = 3;
    static constexpr std::chrono::milliseconds REQUEST_TIMEOUT{60000};

    struct Options
    {
        utils::PoolConfig config;
        /// Empty state_dir means `config.resolved_state_dir()`.
        utils::IpcPaths paths;
        /// Empty means "<pid>-<random>".
        std::string client_id;
        /// Used by the embedded server; null means SubprocessChannelFactory.
        std::shared_ptr<pool::ChannelFactory> factory;
        DegradedCallback on_degraded;
        RoleCallback on_role_change;
    };

    PoolClient(utils::EventLoop &loop, Options options);
    /// Disposes (see dispose()).
    ~PoolClient();

    PoolClient(const PoolClient &) = delete;
    PoolClient &operator=(const PoolClient &) = delete;

    /**
     * @brief Joins or becomes the pool leader. Returns once the role is decided and, as
     *        leader, once both pools have settled. Returns the current role if already
     *        active.
     */
    Role activate();

    /** @return The completion text, or empty if none could be produced. */
    std::optional<std::string> get_completion(const pool::CompletionContext &context,
                                              std::stop_token stop = {});

    pool::CommandResult send_command(const std::string &message,
                                     std::optional<int> timeout_ms = std::nullopt);

    /** @brief True if completions can currently be served. */
    bool is_available();
    bool is_command_available();

    /**
     * @brief Stores @p config and, if the model changed, asks the leader to switch.
     *        The call returns once the leader has acknowledged (or on failure).
     */
    void update_config(const utils::PoolConfig &config);

    /** @brief Recycles both pools; returns once the leader reports completion. */
    bool recycle_all();

    /** @brief Status of both pools, or empty if not connected. */
    std::optional<nlohmann::json> get_pool_status();

    /**
     * @brief As leader, clears degradation and re-warms both pools; as follower, asks
     *        the leader to recycle everything.
     */
    bool restart();

    /**
     * @brief Asks the leader to shut down (all followers will then fail over).
     * @return true if the leader acknowledged.
     */
    bool shutdown_server();

    /**
     * @brief Fails all in-flight requests, closes the connection and, as leader, disposes
     *        the embedded server and releases the lock. Idempotent.
     */
    void dispose();

    [[nodiscard]] Role role() const noexcept { return m_role.load(std::memory_order_acquire); }
    [[nodiscard]] const std::string &client_id() const noexcept { return m_client_id; }
    /** @brief The model reported by the leader (or our own, as leader). */
    std::string current_model();

  private:
    using ResponseCallback =
        std::function<void(std::optional<Response> response, const std::string &error)>;

    struct PendingRequest
    {
        ResponseCallback callback;
        utils::EventLoop::TimerId timer = utils::EventLoop::kInvalidTimer;
    };

    template <typename T> T await_on_loop(std::function<void(std::function<void(T)>)> start,
                                          T fallback, const char *what);

    // Loop thread only.
    void activate_async(std::function<void(Role)> done);
    void retry_activation(int attempt);
    void finish_activation();
    void try_connect(std::function<void(bool)> done);
    void become_server(std::function<void()> done);
    void handle_disconnect(const std::string &reason);
    void attempt_takeover();
    void run_takeover_step();
    void on_server_line(std::string_view line);
    void handle_event(const Event &event);
    void send_request(Request request, ResponseCallback callback,
                      std::chrono::milliseconds timeout = REQUEST_TIMEOUT);
    void fail_all_pending(const std::string &reason);
    void dispose_on_loop();
    void set_role(Role role);
    bool local_server_usable() const noexcept;
    utils::LeaderLock &lock();

    utils::EventLoop &m_loop;
    utils::PoolConfig m_config;
    utils::IpcPaths m_paths;
    std::string m_client_id;
    std::shared_ptr<pool::ChannelFactory> m_factory;
    DegradedCallback m_on_degraded;
    RoleCallback m_on_role_change;

    std::atomic<Role> m_role{Role::None};

    // Loop thread only.
    std::unique_ptr<utils::LeaderLock> m_lock;
    std::unique_ptr<PoolServer> m_server;
    std::unique_ptr<detail::LineConnection> m_conn;
    std::map<std::string, PendingRequest> m_pending;
    std::string m_server_model;
    bool m_activating = false;
    std::vector<std::function<void(Role)>> m_activation_waiters;
    bool m_connecting = false;
    bool m_taking_over = false;
    int m_reconnect_attempts = 0;
    bool m_disposed = false;

    std::shared_ptr<int> m_alive = std::make_shared<int>(0);
};

} // namespace poolhub::ipc

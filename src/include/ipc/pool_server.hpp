#pragma once
/**
 * @file pool_server.hpp
 * @brief The leader's side of the pool socket: owns the pools and serves every client.
 *
 * Exactly one process per state directory runs a PoolServer: the one holding the
 * leader lock. It listens on `IpcPaths::socket_path`, owns one CompletionPool and one
 * CommandPool, and answers newline-delimited JSON requests (see pool_protocol.hpp).
 * Each response goes back to the connection that sent the request; responses for a
 * client that has meanwhile disconnected are dropped.
 *
 * Pool degradation and server shutdown are broadcast to every connected client.
 *
 * The leader process itself does not talk to its own socket: PoolClient calls the
 * public methods below directly (the "local fast path").
 *
 * Thread safety: none. Construct, call and destroy on the EventLoop thread (or after
 * the loop has stopped).
 */
#include "ph_base.hpp"
#include "ipc/pool_protocol.hpp"
#include "pool/command_pool.hpp"
#include "pool/completion_pool.hpp"
#include "utils/event_loop.hpp"
#include "utils/ipc_path.hpp"
#include "utils/lock_file.hpp"
#include "utils/pool_config.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

namespace poolhub::ipc
{

namespace detail
{
class LineConnection;
}

class POOLHUB_UTILS_EXPORT PoolServer
{
  public:
    using Done = std::function<void()>;
    using DegradedCallback = std::function<void(PoolKind)>;

    struct Options
    {
        utils::PoolConfig config;
        utils::IpcPaths paths;
        std::string server_id;
        std::shared_ptr<pool::ChannelFactory> factory;
        /// Also invoked for local degradation (in addition to the broadcast).
        DegradedCallback on_degraded;
    };

    /**
     * @param lock The leader lock, already held. The server releases it on dispose().
     */
    PoolServer(utils::EventLoop &loop, Options options, std::unique_ptr<utils::LeaderLock> lock);
    ~PoolServer();

    PoolServer(const PoolServer &) = delete;
    PoolServer &operator=(const PoolServer &) = delete;

    /**
     * @brief Binds the socket and activates both pools.
     *
     * The socket accepts connections as soon as this returns; requests that arrive
     * before warm-up completes wait for a slot like any other.
     *
     * @param on_ready Invoked once both pools have settled.
     * @throws std::system_error if the socket cannot be bound. The lock is released
     *         first.
     */
    void start(Done on_ready = {});

    /**
     * @brief Broadcasts server-shutting-down, closes every connection and the listener,
     *        disposes both pools, removes the socket file and releases the lock.
     *        Idempotent.
     */
    void dispose();

    // --- Local fast path (also backs the socket handlers) ---------------------------

    void get_completion(const pool::CompletionContext &context, std::stop_token stop,
                        pool::CompletionPool::CompletionCallback callback);
    void send_command(const std::string &message, std::optional<int> timeout_ms,
                      pool::CommandPool::CommandCallback callback);

    /** @brief Applies a model change to both pools; @p done runs once both settle. */
    void update_model(const std::string &model, Done done = {});
    void recycle(PoolKind pool, Done done = {});
    /** @brief Clears warm-up failure state and re-warms both pools. */
    void restart_pools(Done done = {});

    [[nodiscard]] StatusResponse status(const std::string &request_id = {}) const;

    [[nodiscard]] bool is_completion_available() const;
    [[nodiscard]] bool is_command_available() const;
    [[nodiscard]] bool is_disposed() const noexcept { return m_disposed; }
    [[nodiscard]] bool is_listening() const noexcept { return m_listen_fd >= 0; }
    [[nodiscard]] const std::string &model() const noexcept { return m_config.model; }
    [[nodiscard]] const std::string &server_id() const noexcept { return m_server_id; }
    [[nodiscard]] size_t connected_clients() const noexcept { return m_clients.size(); }

  private:
    struct Client
    {
        std::unique_ptr<detail::LineConnection> conn;
        std::string client_id;
    };

    void open_listener();
    void close_listener() noexcept;
    void accept_clients();
    void on_client_line(uint64_t conn_id, std::string_view line);
    void on_client_closed(uint64_t conn_id, const std::string &reason);

    void handle(uint64_t conn_id, const CompletionRequest &req);
    void handle(uint64_t conn_id, const CommandRequest &req);
    void handle(uint64_t conn_id, const StatusRequest &req);
    void handle(uint64_t conn_id, const ConfigUpdateRequest &req);
    void handle(uint64_t conn_id, const RecycleRequest &req);
    void handle(uint64_t conn_id, const WarmupRequest &req);
    void handle(uint64_t conn_id, const DisposeRequest &req);
    void handle(uint64_t conn_id, const ClientHelloRequest &req);

    void reply(uint64_t conn_id, const Response &response);
    void broadcast(const Event &event);
    void on_pool_degraded(PoolKind pool);

    utils::EventLoop &m_loop;
    utils::PoolConfig m_config;
    utils::IpcPaths m_paths;
    std::string m_server_id;
    std::shared_ptr<pool::ChannelFactory> m_factory;
    DegradedCallback m_on_degraded;
    std::unique_ptr<utils::LeaderLock> m_lock;

    std::unique_ptr<pool::CompletionPool> m_completion;
    std::unique_ptr<pool::CommandPool> m_command;

    int m_listen_fd = -1;
    std::map<uint64_t, Client> m_clients;
    uint64_t m_next_conn_id = 1;
    bool m_disposed = false;

    std::shared_ptr<int> m_alive = std::make_shared<int>(0);
};

/** @brief Builds pool options from a loaded configuration. */
POOLHUB_UTILS_EXPORT pool::CompletionPoolOptions
completion_pool_options(const utils::PoolConfig &config);
POOLHUB_UTILS_EXPORT pool::CommandPoolOptions command_pool_options(const utils::PoolConfig &config);

} // namespace poolhub::ipc

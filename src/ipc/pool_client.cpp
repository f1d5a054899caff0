#include "ph_base.hpp"
#include "ipc/pool_client.hpp"
#include "ipc/line_connection.hpp"
#include "ipc/pool_server.hpp"
#include "utils/logger.hpp"

#include <cerrno>
#include <cstring>
#include <future>
#include <system_error>
#include <utility>

#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace poolhub::ipc
{

namespace
{

struct ConnectAttempt
{
    int fd = -1; ///< owned until handed to the LineConnection
    std::string hello_id;
    utils::EventLoop::TimerId timer = utils::EventLoop::kInvalidTimer;
    bool finished = false;
    std::function<void(bool)> done;
};

nlohmann::json status_to_json(Role role, const StatusResponse &status)
{
    return {
        {"role", to_string(role)},
        {"model", status.model},
        {"connectedClients", status.connected_clients},
        {"completionPoolAvailable", status.completion_pool_available},
        {"commandPoolAvailable", status.command_pool_available},
        {"completionPool", status.completion_pool},
        {"commandPool", status.command_pool},
    };
}

const char *describe_failure(const std::optional<Response> &response, const std::string &error)
{
    if (!response)
    {
        return error.c_str();
    }
    if (const auto *err = std::get_if<ErrorResponse>(&*response))
    {
        return err->error.c_str();
    }
    return "request failed";
}

} // namespace

const char *to_string(Role role) noexcept
{
    switch (role)
    {
    case Role::None:
        return "none";
    case Role::Client:
        return "client";
    case Role::Server:
        return "server";
    }
    return "unknown";
}

PoolClient::PoolClient(utils::EventLoop &loop, Options options)
    : m_loop(loop), m_config(std::move(options.config)), m_paths(std::move(options.paths)),
      m_client_id(std::move(options.client_id)), m_factory(std::move(options.factory)),
      m_on_degraded(std::move(options.on_degraded)),
      m_on_role_change(std::move(options.on_role_change))
{
    if (m_paths.state_dir.empty())
    {
        m_paths = utils::IpcPaths::under(m_config.resolved_state_dir());
    }
    if (m_client_id.empty())
    {
        m_client_id = fmt::format("{}-{}", platform::get_pid(), generate_request_id());
    }
}

PoolClient::~PoolClient()
{
    auto teardown = [this]()
    {
        dispose_on_loop();
        m_alive.reset();
    };
    if (m_loop.running() && !m_loop.in_loop_thread())
    {
        try
        {
            m_loop.run_sync(teardown);
            return;
        }
        catch (const std::exception &e)
        {
            LOGGER_WARN("PoolClient[{}]: teardown on the event loop failed ({}), "
                        "disposing inline",
                        m_client_id, e.what());
        }
    }
    teardown();
}

template <typename T>
T PoolClient::await_on_loop(std::function<void(std::function<void(T)>)> start, T fallback,
                            const char *what)
{
    if (m_loop.in_loop_thread())
    {
        PH_PANIC("PoolClient::{} would deadlock: called on the event loop thread", what);
    }
    auto promise = std::make_shared<std::promise<T>>();
    auto future = promise->get_future();
    const bool posted = m_loop.post(
        [start = std::move(start), promise]()
        {
            auto fired = std::make_shared<bool>(false);
            start(
                [promise, fired](T value)
                {
                    if (*fired)
                        return;
                    *fired = true;
                    promise->set_value(std::move(value));
                });
        });
    if (!posted)
    {
        LOGGER_WARN("PoolClient::{}: event loop is not running", what);
        return fallback;
    }
    try
    {
        return future.get();
    }
    catch (const std::future_error &e)
    {
        // Every copy of the completion was dropped, e.g. because the loop stopped.
        LOGGER_DEBUG("PoolClient::{} abandoned: {}", what, e.what());
        return fallback;
    }
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

Role PoolClient::activate()
{
    return await_on_loop<Role>([this](std::function<void(Role)> done)
                               { activate_async(std::move(done)); },
                               Role::None, "activate");
}

std::optional<std::string> PoolClient::get_completion(const pool::CompletionContext &context,
                                                      std::stop_token stop)
{
    using Result = std::optional<std::string>;
    return await_on_loop<Result>(
        [this, context, stop](std::function<void(Result)> done)
        {
            if (m_disposed || stop.stop_requested())
            {
                done(std::nullopt);
                return;
            }
            if (role() == Role::Server)
            {
                if (!local_server_usable() || !m_server->is_completion_available())
                {
                    done(std::nullopt);
                    return;
                }
                m_server->get_completion(context, stop, std::move(done));
                return;
            }
            CompletionRequest req;
            req.id = generate_request_id();
            req.prefix = context.prefix;
            req.suffix = context.suffix;
            req.mode = context.mode;
            req.language_id = context.language_id;
            req.file_name = context.file_name;
            req.file_path = context.file_path;
            send_request(std::move(req),
                         [done](std::optional<Response> response, const std::string &error)
                         {
                             const auto *reply =
                                 response ? std::get_if<CompletionResponse>(&*response) : nullptr;
                             if (reply == nullptr || !reply->success)
                             {
                                 LOGGER_DEBUG("PoolClient: completion failed: {}",
                                              reply && reply->error
                                                  ? *reply->error
                                                  : std::string(describe_failure(response, error)));
                                 done(std::nullopt);
                                 return;
                             }
                             done(reply->completion);
                         });
        },
        std::nullopt, "get_completion");
}

pool::CommandResult PoolClient::send_command(const std::string &message,
                                             std::optional<int> timeout_ms)
{
    return await_on_loop<pool::CommandResult>(
        [this, message, timeout_ms](std::function<void(pool::CommandResult)> done)
        {
            if (m_disposed)
            {
                done({});
                return;
            }
            if (role() == Role::Server)
            {
                if (!local_server_usable() || !m_server->is_command_available())
                {
                    done({});
                    return;
                }
                m_server->send_command(message, timeout_ms, std::move(done));
                return;
            }
            auto wait = REQUEST_TIMEOUT;
            if (timeout_ms)
            {
                wait = std::max(wait, std::chrono::milliseconds(*timeout_ms) + CONNECT_TIMEOUT);
            }
            send_request(
                CommandRequest{generate_request_id(), message, timeout_ms},
                [done](std::optional<Response> response, const std::string &error)
                {
                    auto *reply = response ? std::get_if<CommandResponse>(&*response) : nullptr;
                    if (reply == nullptr || !reply->success)
                    {
                        LOGGER_WARN("PoolClient: command failed: {}",
                                    reply && reply->error
                                        ? *reply->error
                                        : std::string(describe_failure(response, error)));
                        done({});
                        return;
                    }
                    done(pool::CommandResult{std::move(reply->text), std::move(reply->meta)});
                },
                wait);
        },
        pool::CommandResult{}, "send_command");
}

bool PoolClient::is_available()
{
    return await_on_loop<bool>(
        [this](std::function<void(bool)> done)
        {
            switch (role())
            {
            case Role::Server:
                done(local_server_usable() && m_server->is_completion_available());
                return;
            case Role::Client:
                done(m_conn != nullptr && m_conn->is_open());
                return;
            case Role::None:
                break;
            }
            done(false);
        },
        false, "is_available");
}

bool PoolClient::is_command_available()
{
    return await_on_loop<bool>(
        [this](std::function<void(bool)> done)
        {
            switch (role())
            {
            case Role::Server:
                done(local_server_usable() && m_server->is_command_available());
                return;
            case Role::Client:
                done(m_conn != nullptr && m_conn->is_open());
                return;
            case Role::None:
                break;
            }
            done(false);
        },
        false, "is_command_available");
}

void PoolClient::update_config(const utils::PoolConfig &config)
{
    await_on_loop<bool>(
        [this, config](std::function<void(bool)> done)
        {
            const bool model_changed = config.model != m_config.model;
            m_config = config;
            if (!model_changed || m_disposed)
            {
                done(true);
                return;
            }
            LOGGER_INFO("PoolClient[{}]: model changed to {}", m_client_id, config.model);
            if (role() == Role::Server && local_server_usable())
            {
                m_server->update_model(config.model, [done]() { done(true); });
                return;
            }
            send_request(ConfigUpdateRequest{generate_request_id(), config.model},
                         [this, done, model = config.model](std::optional<Response> response,
                                                            const std::string &error)
                         {
                             if (response && response_success(*response))
                             {
                                 m_server_model = model;
                                 done(true);
                                 return;
                             }
                             LOGGER_WARN("PoolClient: config update failed: {}",
                                         describe_failure(response, error));
                             done(false);
                         });
        },
        false, "update_config");
}

bool PoolClient::recycle_all()
{
    return await_on_loop<bool>(
        [this](std::function<void(bool)> done)
        {
            if (m_disposed)
            {
                done(false);
                return;
            }
            if (role() == Role::Server && local_server_usable())
            {
                m_server->recycle(PoolKind::All, [done]() { done(true); });
                return;
            }
            send_request(RecycleRequest{generate_request_id(), PoolKind::All},
                         [done](std::optional<Response> response, const std::string &error)
                         {
                             const bool ok = response && response_success(*response);
                             if (!ok)
                                 LOGGER_WARN("PoolClient: recycle failed: {}",
                                             describe_failure(response, error));
                             done(ok);
                         });
        },
        false, "recycle_all");
}

std::optional<nlohmann::json> PoolClient::get_pool_status()
{
    using Result = std::optional<nlohmann::json>;
    return await_on_loop<Result>(
        [this](std::function<void(Result)> done)
        {
            if (m_disposed)
            {
                done(std::nullopt);
                return;
            }
            if (role() == Role::Server && local_server_usable())
            {
                done(status_to_json(Role::Server, m_server->status()));
                return;
            }
            send_request(StatusRequest{generate_request_id()},
                         [done](std::optional<Response> response, const std::string &error)
                         {
                             const auto *status =
                                 response ? std::get_if<StatusResponse>(&*response) : nullptr;
                             if (status == nullptr)
                             {
                                 LOGGER_DEBUG("PoolClient: status failed: {}",
                                              describe_failure(response, error));
                                 done(std::nullopt);
                                 return;
                             }
                             done(status_to_json(Role::Client, *status));
                         });
        },
        std::nullopt, "get_pool_status");
}

bool PoolClient::restart()
{
    return await_on_loop<bool>(
        [this](std::function<void(bool)> done)
        {
            if (m_disposed)
            {
                done(false);
                return;
            }
            if (role() == Role::Server && local_server_usable())
            {
                m_server->restart_pools([done]() { done(true); });
                return;
            }
            send_request(RecycleRequest{generate_request_id(), PoolKind::All},
                         [done](std::optional<Response> response, const std::string &)
                         { done(response && response_success(*response)); });
        },
        false, "restart");
}

bool PoolClient::shutdown_server()
{
    return await_on_loop<bool>(
        [this](std::function<void(bool)> done)
        {
            if (role() == Role::Server)
            {
                dispose_on_loop();
                done(true);
                return;
            }
            send_request(DisposeRequest{generate_request_id()},
                         [done](std::optional<Response> response, const std::string &error)
                         {
                             const bool ok = response && response_success(*response);
                             if (!ok)
                                 LOGGER_WARN("PoolClient: shutdown request failed: {}",
                                             describe_failure(response, error));
                             done(ok);
                         });
        },
        false, "shutdown_server");
}

void PoolClient::dispose()
{
    await_on_loop<bool>(
        [this](std::function<void(bool)> done)
        {
            dispose_on_loop();
            done(true);
        },
        false, "dispose");
}

std::string PoolClient::current_model()
{
    return await_on_loop<std::string>(
        [this](std::function<void(std::string)> done)
        {
            if (role() == Role::Server && m_server)
            {
                done(m_server->model());
                return;
            }
            done(m_server_model.empty() ? m_config.model : m_server_model);
        },
        m_config.model, "current_model");
}

// ---------------------------------------------------------------------------
// Activation and failover (loop thread)
// ---------------------------------------------------------------------------

void PoolClient::activate_async(std::function<void(Role)> done)
{
    if (role() != Role::None && !m_disposed)
    {
        done(role());
        return;
    }
    m_activation_waiters.push_back(std::move(done));
    if (m_activating)
    {
        return;
    }
    m_activating = true;
    m_disposed = false;
    m_reconnect_attempts = 0;
    m_taking_over = false;

    try
    {
        utils::ensure_state_dir(m_paths);
    }
    catch (const std::filesystem::filesystem_error &e)
    {
        LOGGER_ERROR("PoolClient[{}]: cannot create state directory: {}", m_client_id, e.what());
        finish_activation();
        return;
    }

    LOGGER_INFO("PoolClient[{}]: activating (state dir {})", m_client_id,
                m_paths.state_dir.string());
    try_connect(
        [this](bool connected)
        {
            if (m_disposed)
            {
                finish_activation();
                return;
            }
            if (connected)
            {
                set_role(Role::Client);
                finish_activation();
                return;
            }
            if (lock().try_acquire())
            {
                become_server([this]() { finish_activation(); });
                return;
            }
            retry_activation(1);
        });
}

void PoolClient::retry_activation(int attempt)
{
    if (attempt > MAX_RECONNECT_ATTEMPTS)
    {
        LOGGER_WARN("PoolClient[{}]: leader unreachable after {} attempts, forcing the lock",
                    m_client_id, MAX_RECONNECT_ATTEMPTS);
        lock().force_acquire();
        become_server([this]() { finish_activation(); });
        return;
    }
    LOGGER_DEBUG("PoolClient[{}]: lock is held by a live process, reconnect attempt {}",
                 m_client_id, attempt);
    std::weak_ptr<int> alive = m_alive;
    m_loop.call_later(RECONNECT_DELAY,
                      [this, alive, attempt]()
                      {
                          if (!alive.lock())
                              return;
                          if (m_disposed)
                          {
                              finish_activation();
                              return;
                          }
                          try_connect(
                              [this, attempt](bool connected)
                              {
                                  if (m_disposed)
                                  {
                                      finish_activation();
                                      return;
                                  }
                                  if (connected)
                                  {
                                      set_role(Role::Client);
                                      finish_activation();
                                      return;
                                  }
                                  if (lock().try_acquire())
                                  {
                                      become_server([this]() { finish_activation(); });
                                      return;
                                  }
                                  retry_activation(attempt + 1);
                              });
                      });
}

void PoolClient::finish_activation()
{
    if (!m_activating)
    {
        return;
    }
    m_activating = false;
    auto waiters = std::move(m_activation_waiters);
    m_activation_waiters.clear();
    LOGGER_INFO("PoolClient[{}]: active as {}", m_client_id, to_string(role()));
    for (auto &waiter : waiters)
    {
        waiter(role());
    }
}

void PoolClient::try_connect(std::function<void(bool)> done)
{
    if (m_connecting || m_disposed || !utils::endpoint_may_exist(m_paths))
    {
        done(false);
        return;
    }

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    const std::string path = m_paths.socket_path.string();
    if (path.size() >= sizeof(addr.sun_path))
    {
        LOGGER_ERROR("PoolClient: socket path too long: {}", path);
        done(false);
        return;
    }
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);

    const int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd == -1)
    {
        LOGGER_WARN("PoolClient: socket() failed: {}", std::strerror(errno));
        done(false);
        return;
    }
    const int rc = ::connect(fd, reinterpret_cast<const sockaddr *>(&addr), sizeof(addr));
    if (rc == -1 && errno != EINPROGRESS)
    {
        LOGGER_DEBUG("PoolClient: connect to {} failed: {}", path, std::strerror(errno));
        ::close(fd);
        done(false);
        return;
    }

    m_connecting = true;
    auto attempt = std::make_shared<ConnectAttempt>();
    attempt->fd = fd;
    attempt->done = std::move(done);
    std::weak_ptr<int> alive = m_alive;

    auto settle = std::make_shared<std::function<void(bool)>>(
        [this, attempt](bool ok)
        {
            if (attempt->finished)
                return;
            attempt->finished = true;
            m_connecting = false;
            m_loop.cancel(attempt->timer);
            if (attempt->fd >= 0)
            {
                m_loop.unwatch(attempt->fd);
                ::close(attempt->fd);
                attempt->fd = -1;
            }
            if (!ok)
            {
                if (const auto it = m_pending.find(attempt->hello_id); it != m_pending.end())
                {
                    m_loop.cancel(it->second.timer);
                    m_pending.erase(it);
                }
                m_conn.reset();
            }
            auto cb = std::move(attempt->done);
            cb(ok);
        });

    auto on_connected = [this, attempt, settle]()
    {
        const int connected = std::exchange(attempt->fd, -1);
        m_loop.unwatch(connected);
        m_conn = std::make_unique<detail::LineConnection>(
            m_loop, connected, fmt::format("PoolClient[{}]", m_client_id),
            [this](std::string_view line) { on_server_line(line); },
            [this](const std::string &reason) { handle_disconnect(reason); });

        ClientHelloRequest hello{generate_request_id(), m_client_id};
        attempt->hello_id = hello.id;
        send_request(
            std::move(hello),
            [this, settle](std::optional<Response> response, const std::string &error)
            {
                const auto *ack = response ? std::get_if<ClientHelloResponse>(&*response) : nullptr;
                if (ack == nullptr || !ack->success)
                {
                    LOGGER_DEBUG("PoolClient: hello failed: {}", describe_failure(response, error));
                    (*settle)(false);
                    return;
                }
                m_server_model = ack->model;
                LOGGER_INFO("PoolClient[{}]: connected to server {} (model {})", m_client_id,
                            ack->server_id, ack->model);
                (*settle)(true);
            },
            CONNECT_TIMEOUT);
    };

    attempt->timer = m_loop.call_later(CONNECT_TIMEOUT,
                                       [this, alive, settle]()
                                       {
                                           if (!alive.lock())
                                               return;
                                           LOGGER_WARN("PoolClient: connecting to {} timed out",
                                                       m_paths.socket_path.string());
                                           (*settle)(false);
                                       });

    if (rc == 0)
    {
        on_connected();
        return;
    }
    m_loop.watch(fd, POLLOUT,
                 [attempt, settle, on_connected](short)
                 {
                     if (attempt->finished || attempt->fd < 0)
                         return;
                     int err = 0;
                     socklen_t len = sizeof(err);
                     if (::getsockopt(attempt->fd, SOL_SOCKET, SO_ERROR, &err, &len) == -1)
                         err = errno;
                     if (err != 0)
                     {
                         LOGGER_DEBUG("PoolClient: connect failed: {}", std::strerror(err));
                         (*settle)(false);
                         return;
                     }
                     on_connected();
                 });
}

void PoolClient::become_server(std::function<void()> done)
{
    LOGGER_INFO("PoolClient[{}]: becoming the pool server", m_client_id);
    lock(); // make sure a lock object exists to hand over
    PoolServer::Options opts;
    opts.config = m_config;
    opts.paths = m_paths;
    opts.server_id = m_client_id;
    opts.factory = m_factory;
    opts.on_degraded = [this](PoolKind pool)
    {
        if (m_on_degraded)
            m_on_degraded(pool);
    };

    auto server = std::make_unique<PoolServer>(m_loop, std::move(opts), std::move(m_lock));
    try
    {
        server->start(done);
    }
    catch (const std::system_error &e)
    {
        LOGGER_ERROR("PoolClient[{}]: failed to start the pool server: {}", m_client_id, e.what());
        set_role(Role::None);
        done();
        return;
    }
    m_server = std::move(server);
    m_server_model = m_config.model;
    m_reconnect_attempts = 0;
    set_role(Role::Server);
}

void PoolClient::handle_disconnect(const std::string &reason)
{
    m_conn.reset();
    fail_all_pending("Server disconnected");
    if (m_connecting || m_disposed)
    {
        return;
    }
    LOGGER_WARN("PoolClient[{}]: lost the server connection ({})", m_client_id, reason);
    set_role(Role::None);
    attempt_takeover();
}

void PoolClient::attempt_takeover()
{
    if (m_disposed || role() == Role::Server || m_taking_over)
    {
        return;
    }
    m_taking_over = true;
    ++m_reconnect_attempts;
    const auto delay = RECONNECT_DELAY * m_reconnect_attempts;
    LOGGER_INFO("PoolClient[{}]: takeover attempt {}/{} in {} ms", m_client_id,
                m_reconnect_attempts, MAX_RECONNECT_ATTEMPTS, delay.count());
    std::weak_ptr<int> alive = m_alive;
    m_loop.call_later(delay,
                      [this, alive]()
                      {
                          if (alive.lock())
                              run_takeover_step();
                      });
}

void PoolClient::run_takeover_step()
{
    if (m_disposed)
    {
        m_taking_over = false;
        return;
    }
    try_connect(
        [this](bool connected)
        {
            if (m_disposed)
            {
                m_taking_over = false;
                return;
            }
            if (connected)
            {
                LOGGER_INFO("PoolClient[{}]: reconnected to the new leader", m_client_id);
                m_taking_over = false;
                m_reconnect_attempts = 0;
                set_role(Role::Client);
                return;
            }
            if (lock().try_acquire())
            {
                become_server([this]() { m_taking_over = false; });
                return;
            }
            m_taking_over = false;
            if (m_reconnect_attempts < MAX_RECONNECT_ATTEMPTS)
            {
                attempt_takeover();
                return;
            }
            LOGGER_ERROR("PoolClient[{}]: failover failed after {} attempts; pools unavailable",
                         m_client_id, m_reconnect_attempts);
        });
}

// ---------------------------------------------------------------------------
// Socket traffic (loop thread)
// ---------------------------------------------------------------------------

void PoolClient::on_server_line(std::string_view line)
{
    ServerMessage message;
    try
    {
        message = decode_server_message(line);
    }
    catch (const ProtocolError &e)
    {
        LOGGER_ERROR("PoolClient: cannot parse server message: {}", e.what());
        return;
    }

    if (const auto *event = std::get_if<Event>(&message))
    {
        handle_event(*event);
        return;
    }
    auto &response = std::get<Response>(message);
    const auto it = m_pending.find(response_id(response));
    if (it == m_pending.end())
    {
        LOGGER_DEBUG("PoolClient: response {} matches no pending request", response_id(response));
        return;
    }
    PendingRequest pending = std::move(it->second);
    m_pending.erase(it);
    m_loop.cancel(pending.timer);
    pending.callback(std::move(response), {});
}

void PoolClient::handle_event(const Event &event)
{
    std::visit(
        [this](const auto &ev)
        {
            using T = std::decay_t<decltype(ev)>;
            if constexpr (std::is_same_v<T, ServerShuttingDownEvent>)
            {
                LOGGER_INFO("PoolClient[{}]: server is shutting down", m_client_id);
                handle_disconnect("server shutting down");
            }
            else if constexpr (std::is_same_v<T, PoolDegradedEvent>)
            {
                LOGGER_WARN("PoolClient[{}]: {} pool degraded on the server", m_client_id,
                            to_string(ev.pool));
                if (m_on_degraded)
                    m_on_degraded(ev.pool);
            }
        },
        event);
}

void PoolClient::send_request(Request request, ResponseCallback callback,
                              std::chrono::milliseconds timeout)
{
    if (!m_conn || !m_conn->is_open())
    {
        callback(std::nullopt, "Not connected to server");
        return;
    }
    const std::string id = request_id(request);
    std::weak_ptr<int> alive = m_alive;
    PendingRequest pending;
    pending.callback = std::move(callback);
    pending.timer = m_loop.call_later(timeout,
                                      [this, alive, id]()
                                      {
                                          if (!alive.lock())
                                              return;
                                          const auto it = m_pending.find(id);
                                          if (it == m_pending.end())
                                              return;
                                          auto cb = std::move(it->second.callback);
                                          m_pending.erase(it);
                                          LOGGER_WARN("PoolClient: request {} timed out", id);
                                          cb(std::nullopt, "Request timed out");
                                      });
    m_pending.emplace(id, std::move(pending));

    if (!m_conn->send(encode(request)))
    {
        const auto it = m_pending.find(id);
        if (it != m_pending.end())
        {
            auto failed = std::move(it->second);
            m_pending.erase(it);
            m_loop.cancel(failed.timer);
            failed.callback(std::nullopt, "Failed to send request");
        }
    }
}

void PoolClient::fail_all_pending(const std::string &reason)
{
    auto pending = std::move(m_pending);
    m_pending.clear();
    for (auto &[id, request] : pending)
    {
        m_loop.cancel(request.timer);
        request.callback(std::nullopt, reason);
    }
}

void PoolClient::dispose_on_loop()
{
    if (m_disposed)
    {
        return;
    }
    m_disposed = true;
    LOGGER_INFO("PoolClient[{}]: disposing (role {})", m_client_id, to_string(role()));
    fail_all_pending("Client disposed");
    m_conn.reset();
    if (m_server)
    {
        m_server->dispose();
        m_server.reset();
    }
    if (m_lock)
    {
        m_lock->release();
    }
    set_role(Role::None);
    // An activation waiting on the server we just destroyed would never hear back.
    finish_activation();
}

void PoolClient::set_role(Role role)
{
    const Role previous = m_role.exchange(role, std::memory_order_acq_rel);
    if (previous == role)
    {
        return;
    }
    LOGGER_DEBUG("PoolClient[{}]: role {} -> {}", m_client_id, to_string(previous),
                 to_string(role));
    if (m_on_role_change)
    {
        m_on_role_change(role);
    }
}

bool PoolClient::local_server_usable() const noexcept
{
    return m_server != nullptr && !m_server->is_disposed();
}

utils::LeaderLock &PoolClient::lock()
{
    if (!m_lock)
    {
        m_lock = std::make_unique<utils::LeaderLock>(m_paths.lock_path);
    }
    return *m_lock;
}

} // namespace poolhub::ipc

#include "ph_base.hpp"
#include "ipc/pool_server.hpp"
#include "ipc/line_connection.hpp"
#include "utils/logger.hpp"

#include <cerrno>
#include <cstring>
#include <system_error>
#include <type_traits>

#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

namespace poolhub::ipc
{

namespace
{

constexpr int kListenBacklog = 64;

/// Runs @p done after @p count calls of the returned function.
std::function<void()> make_join(int count, std::function<void()> done)
{
    auto remaining = std::make_shared<int>(count);
    auto shared_done = std::make_shared<std::function<void()>>(std::move(done));
    return [remaining, shared_done]()
    {
        if (--*remaining == 0 && *shared_done)
        {
            (*shared_done)();
        }
    };
}

} // namespace

pool::CompletionPoolOptions completion_pool_options(const utils::PoolConfig &config)
{
    pool::CompletionPoolOptions opts;
    opts.model = config.model;
    opts.system_prompt = config.completion_system_prompt;
    opts.cwd = config.cwd.empty() ? config.resolved_state_dir().string() : config.cwd;
    opts.extra_args = config.backend_extra_args;
    opts.size = static_cast<size_t>(config.completion_pool_size);
    opts.max_reuses = config.completion_max_reuses;
    return opts;
}

pool::CommandPoolOptions command_pool_options(const utils::PoolConfig &config)
{
    pool::CommandPoolOptions opts;
    opts.model = config.model;
    opts.system_prompt = config.command_system_prompt;
    opts.cwd = config.cwd.empty() ? config.resolved_state_dir().string() : config.cwd;
    opts.extra_args = config.backend_extra_args;
    opts.max_reuses = config.command_max_reuses;
    return opts;
}

PoolServer::PoolServer(utils::EventLoop &loop, Options options,
                       std::unique_ptr<utils::LeaderLock> lock)
    : m_loop(loop), m_config(std::move(options.config)), m_paths(std::move(options.paths)),
      m_server_id(std::move(options.server_id)), m_factory(std::move(options.factory)),
      m_on_degraded(std::move(options.on_degraded)), m_lock(std::move(lock))
{
    if (!m_factory)
    {
        m_factory = std::make_shared<pool::SubprocessChannelFactory>(m_config.backend_command);
    }
    m_completion = std::make_unique<pool::CompletionPool>(m_loop, m_factory,
                                                          completion_pool_options(m_config));
    m_command =
        std::make_unique<pool::CommandPool>(m_loop, m_factory, command_pool_options(m_config));
    m_completion->set_on_degraded([this]() { on_pool_degraded(PoolKind::Completion); });
    m_command->set_on_degraded([this]() { on_pool_degraded(PoolKind::Command); });
}

PoolServer::~PoolServer()
{
    m_alive.reset();
    m_clients.clear();
    close_listener();
    if (m_lock)
    {
        m_lock->release();
    }
}

void PoolServer::start(Done on_ready)
{
    try
    {
        utils::ensure_state_dir(m_paths);
        utils::cleanup_stale_endpoint(m_paths);
        open_listener();
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("PoolServer: cannot listen on {}: {}", m_paths.socket_path.string(),
                     e.what());
        if (m_lock)
        {
            m_lock->release();
        }
        throw;
    }
    LOGGER_INFO("PoolServer[{}]: listening on {} (model {})", m_server_id,
                m_paths.socket_path.string(), m_config.model);

    auto join = make_join(2,
                          [this, on_ready = std::move(on_ready)]()
                          {
                              LOGGER_INFO("PoolServer[{}]: pools ready (completion: {}, "
                                          "command: {})",
                                          m_server_id, is_completion_available(),
                                          is_command_available());
                              if (on_ready)
                                  on_ready();
                          });
    m_completion->activate(join);
    m_command->activate(join);
}

void PoolServer::open_listener()
{
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    const std::string path = m_paths.socket_path.string();
    if (path.size() >= sizeof(addr.sun_path))
    {
        throw std::system_error(ENAMETOOLONG, std::generic_category(),
                                "socket path too long: " + path);
    }
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);

    const int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd == -1)
    {
        throw std::system_error(errno, std::generic_category(), "socket");
    }
    auto close_on_error = basics::make_scope_guard([fd] { ::close(fd); });

    if (::bind(fd, reinterpret_cast<const sockaddr *>(&addr), sizeof(addr)) == -1)
    {
        throw std::system_error(errno, std::generic_category(), "bind " + path);
    }
    ::chmod(path.c_str(), S_IRUSR | S_IWUSR);
    if (::listen(fd, kListenBacklog) == -1)
    {
        throw std::system_error(errno, std::generic_category(), "listen " + path);
    }
    close_on_error.dismiss();

    m_listen_fd = fd;
    std::weak_ptr<int> alive = m_alive;
    m_loop.watch(m_listen_fd, POLLIN,
                 [this, alive](short)
                 {
                     if (alive.lock())
                         accept_clients();
                 });
}

void PoolServer::close_listener() noexcept
{
    if (m_listen_fd < 0)
    {
        return;
    }
    m_loop.unwatch(m_listen_fd);
    ::close(m_listen_fd);
    m_listen_fd = -1;
}

void PoolServer::accept_clients()
{
    for (;;)
    {
        const int fd = ::accept4(m_listen_fd, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
        if (fd == -1)
        {
            if (errno == EINTR || errno == ECONNABORTED)
                continue;
            if (errno != EAGAIN && errno != EWOULDBLOCK)
            {
                LOGGER_WARN("PoolServer: accept failed: {}", std::strerror(errno));
            }
            return;
        }
        const uint64_t conn_id = m_next_conn_id++;
        Client client;
        client.conn = std::make_unique<detail::LineConnection>(
            m_loop, fd, fmt::format("PoolServer client #{}", conn_id),
            [this, conn_id](std::string_view line) { on_client_line(conn_id, line); },
            [this, conn_id](const std::string &reason) { on_client_closed(conn_id, reason); });
        m_clients.emplace(conn_id, std::move(client));
        LOGGER_DEBUG("PoolServer: client #{} connected ({} total)", conn_id, m_clients.size());
    }
}

void PoolServer::on_client_closed(uint64_t conn_id, const std::string &reason)
{
    const auto it = m_clients.find(conn_id);
    if (it == m_clients.end())
    {
        return;
    }
    LOGGER_INFO("PoolServer: client #{} ({}) disconnected: {}", conn_id,
                it->second.client_id.empty() ? "unnamed" : it->second.client_id, reason);
    m_clients.erase(it);
}

void PoolServer::on_client_line(uint64_t conn_id, std::string_view line)
{
    Request request;
    try
    {
        request = decode_request(line);
    }
    catch (const ProtocolError &e)
    {
        if (e.request_id().empty())
        {
            LOGGER_WARN("PoolServer: dropping undecodable message from client #{}: {}", conn_id,
                        e.what());
            return;
        }
        LOGGER_WARN("PoolServer: rejecting request {} from client #{}: {}", e.request_id(),
                    conn_id, e.what());
        reply(conn_id, ErrorResponse{e.request_id(), e.what()});
        return;
    }
    LOGGER_TRACE("PoolServer: client #{} -> {} {}", conn_id, request_type(request),
                 request_id(request));
    std::visit([this, conn_id](const auto &req) { handle(conn_id, req); }, request);
}

void PoolServer::reply(uint64_t conn_id, const Response &response)
{
    const auto it = m_clients.find(conn_id);
    if (it == m_clients.end())
    {
        LOGGER_DEBUG("PoolServer: client #{} gone, dropping {} response {}", conn_id,
                     response_type(response), response_id(response));
        return;
    }
    it->second.conn->send(encode(response));
}

void PoolServer::broadcast(const Event &event)
{
    const std::string line = encode(event);
    for (auto &[conn_id, client] : m_clients)
    {
        client.conn->send(line);
    }
}

void PoolServer::on_pool_degraded(PoolKind pool)
{
    LOGGER_ERROR("PoolServer: {} pool degraded", to_string(pool));
    broadcast(PoolDegradedEvent{pool});
    if (m_on_degraded)
    {
        m_on_degraded(pool);
    }
}

// ---------------------------------------------------------------------------
// Request handlers
// ---------------------------------------------------------------------------

void PoolServer::handle(uint64_t conn_id, const CompletionRequest &req)
{
    if (!is_completion_available())
    {
        reply(conn_id, CompletionResponse{req.id, false, std::nullopt,
                                          "Completion pool not available"});
        return;
    }
    pool::CompletionContext ctx;
    ctx.prefix = req.prefix;
    ctx.suffix = req.suffix;
    ctx.mode = req.mode;
    ctx.language_id = req.language_id;
    ctx.file_name = req.file_name;
    ctx.file_path = req.file_path;
    get_completion(ctx, {},
                   [this, conn_id, id = req.id](std::optional<std::string> text)
                   { reply(conn_id, CompletionResponse{id, true, std::move(text), std::nullopt}); });
}

void PoolServer::handle(uint64_t conn_id, const CommandRequest &req)
{
    if (!is_command_available())
    {
        CommandResponse response;
        response.id = req.id;
        response.success = false;
        response.error = "Command pool not available";
        reply(conn_id, response);
        return;
    }
    send_command(req.message, req.timeout_ms,
                 [this, conn_id, id = req.id](pool::CommandResult result)
                 {
                     CommandResponse response;
                     response.id = id;
                     response.text = std::move(result.text);
                     response.meta = std::move(result.meta);
                     reply(conn_id, response);
                 });
}

void PoolServer::handle(uint64_t conn_id, const StatusRequest &req)
{
    reply(conn_id, status(req.id));
}

void PoolServer::handle(uint64_t conn_id, const ConfigUpdateRequest &req)
{
    if (!req.model || req.model->empty())
    {
        reply(conn_id, ConfigUpdateResponse{req.id, true, std::nullopt});
        return;
    }
    update_model(*req.model, [this, conn_id, id = req.id]()
                 { reply(conn_id, ConfigUpdateResponse{id, true, std::nullopt}); });
}

void PoolServer::handle(uint64_t conn_id, const RecycleRequest &req)
{
    recycle(req.pool,
            [this, conn_id, id = req.id]()
            { reply(conn_id, RecycleResponse{id, true, std::nullopt}); });
}

void PoolServer::handle(uint64_t conn_id, const WarmupRequest &req)
{
    // Pools warm themselves on start and after every recycle.
    reply(conn_id, WarmupResponse{req.id, true, std::nullopt});
}

void PoolServer::handle(uint64_t conn_id, const DisposeRequest &req)
{
    LOGGER_INFO("PoolServer: dispose requested by client #{}", conn_id);
    reply(conn_id, DisposeResponse{req.id, true});
    std::weak_ptr<int> alive = m_alive;
    m_loop.call_later(std::chrono::milliseconds(0),
                      [this, alive]()
                      {
                          if (alive.lock())
                              dispose();
                      });
}

void PoolServer::handle(uint64_t conn_id, const ClientHelloRequest &req)
{
    if (const auto it = m_clients.find(conn_id); it != m_clients.end())
    {
        it->second.client_id = req.client_id;
    }
    LOGGER_INFO("PoolServer: client #{} identified as {}", conn_id, req.client_id);
    reply(conn_id, ClientHelloResponse{req.id, true, m_server_id, m_config.model});
}

// ---------------------------------------------------------------------------
// Local fast path
// ---------------------------------------------------------------------------

void PoolServer::get_completion(const pool::CompletionContext &context, std::stop_token stop,
                                pool::CompletionPool::CompletionCallback callback)
{
    m_completion->get_completion(context, std::move(stop), std::move(callback));
}

void PoolServer::send_command(const std::string &message, std::optional<int> timeout_ms,
                              pool::CommandPool::CommandCallback callback)
{
    m_command->send_prompt(message, timeout_ms, std::move(callback));
}

void PoolServer::update_model(const std::string &model, Done done)
{
    if (model != m_config.model)
    {
        LOGGER_INFO("PoolServer: switching model {} -> {}", m_config.model, model);
        m_config.model = model;
    }
    auto join = make_join(2, std::move(done));
    m_completion->set_model(model, join);
    m_command->set_model(model, join);
}

void PoolServer::recycle(PoolKind pool, Done done)
{
    switch (pool)
    {
    case PoolKind::Completion:
        m_completion->recycle_all(std::move(done));
        break;
    case PoolKind::Command:
        m_command->recycle_all(std::move(done));
        break;
    case PoolKind::All:
    {
        auto join = make_join(2, std::move(done));
        m_completion->recycle_all(join);
        m_command->recycle_all(join);
        break;
    }
    }
}

void PoolServer::restart_pools(Done done)
{
    LOGGER_INFO("PoolServer: restarting pools");
    auto join = make_join(2, std::move(done));
    m_completion->restart(join);
    m_command->restart(join);
}

StatusResponse PoolServer::status(const std::string &request_id) const
{
    StatusResponse response;
    response.id = request_id;
    response.completion_pool_available = is_completion_available();
    response.command_pool_available = is_command_available();
    response.connected_clients = static_cast<int>(m_clients.size());
    response.model = m_config.model;
    response.completion_pool = m_completion->stats().to_json();
    response.command_pool = m_command->stats().to_json();
    return response;
}

bool PoolServer::is_completion_available() const
{
    return !m_disposed && m_completion->is_available();
}

bool PoolServer::is_command_available() const
{
    return !m_disposed && m_command->is_available();
}

void PoolServer::dispose()
{
    if (m_disposed)
    {
        return;
    }
    m_disposed = true;
    LOGGER_INFO("PoolServer[{}]: shutting down ({} clients)", m_server_id, m_clients.size());

    broadcast(ServerShuttingDownEvent{});
    for (auto &[conn_id, client] : m_clients)
    {
        client.conn->close();
    }
    m_clients.clear();
    close_listener();

    m_completion->dispose();
    m_command->dispose();

    utils::cleanup_stale_endpoint(m_paths);
    if (m_lock)
    {
        m_lock->release();
    }
    LOGGER_INFO("PoolServer[{}]: disposed", m_server_id);
}

} // namespace poolhub::ipc

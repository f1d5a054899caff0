#pragma once
/**
 * @file line_connection.hpp
 * @brief Internal: newline-framed, non-blocking stream socket driven by the EventLoop.
 *
 * Used by both ends of the pool socket. Outgoing lines are queued and flushed as the
 * socket becomes writable; incoming bytes are split on '\n' and handed over one line at
 * a time. The close handler runs once, when the peer hangs up or an I/O error occurs,
 * never for a local close().
 *
 * Handlers may destroy the LineConnection that invoked them.
 */
#include "ph_base.hpp"
#include "utils/event_loop.hpp"

#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace poolhub::ipc::detail
{

class LineConnection
{
  public:
    using LineHandler = std::function<void(std::string_view line)>;
    using CloseHandler = std::function<void(const std::string &reason)>;

    /// A peer that sends this much without a newline is disconnected.
    static constexpr size_t kMaxLineBytes = 16u * 1024u * 1024u;

    /** @brief Takes ownership of the connected, non-blocking @p fd and starts reading. */
    LineConnection(utils::EventLoop &loop, int fd, std::string name, LineHandler on_line,
                   CloseHandler on_close);
    ~LineConnection();

    LineConnection(const LineConnection &) = delete;
    LineConnection &operator=(const LineConnection &) = delete;

    /** @brief Queues @p line (which must end in '\n'). @return false if closed. */
    bool send(std::string_view line);

    /**
     * @brief Writes whatever can be written without blocking, then closes the socket.
     *        No handler runs afterwards.
     */
    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept;
    [[nodiscard]] const std::string &name() const noexcept;

  private:
    struct State;
    std::shared_ptr<State> m_state;
};

/** @brief Sets O_NONBLOCK. @throws std::system_error */
void set_nonblocking(int fd);

} // namespace poolhub::ipc::detail

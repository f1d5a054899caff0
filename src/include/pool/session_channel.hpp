#pragma once
/**
 * @file session_channel.hpp
 * @brief Push-based conduit between one pool slot and one backend session process.
 *
 * A SessionChannel accepts user messages through push() and reports every JSON object
 * the backend writes to stdout through the event handler. When the output stream ends
 * for any reason (EOF, read error, process exit) the end handler is invoked exactly
 * once. After close() returns neither handler is invoked again.
 *
 * All methods and both handlers run on the EventLoop thread the channel was opened on.
 */
#include "ph_base.hpp"
#include "utils/event_loop.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace poolhub::pool
{

/// Per-session parameters handed to the backend on its command line.
struct ChannelOptions
{
    std::string model;
    std::string system_prompt;
    std::string cwd;
    std::vector<std::string> extra_args;
};

class POOLHUB_UTILS_EXPORT SessionChannel
{
  public:
    using EventHandler = std::function<void(const nlohmann::json &event)>;
    using EndHandler = std::function<void(const std::string &reason)>;

    virtual ~SessionChannel() = default;

    /** @brief Queues one user message for the backend. Ignored after close(). */
    virtual void push(const std::string &message) = 0;

    /** @brief Terminates the session. Idempotent; suppresses all further callbacks. */
    virtual void close() = 0;

    [[nodiscard]] virtual bool is_open() const noexcept = 0;
};

class POOLHUB_UTILS_EXPORT ChannelFactory
{
  public:
    virtual ~ChannelFactory() = default;

    /**
     * @brief Starts a session.
     * @throws std::system_error if the session process cannot be created.
     */
    virtual std::unique_ptr<SessionChannel> open(utils::EventLoop &loop,
                                                 const ChannelOptions &options,
                                                 SessionChannel::EventHandler on_event,
                                                 SessionChannel::EndHandler on_end) = 0;

    /**
     * @brief Reports whether sessions can be started at all.
     * @param why Receives a human-readable reason when the answer is false.
     */
    virtual bool is_usable(std::string &why) const = 0;
};

/**
 * @brief Launches the backend CLI in stream-json mode, one child process per session.
 */
class POOLHUB_UTILS_EXPORT SubprocessChannelFactory : public ChannelFactory
{
  public:
    /// Grace period between SIGTERM and SIGKILL when a session is closed.
    static constexpr std::chrono::milliseconds kTerminateGrace{1000};

    explicit SubprocessChannelFactory(std::vector<std::string> backend_command);

    std::unique_ptr<SessionChannel> open(utils::EventLoop &loop, const ChannelOptions &options,
                                         SessionChannel::EventHandler on_event,
                                         SessionChannel::EndHandler on_end) override;

    bool is_usable(std::string &why) const override;

    /** @brief Full argv of a session started with @p options. */
    [[nodiscard]] std::vector<std::string> build_argv(const ChannelOptions &options) const;

    /** @brief One stdin line carrying @p message as a user turn. */
    static std::string encode_user_message(const std::string &message);

  private:
    std::vector<std::string> m_backend_command;
};

} // namespace poolhub::pool

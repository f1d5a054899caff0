#include "ph_base.hpp"
#include "pool/command_pool.hpp"
#include "utils/logger.hpp"

namespace poolhub::pool
{

CommandPool::CommandPool(utils::EventLoop &loop, std::shared_ptr<ChannelFactory> factory,
                         CommandPoolOptions options)
    : SlotPool(loop, std::move(factory), "CommandPool", 1), m_options(std::move(options))
{
}

void CommandPool::send_prompt(const std::string &message, std::optional<int> timeout_ms,
                              CommandCallback callback)
{
    acquire_slot(
        [this, message, timeout_ms, cb = std::move(callback)](std::optional<size_t> slot)
        {
            if (!slot)
            {
                cb(CommandResult{});
                return;
            }

            // Shared between the reply and the timeout; whichever runs first wins.
            struct Pending
            {
                utils::EventLoop::TimerId timer = utils::EventLoop::kInvalidTimer;
                bool finished = false;
            };
            auto pending = std::make_shared<Pending>();

            const uint64_t request_id = submit(
                *slot, message,
                [this, pending, cb](std::optional<std::string> text, std::optional<ResultMeta> meta)
                {
                    if (pending->finished)
                        return;
                    pending->finished = true;
                    if (pending->timer != utils::EventLoop::kInvalidTimer)
                        loop().cancel(pending->timer);
                    CommandResult result;
                    result.text = std::move(text);
                    if (meta)
                        result.meta = meta->to_json();
                    cb(std::move(result));
                });

            if (request_id != 0 && timeout_ms && *timeout_ms > 0)
            {
                const size_t index = *slot;
                pending->timer = loop().call_later(
                    std::chrono::milliseconds(*timeout_ms),
                    [this, alive = alive_token(), pending, index, request_id,
                     timeout = *timeout_ms]()
                    {
                        if (alive.expired() || pending->finished)
                            return;
                        pending->timer = utils::EventLoop::kInvalidTimer;
                        LOGGER_WARN("CommandPool: no reply within {} ms", timeout);
                        abort_request(index, request_id);
                    });
            }
        });
}

void CommandPool::set_model(const std::string &model, Done done)
{
    if (model == m_options.model)
    {
        if (done)
            done();
        return;
    }
    LOGGER_INFO("CommandPool: model changed {} -> {}, recycling", m_options.model, model);
    m_options.model = model;
    recycle_all(std::move(done));
}

bool CommandPool::validate_warmup(const std::string &text) const
{
    return format_tools::to_lower(format_tools::trim_whitespace(text)).find("ready") !=
           std::string::npos;
}

ChannelOptions CommandPool::channel_options() const
{
    ChannelOptions opts;
    opts.model = m_options.model;
    opts.system_prompt =
        m_options.system_prompt.empty() ? kDefaultCommandSystemPrompt : m_options.system_prompt;
    opts.cwd = m_options.cwd;
    opts.extra_args = m_options.extra_args;
    return opts;
}

} // namespace poolhub::pool

#include "ph_base.hpp"
#include "pool/completion_pool.hpp"
#include "pool/fill_message.hpp"
#include "utils/logger.hpp"

namespace poolhub::pool
{

CompletionPool::CompletionPool(utils::EventLoop &loop, std::shared_ptr<ChannelFactory> factory,
                               CompletionPoolOptions options)
    : SlotPool(loop, std::move(factory), "CompletionPool", options.size),
      m_options(std::move(options))
{
}

void CompletionPool::get_completion(const CompletionContext &context, std::stop_token stop,
                                    CompletionCallback callback)
{
    FillMessage fill = build_fill_message(context.prefix, context.suffix);

    acquire_slot(
        [this, fill = std::move(fill), cb = std::move(callback)](std::optional<size_t> slot)
        {
            if (!slot)
            {
                cb(std::nullopt);
                return;
            }
            LOGGER_TRACE("CompletionPool: slot {} -> {}", *slot, fill.message);
            submit(*slot, fill.message,
                   [cs = fill.completion_start, cb](std::optional<std::string> raw,
                                                    std::optional<ResultMeta>)
                   {
                       if (!raw || raw->empty())
                       {
                           cb(std::nullopt);
                           return;
                       }
                       const std::string extracted = extract_output(*raw);
                       std::optional<std::string> stripped = strip_completion_start(extracted, cs);
                       if (!stripped)
                       {
                           LOGGER_DEBUG("CompletionPool: completion start mismatch: expected "
                                        "\"{}\", got \"{}\"",
                                        cs.substr(0, 20), extracted.substr(0, 20));
                       }
                       cb(std::move(stripped));
                   });
        },
        std::move(stop));
}

void CompletionPool::set_model(const std::string &model, Done done)
{
    if (model == m_options.model)
    {
        if (done)
            done();
        return;
    }
    LOGGER_INFO("CompletionPool: model changed {} -> {}, recycling", m_options.model, model);
    m_options.model = model;
    recycle_all(std::move(done));
}

std::string CompletionPool::warmup_message() const
{
    return build_fill_message(kWarmupPrefix, kWarmupSuffix).message;
}

bool CompletionPool::validate_warmup(const std::string &text) const
{
    const FillMessage warmup = build_fill_message(kWarmupPrefix, kWarmupSuffix);
    const std::optional<std::string> stripped =
        strip_completion_start(extract_output(text), warmup.completion_start);
    if (!stripped)
    {
        return false;
    }
    return format_tools::to_lower(format_tools::trim_whitespace(*stripped)) == kWarmupExpected;
}

ChannelOptions CompletionPool::channel_options() const
{
    ChannelOptions opts;
    opts.model = m_options.model;
    opts.system_prompt = m_options.system_prompt.empty() ? default_completion_system_prompt()
                                                         : m_options.system_prompt;
    opts.cwd = m_options.cwd;
    opts.extra_args = m_options.extra_args;
    return opts;
}

} // namespace poolhub::pool

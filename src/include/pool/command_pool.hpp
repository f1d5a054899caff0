#pragma once
/**
 * @file command_pool.hpp
 * @brief Single-slot pool for free-form one-shot prompts (commit messages, edits, ...).
 */
#include "ph_base.hpp"
#include "pool/slot_pool.hpp"

#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace poolhub::pool
{

struct CommandResult
{
    std::optional<std::string> text;
    std::optional<nlohmann::json> meta;
};

struct CommandPoolOptions
{
    std::string model;
    std::string system_prompt; ///< empty selects kDefaultCommandSystemPrompt
    std::string cwd;
    std::vector<std::string> extra_args;
    int max_reuses = 24;
};

class POOLHUB_UTILS_EXPORT CommandPool : public SlotPool
{
  public:
    using CommandCallback = std::function<void(CommandResult)>;

    static constexpr const char *kWarmupMessage = "Reply with exactly the word: READY";
    static constexpr const char *kDefaultCommandSystemPrompt =
        "Follow the instructions in each message precisely. Output only what is requested: "
        "no commentary, preamble or meta-text.";

    CommandPool(utils::EventLoop &loop, std::shared_ptr<ChannelFactory> factory,
                CommandPoolOptions options);

    /**
     * @brief Sends @p message and reports the reply.
     * @param timeout_ms Once a slot is claimed, gives up after this long; the slot is
     *                   recycled and the callback receives no text.
     */
    void send_prompt(const std::string &message, std::optional<int> timeout_ms,
                     CommandCallback callback);

    void set_model(const std::string &model, Done done = {});
    [[nodiscard]] const std::string &model() const noexcept { return m_options.model; }

  protected:
    std::string warmup_message() const override { return kWarmupMessage; }
    bool validate_warmup(const std::string &text) const override;
    ChannelOptions channel_options() const override;
    int max_reuses() const override { return m_options.max_reuses; }

  private:
    CommandPoolOptions m_options;
};

} // namespace poolhub::pool

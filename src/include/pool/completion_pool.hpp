#pragma once
/**
 * @file completion_pool.hpp
 * @brief Slot pool serving fill-in-the-middle completions.
 */
#include "ph_base.hpp"
#include "pool/slot_pool.hpp"

#include <functional>
#include <optional>
#include <stop_token>
#include <string>

namespace poolhub::pool
{

/// What the editor knows about the cursor position.
struct CompletionContext
{
    std::string prefix;
    std::string suffix;
    std::string mode;
    std::string language_id{"plaintext"};
    std::string file_name;
    std::string file_path;
};

struct CompletionPoolOptions
{
    std::string model;
    std::string system_prompt; ///< empty selects default_completion_system_prompt()
    std::string cwd;
    std::vector<std::string> extra_args;
    size_t size = 2;
    int max_reuses = 8;
};

class POOLHUB_UTILS_EXPORT CompletionPool : public SlotPool
{
  public:
    using CompletionCallback = std::function<void(std::optional<std::string>)>;

    CompletionPool(utils::EventLoop &loop, std::shared_ptr<ChannelFactory> factory,
                   CompletionPoolOptions options);

    /**
     * @brief Requests a completion at the cursor described by @p context.
     *
     * @p stop is honored only while waiting for a slot. The callback receives no text
     * when no slot could be claimed, the session failed, or the backend did not echo the
     * completion start.
     */
    void get_completion(const CompletionContext &context, std::stop_token stop,
                        CompletionCallback callback);

    /**
     * @brief Switches the model and recycles the pool if it changed.
     * @param done Runs once the recycle settles, or immediately if the model is unchanged.
     */
    void set_model(const std::string &model, Done done = {});
    [[nodiscard]] const std::string &model() const noexcept { return m_options.model; }

  protected:
    std::string warmup_message() const override;
    bool validate_warmup(const std::string &text) const override;
    ChannelOptions channel_options() const override;
    int max_reuses() const override { return m_options.max_reuses; }

  private:
    CompletionPoolOptions m_options;
};

} // namespace poolhub::pool

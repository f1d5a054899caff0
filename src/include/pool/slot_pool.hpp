#pragma once
/**
 * @file slot_pool.hpp
 * @brief Fixed-size pool of warm backend sessions ("slots").
 *
 * Slot lifecycle:
 *   dead ──init_slot──► initializing ──warm-up ok──► available ◄──► busy
 *     ▲                      ▲                                        │
 *     │                      └──────────── recycle ◄──────────────────┘
 *     └── circuit breaker, kill_all, dispose
 *
 * Design notes:
 *  - Each slot owns at most one SessionChannel and at most one in-flight request.
 *  - Every kill or recycle bumps the slot's generation. Channel callbacks capture the
 *    generation they were opened under and are ignored once it is superseded, so a
 *    stale session can never deliver into its replacement.
 *  - Acquisition serves the most recent caller only: a new waiter displaces the previous
 *    one, which resolves with no slot.
 *  - Re-initialization after a recycle is deferred with a zero-delay timer, so the
 *    consume → recycle → init → consume chain never recurses on the stack.
 *  - The first warm-up failure kills every slot and retries once; a second consecutive
 *    failure disables the pool and fires the degraded callback.
 *
 * Thread safety: none. Every method must be called on the owning EventLoop thread, and
 * every callback is invoked there (never re-entrantly from inside the call that
 * registered it).
 */
#include "ph_base.hpp"
#include "pool/session_channel.hpp"
#include "utils/event_loop.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace poolhub::pool
{

enum class SlotState
{
    Initializing,
    Available,
    Busy,
    Dead,
};

POOLHUB_UTILS_EXPORT const char *to_string(SlotState state) noexcept;

/// Bookkeeping reported by the backend with every result.
struct ResultMeta
{
    int64_t duration_ms = 0;
    int64_t duration_api_ms = 0;
    int num_turns = 0;
    double total_cost_usd = 0.0;
    int64_t input_tokens = 0;
    int64_t output_tokens = 0;
    int64_t cache_read_input_tokens = 0;
    int64_t cache_creation_input_tokens = 0;
    std::string session_id;
    std::string model;

    static ResultMeta from_event(const nlohmann::json &result_event);
    [[nodiscard]] nlohmann::json to_json() const;
};

struct SlotStats
{
    SlotState state = SlotState::Dead;
    int request_count = 0;
    int max_requests = 0;
};

struct PoolStats
{
    std::string label;
    bool available = false;
    std::vector<SlotStats> slots;
    std::optional<int64_t> activated_at_ms;
    std::optional<int64_t> uptime_ms;
    uint64_t total_requests = 0;
    uint64_t total_recycles = 0;
    std::optional<int64_t> last_request_at_ms;
    int64_t total_input_tokens = 0;
    int64_t total_output_tokens = 0;
    double total_cost_usd = 0.0;

    [[nodiscard]] nlohmann::json to_json() const;
};

class POOLHUB_UTILS_EXPORT SlotPool
{
  public:
    using Done = std::function<void()>;
    using AcquireCallback = std::function<void(std::optional<size_t> slot)>;
    using ResultCallback =
        std::function<void(std::optional<std::string> text, std::optional<ResultMeta> meta)>;
    using DegradedCallback = std::function<void()>;

    /// Circuit breaker: recycles of one slot within the window that retire it.
    static constexpr int RAPID_RECYCLE_LIMIT = 5;
    static constexpr std::chrono::milliseconds RAPID_RECYCLE_WINDOW{5000};
    /// Consecutive pool-wide warm-up failures that disable the pool.
    static constexpr int WARMUP_FAILURE_LIMIT = 2;

    SlotPool(utils::EventLoop &loop, std::shared_ptr<ChannelFactory> factory, std::string label,
             size_t pool_size);
    virtual ~SlotPool();

    SlotPool(const SlotPool &) = delete;
    SlotPool &operator=(const SlotPool &) = delete;

    /**
     * @brief Checks that sessions can be started and warms every slot in parallel.
     * @param done Invoked once every slot has settled (warm, failed or superseded).
     */
    void activate(Done done = {});

    /**
     * @brief Claims a slot for one request.
     *
     * Resolves immediately with a free slot (already marked busy), or registers the
     * caller as the single waiter. Resolves with no slot when displaced by a newer
     * waiter, when @p stop is requested while waiting, or when every slot is dead.
     */
    void acquire_slot(AcquireCallback callback, std::stop_token stop = {});

    /**
     * @brief Sends @p message on a slot obtained from acquire_slot().
     * @return A request id for abort_request(), or 0 if the slot could not take the
     *         request (the callback then receives no text).
     */
    uint64_t submit(size_t slot, const std::string &message, ResultCallback callback);

    /**
     * @brief Gives up on an in-flight request: the caller receives no text and the slot
     *        is recycled. Ignored if @p request_id already completed.
     */
    void abort_request(size_t slot, uint64_t request_id);

    /** @brief Kills and re-warms every slot. Overlapping calls share one cycle. */
    void recycle_all(Done done = {});

    /** @brief Clears warm-up failure tracking and re-warms from scratch (after degradation). */
    void restart(Done done = {});

    /** @brief Kills every slot and disables the pool. */
    void dispose();

    [[nodiscard]] bool is_available() const noexcept { return m_available; }
    [[nodiscard]] size_t size() const noexcept { return m_slots.size(); }
    [[nodiscard]] SlotState slot_state(size_t index) const { return m_slots.at(index).state; }
    [[nodiscard]] uint64_t slot_generation(size_t index) const
    {
        return m_slots.at(index).generation;
    }
    [[nodiscard]] const std::string &label() const noexcept { return m_label; }
    [[nodiscard]] PoolStats stats() const;

    void set_on_degraded(DegradedCallback callback) { m_on_degraded = std::move(callback); }

  protected:
    virtual std::string warmup_message() const = 0;
    virtual bool validate_warmup(const std::string &text) const = 0;
    virtual ChannelOptions channel_options() const = 0;
    virtual int max_reuses() const = 0;

    utils::EventLoop &loop() noexcept { return m_loop; }
    /// Expires when the pool is destroyed; check it in timers that capture `this`.
    std::weak_ptr<int> alive_token() const noexcept { return m_alive; }

  private:
    using Clock = std::chrono::steady_clock;

    struct Slot
    {
        SlotState state = SlotState::Dead;
        std::unique_ptr<SessionChannel> channel;
        ResultCallback deliver;
        uint64_t request_id = 0;
        int reuse_count = 0;
        uint64_t generation = 0;
        bool warmed = false;
        std::function<void(bool)> warmup_resolver;
        Clock::time_point last_recycle{};
        int rapid_recycle_count = 0;
    };

    struct Waiter
    {
        uint64_t serial = 0;
        AcquireCallback callback;
        std::unique_ptr<std::stop_callback<std::function<void()>>> on_stop;
    };

    void init_slot(size_t index, Done settled);
    void init_all(Done done);
    void on_channel_event(size_t index, uint64_t generation, const nlohmann::json &event);
    void on_channel_end(size_t index, uint64_t generation, const std::string &reason);
    void complete_warmup(size_t index, bool ok);
    void deliver(Slot &slot, std::optional<std::string> text, std::optional<ResultMeta> meta);
    void notify_waiter(size_t index);
    void resolve_waiter(std::optional<size_t> slot);
    void recycle_slot(size_t index);
    void retire_channel(Slot &slot);
    void kill_all();
    void handle_warmup_failure(size_t index);
    void fire_degraded();
    bool all_dead() const noexcept;
    void check_loop_thread(const char *where) const;

    utils::EventLoop &m_loop;
    std::shared_ptr<ChannelFactory> m_factory;
    std::string m_label;
    std::vector<Slot> m_slots;
    size_t m_next_slot = 0;
    std::optional<Waiter> m_waiter;
    uint64_t m_next_waiter_serial = 1;
    uint64_t m_next_request_id = 1;

    bool m_available = false;
    int m_warmup_failure_count = 0;
    bool m_warmup_failure_handled = false;
    bool m_degraded_fired = false;
    utils::EventLoop::TimerId m_retry_timer = utils::EventLoop::kInvalidTimer;
    std::vector<Done> m_recycle_waiters;
    DegradedCallback m_on_degraded;

    std::optional<int64_t> m_activated_at_ms;
    Clock::time_point m_activated_at{};
    uint64_t m_total_requests = 0;
    uint64_t m_total_recycles = 0;
    std::optional<int64_t> m_last_request_at_ms;
    int64_t m_total_input_tokens = 0;
    int64_t m_total_output_tokens = 0;
    double m_total_cost_usd = 0.0;

    /// Expires with the pool; guards callbacks posted from other threads.
    std::shared_ptr<int> m_alive = std::make_shared<int>(0);
};

} // namespace poolhub::pool

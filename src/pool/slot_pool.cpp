#include "ph_base.hpp"
#include "pool/slot_pool.hpp"
#include "utils/logger.hpp"

#include <fmt/ranges.h>

namespace poolhub::pool
{

namespace
{
constexpr size_t kLogPreviewLen = 100;

template <typename T> T json_number(const nlohmann::json &obj, const char *key)
{
    if (obj.is_object())
    {
        auto it = obj.find(key);
        if (it != obj.end() && it->is_number())
            return it->get<T>();
    }
    return T{};
}

std::string string_field(const nlohmann::json &obj, const char *key)
{
    auto it = obj.find(key);
    return it != obj.end() && it->is_string() ? it->get<std::string>() : std::string{};
}
} // namespace

const char *to_string(SlotState state) noexcept
{
    switch (state)
    {
    case SlotState::Initializing:
        return "initializing";
    case SlotState::Available:
        return "available";
    case SlotState::Busy:
        return "busy";
    case SlotState::Dead:
        return "dead";
    }
    return "unknown";
}

ResultMeta ResultMeta::from_event(const nlohmann::json &event)
{
    ResultMeta meta;
    meta.duration_ms = json_number<int64_t>(event, "duration_ms");
    meta.duration_api_ms = json_number<int64_t>(event, "duration_api_ms");
    meta.num_turns = json_number<int>(event, "num_turns");
    meta.total_cost_usd = json_number<double>(event, "total_cost_usd");
    if (auto usage = event.find("usage"); usage != event.end() && usage->is_object())
    {
        meta.input_tokens = json_number<int64_t>(*usage, "input_tokens");
        meta.output_tokens = json_number<int64_t>(*usage, "output_tokens");
        meta.cache_read_input_tokens = json_number<int64_t>(*usage, "cache_read_input_tokens");
        meta.cache_creation_input_tokens =
            json_number<int64_t>(*usage, "cache_creation_input_tokens");
    }
    meta.session_id = string_field(event, "session_id");
    return meta;
}

nlohmann::json ResultMeta::to_json() const
{
    return nlohmann::json{
        {"model", model},
        {"durationMs", duration_ms},
        {"durationApiMs", duration_api_ms},
        {"numTurns", num_turns},
        {"totalCostUsd", total_cost_usd},
        {"inputTokens", input_tokens},
        {"outputTokens", output_tokens},
        {"cacheReadInputTokens", cache_read_input_tokens},
        {"cacheCreationInputTokens", cache_creation_input_tokens},
        {"sessionId", session_id},
    };
}

nlohmann::json PoolStats::to_json() const
{
    auto optional_ms = [](const std::optional<int64_t> &v) -> nlohmann::json
    { return v ? nlohmann::json(*v) : nlohmann::json(nullptr); };

    nlohmann::json slot_list = nlohmann::json::array();
    for (const auto &s : slots)
    {
        slot_list.push_back({{"state", pool::to_string(s.state)},
                             {"requestCount", s.request_count},
                             {"maxRequests", s.max_requests}});
    }
    return nlohmann::json{
        {"label", label},
        {"available", available},
        {"slots", std::move(slot_list)},
        {"activatedAt", optional_ms(activated_at_ms)},
        {"uptimeMs", optional_ms(uptime_ms)},
        {"totalRequests", total_requests},
        {"totalRecycles", total_recycles},
        {"lastRequestAt", optional_ms(last_request_at_ms)},
        {"totalInputTokens", total_input_tokens},
        {"totalOutputTokens", total_output_tokens},
        {"totalCostUsd", total_cost_usd},
    };
}

// ============================================================================
// SlotPool
// ============================================================================

SlotPool::SlotPool(utils::EventLoop &loop, std::shared_ptr<ChannelFactory> factory,
                   std::string label, size_t pool_size)
    : m_loop(loop), m_factory(std::move(factory)), m_label(std::move(label)), m_slots(pool_size)
{
    if (pool_size == 0 || !m_factory)
    {
        PH_PANIC("{}: a pool needs at least one slot and a channel factory", m_label);
    }
}

SlotPool::~SlotPool()
{
    m_alive.reset();
    if (m_retry_timer != utils::EventLoop::kInvalidTimer)
    {
        m_loop.cancel(m_retry_timer);
    }
    m_waiter.reset();
    for (auto &slot : m_slots)
    {
        if (slot.channel)
        {
            slot.channel->close();
        }
    }
}

void SlotPool::check_loop_thread(const char *where) const
{
    if (m_loop.running() && !m_loop.in_loop_thread())
    {
        PH_PANIC("{}: {}() must be called on the event loop thread", m_label, where);
    }
}

// --- Deferred callbacks ---

namespace
{
/// Runs @p task on a later loop turn unless the pool is gone by then.
void defer(utils::EventLoop &loop, const std::shared_ptr<int> &alive, std::function<void()> task)
{
    std::weak_ptr<int> weak = alive;
    if (!loop.post(
            [weak, task = std::move(task)]()
            {
                if (!weak.expired())
                    task();
            }))
    {
        LOGGER_WARN("SlotPool: event loop stopped, dropping a pool callback");
    }
}
} // namespace

// --- Public API ---

void SlotPool::activate(Done done)
{
    check_loop_thread("activate");
    std::string why;
    if (!m_factory->is_usable(why))
    {
        m_available = false;
        LOGGER_ERROR("{}: backend not usable ({}), pool disabled", m_label, why);
        if (done)
            defer(m_loop, m_alive, std::move(done));
        return;
    }
    m_available = true;
    m_activated_at = Clock::now();
    m_activated_at_ms = platform::wall_clock_ms();
    LOGGER_INFO("{}: initializing {} slot(s)", m_label, m_slots.size());
    init_all(
        [this, done = std::move(done)]()
        {
            LOGGER_INFO("{}: initial warm-up settled", m_label);
            if (done)
                defer(m_loop, m_alive, done);
        });
}

void SlotPool::acquire_slot(AcquireCallback callback, std::stop_token stop)
{
    check_loop_thread("acquire_slot");
    if (stop.stop_requested())
    {
        defer(m_loop, m_alive, [cb = std::move(callback)]() { cb(std::nullopt); });
        return;
    }

    // Fast path: round-robin scan for a free slot.
    const size_t n = m_slots.size();
    for (size_t i = 0; i < n; ++i)
    {
        const size_t idx = (m_next_slot + i) % n;
        if (m_slots[idx].state == SlotState::Available)
        {
            m_slots[idx].state = SlotState::Busy;
            m_next_slot = (idx + 1) % n;
            defer(m_loop, m_alive, [cb = std::move(callback), idx]() { cb(idx); });
            return;
        }
    }

    if (all_dead())
    {
        LOGGER_DEBUG("{}: no live slots, request dropped", m_label);
        defer(m_loop, m_alive, [cb = std::move(callback)]() { cb(std::nullopt); });
        return;
    }

    // Slow path: the newest caller displaces the previous waiter.
    if (m_waiter)
    {
        LOGGER_TRACE("{}: newer request displaces waiter #{}", m_label, m_waiter->serial);
        resolve_waiter(std::nullopt);
    }

    Waiter waiter;
    waiter.serial = m_next_waiter_serial++;
    waiter.callback = std::move(callback);
    if (stop.stop_possible())
    {
        std::weak_ptr<int> weak = m_alive;
        const uint64_t serial = waiter.serial;
        waiter.on_stop = std::make_unique<std::stop_callback<std::function<void()>>>(
            stop, std::function<void()>(
                      [this, weak, serial]()
                      {
                          // May run on any thread; hop onto the loop before touching state.
                          (void)m_loop.post(
                              [this, weak, serial]()
                              {
                                  if (weak.expired() || !m_waiter || m_waiter->serial != serial)
                                      return;
                                  LOGGER_TRACE("{}: waiter #{} cancelled", m_label, serial);
                                  resolve_waiter(std::nullopt);
                              });
                      }));
    }
    m_waiter = std::move(waiter);

    std::vector<std::string> states;
    states.reserve(n);
    for (size_t i = 0; i < n; ++i)
    {
        states.push_back(fmt::format("slot{}={}", i, pool::to_string(m_slots[i].state)));
    }
    LOGGER_TRACE("{}: waiting for slot ({})", m_label, fmt::join(states, ", "));
}

uint64_t SlotPool::submit(size_t index, const std::string &message, ResultCallback callback)
{
    check_loop_thread("submit");
    Slot &slot = m_slots.at(index);
    if (slot.state != SlotState::Busy || !slot.channel || !slot.channel->is_open() ||
        slot.deliver)
    {
        LOGGER_DEBUG("{}: slot {} no longer usable ({}), request dropped", m_label, index,
                     pool::to_string(slot.state));
        defer(m_loop, m_alive,
              [cb = std::move(callback)]() { cb(std::nullopt, std::nullopt); });
        return 0;
    }
    slot.deliver = std::move(callback);
    slot.request_id = m_next_request_id++;
    ++m_total_requests;
    LOGGER_TRACE("{}: slot {} -> sent ({} chars)", m_label, index, message.size());
    slot.channel->push(message);
    return slot.request_id;
}

void SlotPool::abort_request(size_t index, uint64_t request_id)
{
    check_loop_thread("abort_request");
    Slot &slot = m_slots.at(index);
    if (request_id == 0 || slot.request_id != request_id || !slot.deliver)
    {
        return;
    }
    LOGGER_WARN("{}: abandoning request on slot {}, recycling", m_label, index);
    deliver(slot, std::nullopt, std::nullopt);
    recycle_slot(index);
}

void SlotPool::recycle_all(Done done)
{
    check_loop_thread("recycle_all");
    if (!m_available)
    {
        if (done)
            defer(m_loop, m_alive, std::move(done));
        return;
    }
    m_recycle_waiters.push_back(std::move(done));
    if (m_recycle_waiters.size() > 1)
    {
        return; // joins the cycle already in flight
    }

    m_warmup_failure_count = 0;
    m_warmup_failure_handled = false;
    m_degraded_fired = false;
    if (m_retry_timer != utils::EventLoop::kInvalidTimer)
    {
        m_loop.cancel(m_retry_timer);
        m_retry_timer = utils::EventLoop::kInvalidTimer;
    }
    LOGGER_INFO("{}: recycling all slots", m_label);
    kill_all();
    init_all(
        [this]()
        {
            LOGGER_INFO("{}: pool recycled", m_label);
            auto waiters = std::move(m_recycle_waiters);
            m_recycle_waiters.clear();
            for (auto &w : waiters)
            {
                if (w)
                    defer(m_loop, m_alive, std::move(w));
            }
        });
}

void SlotPool::restart(Done done)
{
    check_loop_thread("restart");
    if (m_retry_timer != utils::EventLoop::kInvalidTimer)
    {
        m_loop.cancel(m_retry_timer);
        m_retry_timer = utils::EventLoop::kInvalidTimer;
    }
    kill_all();
    m_warmup_failure_count = 0;
    m_warmup_failure_handled = false;
    m_degraded_fired = false;

    std::string why;
    if (!m_factory->is_usable(why))
    {
        m_available = false;
        LOGGER_ERROR("{}: backend not usable on restart ({})", m_label, why);
        if (done)
            defer(m_loop, m_alive, std::move(done));
        return;
    }
    m_available = true;
    if (!m_activated_at_ms)
    {
        m_activated_at = Clock::now();
        m_activated_at_ms = platform::wall_clock_ms();
    }
    LOGGER_INFO("{}: restarting pool", m_label);
    init_all(
        [this, done = std::move(done)]()
        {
            LOGGER_INFO("{}: pool restarted", m_label);
            if (done)
                defer(m_loop, m_alive, done);
        });
}

void SlotPool::dispose()
{
    check_loop_thread("dispose");
    if (m_retry_timer != utils::EventLoop::kInvalidTimer)
    {
        m_loop.cancel(m_retry_timer);
        m_retry_timer = utils::EventLoop::kInvalidTimer;
    }
    kill_all();
    m_available = false;
    LOGGER_INFO("{}: disposed", m_label);
}

PoolStats SlotPool::stats() const
{
    PoolStats st;
    st.label = m_label;
    st.available = m_available;
    const int limit = max_reuses();
    for (const auto &slot : m_slots)
    {
        st.slots.push_back(SlotStats{slot.state, slot.reuse_count, limit});
    }
    st.activated_at_ms = m_activated_at_ms;
    if (m_activated_at_ms)
    {
        st.uptime_ms = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() -
                                                                             m_activated_at)
                           .count();
    }
    st.total_requests = m_total_requests;
    st.total_recycles = m_total_recycles;
    st.last_request_at_ms = m_last_request_at_ms;
    st.total_input_tokens = m_total_input_tokens;
    st.total_output_tokens = m_total_output_tokens;
    st.total_cost_usd = m_total_cost_usd;
    return st;
}

// --- Slot lifecycle ---

void SlotPool::init_all(Done done)
{
    auto remaining = std::make_shared<size_t>(m_slots.size());
    for (size_t i = 0; i < m_slots.size(); ++i)
    {
        init_slot(i,
                  [remaining, done]()
                  {
                      if (--*remaining == 0 && done)
                          done();
                  });
    }
}

void SlotPool::init_slot(size_t index, Done settled)
{
    Slot &slot = m_slots[index];
    slot.state = SlotState::Initializing;
    slot.reuse_count = 0;
    slot.warmed = false;
    slot.deliver = nullptr;
    slot.request_id = 0;
    const uint64_t generation = slot.generation;

    try
    {
        slot.channel = m_factory->open(
            m_loop, channel_options(),
            [this, index, generation](const nlohmann::json &event)
            { on_channel_event(index, generation, event); },
            [this, index, generation](const std::string &reason)
            { on_channel_end(index, generation, reason); });
    }
    catch (const std::exception &e)
    {
        slot.state = SlotState::Dead;
        LOGGER_ERROR("{}: slot {} init failed: {}", m_label, index, e.what());
        if (settled)
            settled();
        return;
    }

    slot.warmup_resolver = [this, index, generation, settled = std::move(settled)](bool ok)
    {
        Slot &s = m_slots[index];
        if (s.generation == generation)
        {
            if (!ok)
            {
                handle_warmup_failure(index);
            }
            else if (s.state == SlotState::Initializing)
            {
                s.state = SlotState::Available;
                LOGGER_DEBUG("{}: slot {} ready", m_label, index);
                notify_waiter(index);
            }
        }
        if (settled)
            settled();
    };

    const std::string warmup = warmup_message();
    LOGGER_TRACE("{}: warm-up -> sent (slot {})", m_label, index);
    slot.channel->push(warmup);
}

void SlotPool::on_channel_event(size_t index, uint64_t generation, const nlohmann::json &event)
{
    Slot &slot = m_slots[index];
    if (slot.generation != generation)
    {
        return; // superseded session
    }
    if (string_field(event, "type") != "result")
    {
        return;
    }

    std::optional<std::string> text;
    if (string_field(event, "subtype") == "success")
    {
        if (auto it = event.find("result"); it != event.end() && it->is_string())
            text = it->get<std::string>();
    }
    ResultMeta meta = ResultMeta::from_event(event);
    meta.model = channel_options().model;
    m_total_input_tokens += meta.input_tokens;
    m_total_output_tokens += meta.output_tokens;
    m_total_cost_usd += meta.total_cost_usd;

    if (!slot.warmed)
    {
        slot.warmed = true;
        bool ok = false;
        if (!text)
        {
            LOGGER_ERROR("{}: warm-up returned no text on slot {}", m_label, index);
        }
        else if (!(ok = validate_warmup(*text)))
        {
            LOGGER_ERROR("{}: warm-up validation failed on slot {}: raw=\"{}\"", m_label, index,
                         text->substr(0, kLogPreviewLen));
        }
        complete_warmup(index, ok);
        return;
    }

    ++slot.reuse_count;
    m_last_request_at_ms = platform::wall_clock_ms();
    deliver(slot, std::move(text), std::move(meta));

    if (slot.reuse_count >= max_reuses())
    {
        LOGGER_DEBUG("{}: slot {} reached max reuses ({}), recycling", m_label, index,
                     max_reuses());
        recycle_slot(index);
        return;
    }
    slot.state = SlotState::Available;
    notify_waiter(index);
}

void SlotPool::on_channel_end(size_t index, uint64_t generation, const std::string &reason)
{
    Slot &slot = m_slots[index];
    if (slot.generation != generation)
    {
        return;
    }
    LOGGER_ERROR("{}: session on slot {} ended: {}", m_label, index, reason);
    deliver(slot, std::nullopt, std::nullopt);
    if (slot.warmup_resolver)
    {
        complete_warmup(index, false);
        return;
    }
    recycle_slot(index);
}

void SlotPool::complete_warmup(size_t index, bool ok)
{
    auto resolver = std::move(m_slots[index].warmup_resolver);
    m_slots[index].warmup_resolver = nullptr;
    if (resolver)
    {
        resolver(ok);
    }
}

void SlotPool::deliver(Slot &slot, std::optional<std::string> text, std::optional<ResultMeta> meta)
{
    if (!slot.deliver)
    {
        return;
    }
    auto cb = std::move(slot.deliver);
    slot.deliver = nullptr;
    slot.request_id = 0;
    defer(m_loop, m_alive,
          [cb = std::move(cb), text = std::move(text), meta = std::move(meta)]()
          { cb(text, meta); });
}

void SlotPool::notify_waiter(size_t index)
{
    if (!m_waiter)
    {
        return;
    }
    // Claimed before the waiter runs so a fast-path scan cannot take it in between.
    m_slots[index].state = SlotState::Busy;
    resolve_waiter(index);
}

void SlotPool::resolve_waiter(std::optional<size_t> slot)
{
    if (!m_waiter)
    {
        return;
    }
    Waiter waiter = std::move(*m_waiter);
    m_waiter.reset();
    waiter.on_stop.reset();
    defer(m_loop, m_alive, [cb = std::move(waiter.callback), slot]() { cb(slot); });
}

void SlotPool::retire_channel(Slot &slot)
{
    if (!slot.channel)
    {
        return;
    }
    slot.channel->close();
    // We may be inside one of this channel's own callbacks; destroy it on a later turn.
    std::shared_ptr<SessionChannel> doomed(std::move(slot.channel));
    if (!m_loop.post([doomed]() {}))
    {
        LOGGER_DEBUG("{}: event loop stopped, releasing channel inline", m_label);
    }
}

void SlotPool::recycle_slot(size_t index)
{
    Slot &slot = m_slots[index];
    if (slot.state == SlotState::Dead)
    {
        return;
    }
    ++m_total_recycles;

    const auto now = Clock::now();
    if (slot.last_recycle != Clock::time_point{} && now - slot.last_recycle < RAPID_RECYCLE_WINDOW)
    {
        ++slot.rapid_recycle_count;
    }
    else
    {
        slot.rapid_recycle_count = 1;
    }
    slot.last_recycle = now;

    ++slot.generation;
    deliver(slot, std::nullopt, std::nullopt);
    retire_channel(slot);
    slot.reuse_count = 0;
    slot.warmed = false;

    if (slot.rapid_recycle_count >= RAPID_RECYCLE_LIMIT)
    {
        LOGGER_ERROR("{}: slot {} recycled {} times within {} ms, marking dead (circuit breaker)",
                     m_label, index, slot.rapid_recycle_count, RAPID_RECYCLE_WINDOW.count());
        slot.state = SlotState::Dead;
        complete_warmup(index, false);
        if (all_dead())
        {
            LOGGER_ERROR("{}: all slots dead (circuit breaker), pool degraded", m_label);
            m_available = false;
            resolve_waiter(std::nullopt);
            fire_degraded();
        }
        return;
    }

    slot.state = SlotState::Initializing;
    complete_warmup(index, false);
    const uint64_t generation = slot.generation;
    std::weak_ptr<int> weak = m_alive;
    m_loop.call_later(std::chrono::milliseconds(0),
                      [this, weak, index, generation]()
                      {
                          if (weak.expired())
                              return;
                          const Slot &s = m_slots[index];
                          if (s.generation != generation || s.state != SlotState::Initializing)
                              return;
                          init_slot(index, {});
                      });
}

void SlotPool::kill_all()
{
    resolve_waiter(std::nullopt);
    for (size_t i = 0; i < m_slots.size(); ++i)
    {
        Slot &slot = m_slots[i];
        ++slot.generation;
        deliver(slot, std::nullopt, std::nullopt);
        slot.state = SlotState::Dead;
        retire_channel(slot);
        slot.reuse_count = 0;
        slot.warmed = false;
        // Caller-intended kills do not count towards the circuit breaker.
        slot.last_recycle = Clock::time_point{};
        slot.rapid_recycle_count = 0;
        complete_warmup(i, false);
    }
}

void SlotPool::handle_warmup_failure(size_t index)
{
    if (m_warmup_failure_handled)
    {
        // A sibling's failure already started this episode; just retire this session.
        Slot &slot = m_slots[index];
        ++slot.generation;
        slot.state = SlotState::Dead;
        retire_channel(slot);
        return;
    }
    m_warmup_failure_handled = true;
    ++m_warmup_failure_count;
    LOGGER_ERROR("{}: warm-up failed on slot {} (attempt {}/{})", m_label, index,
                 m_warmup_failure_count, WARMUP_FAILURE_LIMIT);

    kill_all();

    if (m_warmup_failure_count >= WARMUP_FAILURE_LIMIT)
    {
        m_available = false;
        LOGGER_ERROR("{}: warm-up failed after retry, pool disabled", m_label);
        fire_degraded();
        return;
    }

    LOGGER_INFO("{}: retrying all slots after warm-up failure", m_label);
    std::weak_ptr<int> weak = m_alive;
    m_retry_timer = m_loop.call_later(std::chrono::milliseconds(0),
                                      [this, weak]()
                                      {
                                          if (weak.expired())
                                              return;
                                          m_retry_timer = utils::EventLoop::kInvalidTimer;
                                          m_warmup_failure_handled = false;
                                          init_all({});
                                      });
}

void SlotPool::fire_degraded()
{
    if (m_degraded_fired)
    {
        return;
    }
    m_degraded_fired = true;
    if (m_on_degraded)
    {
        defer(m_loop, m_alive, m_on_degraded);
    }
}

bool SlotPool::all_dead() const noexcept
{
    return std::all_of(m_slots.begin(), m_slots.end(),
                       [](const Slot &s) { return s.state == SlotState::Dead; });
}

} // namespace poolhub::pool

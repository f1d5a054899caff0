#pragma once
/**
 * @file scope_guard.hpp
 * @brief A small RAII helper that runs a callable on scope exit unless dismissed.
 *
 * Used where a partially-acquired set of OS resources (pipes, sockets, a forked
 * child) must be released on every early return, e.g.
 * @code
 * auto close_fds = make_scope_guard([&] { ::close(fd); });
 * ...
 * close_fds.dismiss(); // ownership handed over
 * @endcode
 */
#include <concepts>
#include <exception>
#include <functional>
#include <type_traits>
#include <utility>

#include <fmt/core.h>

namespace poolhub::basics
{

// `std::invocable<Callable &>` because the guard invokes its stored member as an lvalue.
template <typename Callable>
requires std::invocable<Callable &>
class ScopeGuard
{
  public:
    static_assert(!std::is_reference_v<Callable>, "ScopeGuard cannot hold a reference to a callable.");

    explicit ScopeGuard(Callable fn) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(fn))
    {
    }

    ScopeGuard(ScopeGuard &&other) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(other.m_func)), m_active(other.m_active)
    {
        other.dismiss();
    }

    ~ScopeGuard() noexcept { invoke(); }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

    [[nodiscard]] explicit operator bool() const noexcept { return m_active; }

    constexpr void dismiss() noexcept { m_active = false; }

    /** Runs the callable now (at most once). Exceptions are reported to stderr. */
    void invoke() noexcept
    {
        if (!m_active)
        {
            return;
        }
        m_active = false;
        try
        {
            std::invoke(m_func);
        }
        catch (const std::exception &e)
        {
            fmt::print(stderr, "[ScopeGuard] cleanup callable threw: {}\n", e.what());
        }
    }

  private:
    Callable m_func;
    bool m_active = true;
};

template <typename F>
[[nodiscard]] auto make_scope_guard(F &&fn)
{
    return ScopeGuard<std::decay_t<F>>(std::forward<F>(fn));
}

} // namespace poolhub::basics

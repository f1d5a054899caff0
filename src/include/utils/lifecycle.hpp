#pragma once
/**
 * @file lifecycle.hpp
 * @brief Application-wide startup and shutdown ordering for process-global services.
 *
 * Modules (the Logger, the event-loop signal setup) are registered as ModuleDef
 * values before initialization. `InitializeApp()` starts them in dependency order;
 * `FinalizeApp()` stops them in reverse order with a per-module timeout.
 *
 * The usual entry point is a LifecycleGuard at the top of `main()`:
 * @code
 * poolhub::utils::LifecycleGuard guard(poolhub::utils::MakeModDefList(
 *     poolhub::utils::Logger::GetLifecycleModule(), poolhub::utils::EventLoop::GetLifecycleModule()));
 * @endcode
 */
#include "ph_base.hpp"

#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

namespace poolhub::utils
{

class LifecycleManagerImpl;

/// @brief Builds a vector<ModuleDef> by moving the supplied ModuleDef arguments.
template <typename... Mods> inline std::vector<ModuleDef> MakeModDefList(Mods &&...mods)
{
    static_assert((std::is_same_v<std::decay_t<Mods>, ModuleDef> && ...),
                  "MakeModDefList: all arguments must be ModuleDef (rvalues or prvalues)");

    std::vector<ModuleDef> modules;
    modules.reserve(sizeof...(mods));
    (modules.emplace_back(std::forward<Mods>(mods)), ...);
    return modules;
}

class POOLHUB_UTILS_EXPORT LifecycleManager
{
  public:
    static LifecycleManager &instance();

    /**
     * @brief Registers a module. Panics if called after initialize().
     */
    void register_module(ModuleDef &&module_def);

    /**
     * @brief Starts all registered modules in dependency order. Idempotent.
     *        A failing startup callback, a duplicate name, an undefined dependency or a
     *        dependency cycle is fatal.
     */
    void initialize(std::source_location loc);

    /**
     * @brief Shuts modules down in reverse startup order. Idempotent.
     */
    void finalize(std::source_location loc);

    [[nodiscard]] bool is_initialized();
    [[nodiscard]] bool is_finalized();

    LifecycleManager(const LifecycleManager &) = delete;
    LifecycleManager &operator=(const LifecycleManager &) = delete;

  private:
    LifecycleManager();
    ~LifecycleManager();

    std::unique_ptr<LifecycleManagerImpl> pImpl;
};

inline void RegisterModule(ModuleDef &&module_def)
{
    LifecycleManager::instance().register_module(std::move(module_def));
}

inline bool IsAppInitialized()
{
    return LifecycleManager::instance().is_initialized();
}

inline bool IsAppFinalized()
{
    return LifecycleManager::instance().is_finalized();
}

inline void InitializeApp(std::source_location loc = std::source_location::current())
{
    LifecycleManager::instance().initialize(loc);
}

inline void FinalizeApp(std::source_location loc = std::source_location::current())
{
    LifecycleManager::instance().finalize(loc);
}

/**
 * @brief RAII owner of the application lifecycle.
 *
 * The first guard constructed in a process registers its modules and initializes the
 * application; its destructor finalizes. Any later guard is a no-op and its modules
 * are ignored.
 */
class LifecycleGuard
{
  public:
    LifecycleGuard(std::source_location loc = std::source_location::current()) : m_loc(loc)
    {
        init_owner_if_first({});
    }

    explicit LifecycleGuard(ModuleDef &&module,
                            std::source_location loc = std::source_location::current())
        : m_loc(loc)
    {
        std::vector<ModuleDef> modules;
        modules.emplace_back(std::move(module));
        init_owner_if_first(std::move(modules));
    }

    explicit LifecycleGuard(std::vector<ModuleDef> &&modules,
                            std::source_location loc = std::source_location::current())
        : m_loc(loc)
    {
        init_owner_if_first(std::move(modules));
    }

    LifecycleGuard(const LifecycleGuard &) = delete;
    LifecycleGuard &operator=(const LifecycleGuard &) = delete;
    LifecycleGuard(LifecycleGuard &&) = delete;
    LifecycleGuard &operator=(LifecycleGuard &&) = delete;

    ~LifecycleGuard() noexcept
    {
        if (m_is_owner)
        {
            PH_DEBUG("[PH_LifeCycle] LifecycleGuard is being destructed as owner ({}:{}).",
                     poolhub::format_tools::filename_only(m_loc.file_name()), m_loc.line());
            poolhub::utils::FinalizeApp(m_loc);
        }
    }

    [[nodiscard]] bool is_owner() const noexcept { return m_is_owner; }

  private:
    static std::atomic_bool &owner_flag()
    {
        static std::atomic_bool flag{false};
        return flag;
    }

    void init_owner_if_first(std::vector<ModuleDef> &&modules)
    {
        bool expected = false;
        if (owner_flag().compare_exchange_strong(expected, true, std::memory_order_acq_rel))
        {
            m_is_owner = true;
            for (auto &m : modules)
            {
                poolhub::utils::RegisterModule(std::move(m));
            }
            // Always initialize, even without modules.
            poolhub::utils::InitializeApp(m_loc);
        }
        else
        {
            m_is_owner = false;
            PH_DEBUG("[PH_LifeCycle] [{}:{}] LifecycleGuard constructed but an owner already "
                     "exists; this guard is a no-op ({}:{}).",
                     poolhub::platform::get_executable_name(), poolhub::platform::get_pid(),
                     poolhub::format_tools::filename_only(m_loc.file_name()), m_loc.line());
        }
    }

    std::source_location m_loc;
    bool m_is_owner{false};
};

} // namespace poolhub::utils

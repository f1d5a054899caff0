/**
 * @file lifecycle.cpp
 * @brief Implementation of the LifecycleManager: module registry, dependency graph,
 *        ordered startup and timed shutdown.
 */
#include "ph_base.hpp"
#include "utils/lifecycle.hpp"

#include <algorithm>
#include <functional>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include <fmt/ranges.h>

namespace
{

void validate_module_name(std::string_view name, const char *param_name)
{
    if (name.empty())
    {
        throw std::invalid_argument(std::string("Lifecycle: ") + param_name +
                                    " must not be empty.");
    }
    if (name.size() > poolhub::utils::ModuleDef::MAX_MODULE_NAME_LEN)
    {
        throw std::length_error(std::string("Lifecycle: ") + param_name + " exceeds maximum of " +
                                std::to_string(poolhub::utils::ModuleDef::MAX_MODULE_NAME_LEN) +
                                " characters.");
    }
}

struct ShutdownOutcome
{
    bool success;
    bool timed_out;
    std::string exception_msg;
};

/**
 * @brief Runs `func` on a thread with a real deadline. On timeout the thread is
 *        detached and the caller moves on.
 */
ShutdownOutcome timedShutdown(const std::function<void()> &func, std::chrono::milliseconds timeout)
{
    if (!func)
    {
        return {true, false, {}};
    }

    auto completed = std::make_shared<std::atomic<bool>>(false);
    auto error = std::make_shared<std::string>();
    std::thread thread(
        [func, completed, error]()
        {
            try
            {
                func();
            }
            catch (const std::exception &e)
            {
                *error = e.what();
            }
            completed->store(true, std::memory_order_release);
        });

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!completed->load(std::memory_order_acquire))
    {
        if (std::chrono::steady_clock::now() >= deadline)
        {
            thread.detach();
            return {false, true, {}};
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    thread.join();

    if (!error->empty())
    {
        return {false, false, *error};
    }
    return {true, false, {}};
}

constexpr size_t kDebugInfoReserveBytes = 4096;

} // namespace

namespace poolhub::utils
{

struct InternalModuleDef
{
    std::string name;
    std::vector<std::string> dependencies;
    std::function<void()> startup;
    std::function<void()> shutdown;
    std::chrono::milliseconds shutdown_timeout{0};
};

class ModuleDefImpl
{
  public:
    InternalModuleDef def;
};

ModuleDef::ModuleDef(std::string_view name) : pImpl(std::make_unique<ModuleDefImpl>())
{
    validate_module_name(name, "module name");
    pImpl->def.name = std::string(name);
}
ModuleDef::~ModuleDef() = default;
ModuleDef::ModuleDef(ModuleDef &&other) noexcept = default;
ModuleDef &ModuleDef::operator=(ModuleDef &&other) noexcept = default;

void ModuleDef::add_dependency(std::string_view dependency_name)
{
    validate_module_name(dependency_name, "dependency name");
    pImpl->def.dependencies.emplace_back(dependency_name);
}

void ModuleDef::set_startup(LifecycleCallback startup_func)
{
    if (startup_func != nullptr)
    {
        pImpl->def.startup = [startup_func]() { startup_func(nullptr); };
    }
}

void ModuleDef::set_startup(LifecycleCallback startup_func, std::string_view arg)
{
    if (startup_func == nullptr)
    {
        return;
    }
    if (arg.size() > MAX_CALLBACK_PARAM_STRLEN)
    {
        throw std::length_error(
            "Lifecycle: startup argument length exceeds MAX_CALLBACK_PARAM_STRLEN.");
    }
    pImpl->def.startup = [startup_func, arg_copy = std::string(arg)]()
    { startup_func(arg_copy.c_str()); };
}

void ModuleDef::set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout)
{
    if (shutdown_func != nullptr)
    {
        pImpl->def.shutdown = [shutdown_func]() { shutdown_func(nullptr); };
        pImpl->def.shutdown_timeout = timeout;
    }
}

class LifecycleManagerImpl
{
  public:
    LifecycleManagerImpl()
        : m_pid(poolhub::platform::get_pid()),
          m_app_name(poolhub::platform::get_executable_name())
    {
    }

    enum class ModuleStatus : std::uint8_t
    {
        Registered,
        Started,
        Failed,
        Shutdown,
        FailedShutdown,
        ShutdownTimeout
    };

    struct GraphNode
    {
        InternalModuleDef def;
        std::vector<GraphNode *> dependents;
        ModuleStatus status = ModuleStatus::Registered;
    };

    void registerModule(InternalModuleDef def);
    void initialize(std::source_location loc);
    void finalize(std::source_location loc);

    std::atomic<bool> m_is_initialized{false};
    std::atomic<bool> m_is_finalized{false};

  private:
    void buildGraph();
    static std::vector<GraphNode *> topologicalSort(std::map<std::string, GraphNode, std::less<>> &graph);
    [[noreturn]] void printStatusAndAbort(const std::string &msg, const std::string &mod = "");

    const uint64_t m_pid;
    const std::string m_app_name;
    std::mutex m_mutex;
    std::vector<InternalModuleDef> m_registered;
    std::map<std::string, GraphNode, std::less<>> m_graph;
    std::vector<GraphNode *> m_startup_order;
};

void LifecycleManagerImpl::registerModule(InternalModuleDef def)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_is_initialized.load(std::memory_order_acquire))
    {
        PH_PANIC("[PH_LifeCycle] EXEC[{}]:PID[{}] register_module('{}') called after "
                 "initialization.",
                 m_app_name, m_pid, def.name);
    }
    m_registered.push_back(std::move(def));
}

void LifecycleManagerImpl::buildGraph()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto &def : m_registered)
    {
        if (m_graph.contains(def.name))
        {
            throw std::runtime_error("Duplicate module name: " + def.name);
        }
        std::string name = def.name;
        m_graph.emplace(std::move(name), GraphNode{std::move(def), {}, ModuleStatus::Registered});
    }
    m_registered.clear();
    for (auto &[name, node] : m_graph)
    {
        for (const auto &dep_name : node.def.dependencies)
        {
            auto iter = m_graph.find(dep_name);
            if (iter == m_graph.end())
            {
                throw std::runtime_error("Undefined dependency: " + dep_name);
            }
            iter->second.dependents.push_back(&node);
        }
    }
}

// Kahn's algorithm over the whole graph.
std::vector<LifecycleManagerImpl::GraphNode *>
LifecycleManagerImpl::topologicalSort(std::map<std::string, GraphNode, std::less<>> &graph)
{
    std::map<GraphNode *, size_t> in_degrees;
    for (auto &[name, node] : graph)
    {
        in_degrees.try_emplace(&node, 0);
        for (auto *dependent : node.dependents)
        {
            in_degrees[dependent]++;
        }
    }

    std::vector<GraphNode *> queue;
    for (auto &[node, degree] : in_degrees)
    {
        if (degree == 0)
        {
            queue.push_back(node);
        }
    }
    std::vector<GraphNode *> sorted;
    sorted.reserve(graph.size());
    size_t head = 0;
    while (head < queue.size())
    {
        GraphNode *current = queue[head++];
        sorted.push_back(current);
        for (GraphNode *dependent : current->dependents)
        {
            if (--in_degrees[dependent] == 0)
            {
                queue.push_back(dependent);
            }
        }
    }

    if (sorted.size() != graph.size())
    {
        std::vector<std::string> cycle_nodes;
        for (auto const &[node, degree] : in_degrees)
        {
            if (degree > 0)
            {
                cycle_nodes.push_back(node->def.name);
            }
        }
        throw std::runtime_error("Circular dependency detected involving: " +
                                 fmt::format("{}", fmt::join(cycle_nodes, ", ")));
    }
    return sorted;
}

void LifecycleManagerImpl::initialize(std::source_location loc)
{
    if (m_is_initialized.exchange(true, std::memory_order_acq_rel))
    {
        return;
    }
    std::string debug_info;
    debug_info.reserve(kDebugInfoReserveBytes);
    debug_info += fmt::format("[PH_LifeCycle] [{}]:PID[{}]\n"
                              "     **** initialize() triggered from {} ({}:{})\n",
                              m_app_name, m_pid, loc.function_name(),
                              poolhub::format_tools::filename_only(loc.file_name()), loc.line());
    try
    {
        buildGraph();
        m_startup_order = topologicalSort(m_graph);
    }
    catch (const std::runtime_error &e)
    {
        printStatusAndAbort(e.what());
    }

    for (auto *mod : m_startup_order)
    {
        debug_info += fmt::format("     -> Starting module: '{}'...", mod->def.name);
        try
        {
            if (mod->def.startup)
            {
                mod->def.startup();
            }
            mod->status = ModuleStatus::Started;
            debug_info += "done.\n";
        }
        catch (const std::exception &e)
        {
            mod->status = ModuleStatus::Failed;
            PH_DEBUG("{}", debug_info);
            printStatusAndAbort("Exception during startup: " + std::string(e.what()),
                                mod->def.name);
        }
    }
    debug_info += "     -> Application initialization complete.\n";
    PH_DEBUG("{}", debug_info);
}

void LifecycleManagerImpl::finalize(std::source_location loc)
{
    if (!m_is_initialized.load(std::memory_order_acquire) ||
        m_is_finalized.exchange(true, std::memory_order_acq_rel))
    {
        return;
    }
    std::string debug_info;
    debug_info.reserve(kDebugInfoReserveBytes);
    debug_info += fmt::format("[PH_LifeCycle] [{}]:PID[{}]\n"
                              "     **** finalize() called from {} ({}:{})\n",
                              m_app_name, m_pid, loc.function_name(),
                              poolhub::format_tools::filename_only(loc.file_name()), loc.line());

    for (auto it = m_startup_order.rbegin(); it != m_startup_order.rend(); ++it)
    {
        GraphNode *mod = *it;
        if (mod->status != ModuleStatus::Started)
        {
            mod->status = ModuleStatus::Shutdown;
            continue;
        }
        debug_info += fmt::format("     <- Shutting down module: '{}'...", mod->def.name);
        const auto outcome = timedShutdown(mod->def.shutdown, mod->def.shutdown_timeout);
        if (outcome.timed_out)
        {
            mod->status = ModuleStatus::ShutdownTimeout;
            debug_info += fmt::format("TIMEOUT after {}ms.\n", mod->def.shutdown_timeout.count());
            fmt::print(stderr, "[PH_LifeCycle] WARNING: shutdown of '{}' timed out.\n",
                       mod->def.name);
        }
        else if (!outcome.success)
        {
            mod->status = ModuleStatus::FailedShutdown;
            debug_info += fmt::format("FAILED: {}\n", outcome.exception_msg);
            fmt::print(stderr, "[PH_LifeCycle] ERROR: shutdown of '{}' threw: {}\n",
                       mod->def.name, outcome.exception_msg);
        }
        else
        {
            mod->status = ModuleStatus::Shutdown;
            debug_info += "done.\n";
        }
    }
    debug_info += "     -> Application finalization complete.\n";
    PH_DEBUG("{}", debug_info);
}

void LifecycleManagerImpl::printStatusAndAbort(const std::string &msg, const std::string &mod)
{
    fmt::print(stderr, "\n\n[PH_LifeCycle] FATAL: {}. Aborting.\n", msg);
    if (!mod.empty())
    {
        fmt::print(stderr, "[PH_LifeCycle] Module '{}' was point of failure.\n", mod);
    }
    fmt::print(stderr, "\n--- Module Status ---\n");
    for (auto const &[name, node] : m_graph)
    {
        fmt::print(stderr, "  - '{}' [{}]\n", name,
                   node.status == ModuleStatus::Started ? "Started" : "Not started");
    }
    fmt::print(stderr, "---------------------\n\n");
    poolhub::debug::print_stack_trace();
    std::fflush(stderr);
    std::abort();
}

// ============================================================================
// LifecycleManager public API
// ============================================================================

LifecycleManager::LifecycleManager() : pImpl(std::make_unique<LifecycleManagerImpl>()) {}
LifecycleManager::~LifecycleManager() = default;

LifecycleManager &LifecycleManager::instance()
{
    static LifecycleManager instance;
    return instance;
}

void LifecycleManager::register_module(ModuleDef &&def)
{
    if (def.pImpl)
    {
        pImpl->registerModule(std::move(def.pImpl->def));
    }
}

void LifecycleManager::initialize(std::source_location loc)
{
    pImpl->initialize(loc);
}

void LifecycleManager::finalize(std::source_location loc)
{
    pImpl->finalize(loc);
}

bool LifecycleManager::is_initialized()
{
    return pImpl->m_is_initialized.load(std::memory_order_acquire);
}

bool LifecycleManager::is_finalized()
{
    return pImpl->m_is_finalized.load(std::memory_order_acquire);
}

} // namespace poolhub::utils

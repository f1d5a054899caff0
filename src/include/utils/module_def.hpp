#pragma once
/**
 * @file module_def.hpp
 * @brief Declarative description of one lifecycle module: its name, dependencies and
 *        startup/shutdown callbacks.
 *
 * Callbacks are plain function pointers taking an optional C-string argument so that a
 * module definition can be built in one translation unit and executed by the
 * LifecycleManager in another.
 */
#include "poolhub_utils_export.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string_view>

namespace poolhub::utils
{

class ModuleDefImpl;
class LifecycleManager;

using LifecycleCallback = void (*)(const char *arg);

class POOLHUB_UTILS_EXPORT ModuleDef
{
  public:
    static constexpr size_t MAX_MODULE_NAME_LEN = 256;
    static constexpr size_t MAX_CALLBACK_PARAM_STRLEN = 1024;

    /**
     * @throws std::invalid_argument if @p name is empty.
     * @throws std::length_error if @p name exceeds MAX_MODULE_NAME_LEN.
     */
    explicit ModuleDef(std::string_view name);
    ~ModuleDef();

    ModuleDef(ModuleDef &&other) noexcept;
    ModuleDef &operator=(ModuleDef &&other) noexcept;
    ModuleDef(const ModuleDef &) = delete;
    ModuleDef &operator=(const ModuleDef &) = delete;

    /** @brief This module starts after, and shuts down before, @p dependency_name. */
    void add_dependency(std::string_view dependency_name);

    void set_startup(LifecycleCallback startup_func);
    void set_startup(LifecycleCallback startup_func, std::string_view arg);

    /**
     * @brief Sets the shutdown callback. A callback still running after @p timeout is
     *        abandoned (its thread is detached) and reported.
     */
    void set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout);

  private:
    friend class LifecycleManager;
    std::unique_ptr<ModuleDefImpl> pImpl;
};

} // namespace poolhub::utils

#pragma once

/*******************************************************************************
 * @file lifecycle.hpp
 * @brief Manages application startup and shutdown with dependency-aware modules.
 *
 * Modules declare their dependencies by name and the `LifecycleManager` performs a
 * topological sort to determine the startup sequence. Shutdown runs in reverse order,
 * with a per-module timeout so a hanging module cannot block termination.
 *
 * **Usage**
 *
 * ```cpp
 * int main(int argc, char* argv[]) {
 *     mydiarelay::utils::LifecycleGuard app_lifecycle(mydiarelay::utils::MakeModDefList(
 *         mydiarelay::utils::Logger::GetLifecycleModule(),
 *         mydiarelay::crypto::GetLifecycleModule(),
 *         mydiarelay::RelayConfig::GetLifecycleModule()));
 *
 *     LOGGER_INFO("Relay started.");
 *     // ...
 *     return 0;
 * }
 * ```
 ******************************************************************************/
#include "mdr_base.hpp"
#include "mydiarelay_utils_export.h"

#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace mydiarelay::utils
{

class LifecycleManagerImpl;

/// @brief Constructs a vector<ModuleDef> by moving the supplied ModuleDef args.
template <typename... Mods> inline std::vector<ModuleDef> MakeModDefList(Mods &&...mods)
{
    static_assert((std::is_same_v<std::decay_t<Mods>, ModuleDef> && ...),
                  "MakeModDefList: all arguments must be ModuleDef (rvalues or prvalues)");

    std::vector<ModuleDef> modules;
    modules.reserve(sizeof...(mods));
    (modules.emplace_back(std::forward<Mods>(mods)), ...);
    return modules;
}

/**
 * @class LifecycleManager
 * @brief The singleton manager for the application lifecycle.
 */
class MYDIARELAY_UTILS_EXPORT LifecycleManager
{
  public:
    static LifecycleManager &instance();

    /**
     * @brief Registers a module. Must happen before `initialize()`.
     * @throws std::logic_error if called after initialization has begun.
     */
    void register_module(ModuleDef &&module_def);

    /**
     * @brief Starts all registered modules in dependency order. Idempotent.
     * @throws std::runtime_error on a duplicate name, an undefined dependency, a dependency
     *         cycle, or a module whose startup callback threw. Modules already started are
     *         shut down again before the exception propagates.
     */
    void initialize(std::source_location loc);

    /// @brief Shuts down started modules in reverse startup order. Idempotent.
    void finalize(std::source_location loc);

    [[nodiscard]] bool is_initialized();
    [[nodiscard]] bool is_finalized();

    /// @brief True if the named module has completed its startup callback.
    [[nodiscard]] bool is_module_started(std::string_view name);

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
 * @class LifecycleGuard
 * @brief RAII owner of application initialization.
 *
 * The first guard constructed in a process registers its modules and initializes the
 * application; its destructor finalizes. Later guards are no-ops and ignore their modules.
 */
class LifecycleGuard
{
  private:
    std::source_location m_loc;
    bool m_is_owner = false;

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
            MDR_DEBUG("[MDR_LifeCycle] LifecycleGuard is being destructed as owner. "
                      "Constructor was located in function {}. ({}:{}) ",
                      m_loc.function_name(),
                      mydiarelay::format_tools::filename_only(m_loc.file_name()), m_loc.line());
            mydiarelay::utils::FinalizeApp(m_loc);
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
                mydiarelay::utils::RegisterModule(std::move(m));
            }
            mydiarelay::utils::InitializeApp(m_loc);
        }
        else
        {
            MDR_DEBUG("[MDR_LifeCycle] [{}:{}] WARNING: LifecycleGuard constructed but an "
                      "owner already exists; provided modules were ignored. ({}:{})",
                      mydiarelay::platform::get_executable_name(),
                      mydiarelay::platform::get_pid(),
                      mydiarelay::format_tools::filename_only(m_loc.file_name()), m_loc.line());
        }
    }
};

} // namespace mydiarelay::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
